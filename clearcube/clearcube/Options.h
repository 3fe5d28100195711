#ifndef CLEARCUBE_OPTIONS_H
#define CLEARCUBE_OPTIONS_H

#include <string>
#include <vector>
#include <map>
#include <iostream>

#include <boost/program_options.hpp>

namespace clearcube {

    //! Command line / configuration file options shared by the clearcube utilities
	class Options {
	public:
		//! Default constructor sets up default options
		Options();
		//! Constructor to parse command line (and optional config file) and add local options
		Options(int ac, char** av, boost::program_options::options_description localopts);

		// Inputs
		std::string InputFile(const int i=0) const { return _Inputs[i]; }
		std::vector<std::string> InputFiles() const { return _Inputs; }
		//! Name of the categorical quality band
		std::string QualityBand() const { return _QualityBand; }
		//! Name of the quality scheme (scl or fmask)
		std::string Scheme() const { return _Scheme; }
		//! Acceptable quality categories
		std::vector<std::string> Categories() const { return _Categories; }
		//! Metadata key holding the acquisition timestamp
		std::string TimeKey() const { return _TimeKey; }
		//! Scale for a band (override, else default)
		double Scale(const std::string& band) const;
		//! Offset for a band (override, else default)
		double Offset(const std::string& band) const;
		//! Has a nodata override been given
		bool NoData() const { return _NoData; }
		double NoDataValue() const { return _NoDataValue; }

		// Processing
		double Threshold() const { return _Threshold; }
		int Window() const { return _Window; }
		int MinPeriods() const { return _MinPeriods; }
		std::string VectorFile() const { return _VectorFile; }
		std::string Where() const { return _Where; }

		// Outputs
		std::string Prefix() const { return _Prefix; }

		// \name Global Options (static properties)
		//! Default format when creating new files
		static std::string DefaultFormat() { return _DefaultFormat; }
		//! Set default format when creating new files
		static void SetDefaultFormat(std::string str) { _DefaultFormat = str; }
		//! Chunk size (MB) used when chunking a cube
		static float ChunkSize() { return _ChunkSize; }
		//! Set chunk size, used when chunking a cube
		static void SetChunkSize(float sz) { _ChunkSize = sz; }
		//! Get verbose level
		static int Verbose() { return _Verbose; }
		//! Set verbose level
		static void SetVerbose(int v) { _Verbose = v; }

		bool Exit() const { return _Exit; }

		friend std::ostream& operator<<(std::ostream&, const Options&);

		//! Variable map of options
		boost::program_options::variables_map varmap;
	private:
		// Static options
		//! Default format
		static std::string _DefaultFormat;
		//! Chunk size used when chunking up a cube
		static float _ChunkSize;
		//! Verbosity level
		static int _Verbose;

		//! Exit flag (to indicate program should exit after parsing cmdline)
		bool _Exit;

		//! Setup input options
		static boost::program_options::options_description SetupInput();
		//! Setup processing options
		static boost::program_options::options_description SetupProcessing();
		//! Setup output options
		static boost::program_options::options_description SetupOutput();

		//! Parse the variable map (varmap)
		void Parse(boost::program_options::options_description);

		// Input Options
		std::vector<std::string> _Inputs;
		std::string _QualityBand;
		std::string _Scheme;
		std::vector<std::string> _Categories;
		std::string _TimeKey;
		double _Scale;
		double _Offset;
		std::map<std::string,double> _BandScale;
		std::map<std::string,double> _BandOffset;
		bool _NoData;
		double _NoDataValue;

		// Processing Options
		double _Threshold;
		int _Window;
		int _MinPeriods;
		std::string _VectorFile;
		std::string _Where;

		// Output Options
		std::string _Prefix;
	};
}
#endif
