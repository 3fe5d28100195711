/*
 * Options.cpp
 *
 * Command line and configuration file handling for the clearcube utilities
 */

#include <vector>
#include <fstream>
#include <cstdlib>
#include <stdexcept>

#include <gdal/cpl_conv.h>

#include <boost/algorithm/string.hpp>

#include <clearcube/Options.h>
#include <clearcube/Utils.h>

namespace clearcube {
    using std::string;
    using std::vector;
    using std::map;
    using boost::program_options::value;
    using boost::program_options::options_description;
    using boost::program_options::positional_options_description;

	string Options::_DefaultFormat("GTiff");
	float Options::_ChunkSize(32.0);
	int Options::_Verbose(1);

    namespace {
        //! Parse "name=value,name=value" into a map (names lower-cased)
        map<string,double> ParseBandValues(const string& str) {
            map<string,double> vals;
            vector<string> items = Split(str, " ,");
            for (vector<string>::const_iterator it=items.begin(); it!=items.end(); it++) {
                string::size_type loc = it->find('=');
                if (loc == string::npos || loc == 0)
                    throw std::invalid_argument("expected name=value, got '" + *it + "'");
                string name = boost::algorithm::to_lower_copy(it->substr(0,loc));
                vals[name] = atof(it->substr(loc+1).c_str());
            }
            return vals;
        }
    }

    Options::Options()
        : _Exit(false), _QualityBand("scl"), _Scheme("scl"), _TimeKey("ACQUISITION_DATETIME"),
          _Scale(1.0), _Offset(0.0), _NoData(false), _NoDataValue(0),
          _Threshold(0.0), _Window(3), _MinPeriods(1), _Prefix("") {}

    Options::Options(int ac, char** av, options_description localopts)
        : _Exit(false), _QualityBand("scl"), _Scheme("scl"), _TimeKey("ACQUISITION_DATETIME"),
          _Scale(1.0), _Offset(0.0), _NoData(false), _NoDataValue(0),
          _Threshold(0.0), _Window(3), _MinPeriods(1), _Prefix("") {

        options_description opts;
        opts.add(SetupInput());
        opts.add(SetupProcessing());
        opts.add(SetupOutput());
        opts.add(localopts);

        positional_options_description opts_pos;
        opts_pos.add("input",-1);

        //Parse command line
        options_description opts_cmdline("Command Line Options");
        opts_cmdline.add_options()
            ("config,c", value<string>(), "Configuration file (command line takes precedence)")
            ("verbose,v", value<int>()->implicit_value(1), "Print additional information")
            ("help,h", "Print help message");
        opts.add(opts_cmdline);
        boost::program_options::store(
            boost::program_options::command_line_parser(ac,av).options(opts).positional(opts_pos).run(), varmap);

        // Config file values only fill what the command line did not set
        if (varmap.count("config")) {
            string filename = varmap["config"].as<string>();
            std::ifstream in(filename.c_str());
            if (!in.is_open()) throw std::runtime_error("unable to open configuration file " + filename);
            if (Verbose() > 1) std::cout << "Reading configuration file " << filename << std::endl;
            boost::program_options::store(boost::program_options::parse_config_file(in,opts), varmap);
        }
        notify(varmap);
        Parse(opts);
    }

	options_description Options::SetupInput() {
		options_description opts_input("Input Options");
		opts_input.add_options()
			("input,i", value<vector<string> >()->multitoken(), "Input filename(s), one per time step")
			("quality", value<string>()->default_value("scl"), "Name of the categorical quality band")
			("scheme", value<string>()->default_value("scl"), "Quality scheme (scl, fmask)")
			("categories", value<string>(), "Acceptable quality categories (comma separated labels)")
			("timekey", value<string>()->default_value("ACQUISITION_DATETIME"), "Metadata item holding acquisition time")
			("scale", value<double>()->default_value(1.0), "Scale (gain) applied to all bands")
			("offset", value<double>()->default_value(0.0), "Offset applied to all bands")
			("bandscale", value<string>(), "Per band scale overrides (name=value,...)")
			("bandoffset", value<string>(), "Per band offset overrides (name=value,...)")
			("nodata", value<double>(), "No Data value (overrides file value)")
			("chunksz", value<float>()->default_value(32.0), "Size of chunks (in MB)")
			("gdaldebug", value<bool>()->default_value(false)->implicit_value(true), "GDAL Debug (CPL_DEBUG)")
			;
        return opts_input;
	}

	options_description Options::SetupProcessing() {
		options_description opts_proc("Processing Options");
		opts_proc.add_options()
			("threshold", value<double>()->default_value(0.0), "Minimum fraction of good pixels to keep a time step")
			("window", value<int>()->default_value(3), "Rolling median window (odd)")
			("minperiods", value<int>()->default_value(1), "Minimum observations in a rolling window")
			("vector", value<string>(), "Vector file with boundary polygons (already in raster CRS)")
			("where", value<string>(), "Attribute filter selecting boundary polygons")
			;
        return opts_proc;
	}

	options_description Options::SetupOutput() {
		options_description opts_output("Output Options");
		opts_output.add_options()
			("prefix,p", value<string>()->default_value(""), "Prefix/Path to prepend to output files")
			("format,f", value<string>()->default_value("GTiff"), "File format of outputs");
        return opts_output;
	}

	void Options::Parse(options_description opts) {
		_Exit = false;
		if (varmap.count("help")) { std::cout << opts << std::endl; _Exit = true; }

		// Static options
		if (varmap.count("chunksz")) Options::SetChunkSize(varmap["chunksz"].as<float>());
		if (varmap.count("verbose")) Options::SetVerbose(varmap["verbose"].as<int>());
		if (varmap.count("format")) Options::SetDefaultFormat(varmap["format"].as<string>());
		if (ChunkSize() <= 0) throw std::invalid_argument("chunksz must be positive");

		// GDAL Config Options
		bool gdaldebug = varmap.count("gdaldebug") ? varmap["gdaldebug"].as<bool>() : false;
		CPLSetConfigOption("CPL_DEBUG", gdaldebug ? "ON" : "OFF");

		if (varmap.count("input")) _Inputs = varmap["input"].as<vector<string> >();
        if (_Inputs.empty() && !_Exit) { std::cout << opts << std::endl; _Exit = true; }

		if (varmap.count("quality")) _QualityBand = boost::algorithm::to_lower_copy(varmap["quality"].as<string>());
		if (varmap.count("scheme")) _Scheme = boost::algorithm::to_lower_copy(varmap["scheme"].as<string>());
		if (varmap.count("categories")) _Categories = Split(varmap["categories"].as<string>(), ",");
		if (varmap.count("timekey")) _TimeKey = varmap["timekey"].as<string>();

		if (varmap.count("scale")) _Scale = varmap["scale"].as<double>();
		if (varmap.count("offset")) _Offset = varmap["offset"].as<double>();
		if (varmap.count("bandscale")) _BandScale = ParseBandValues(varmap["bandscale"].as<string>());
		if (varmap.count("bandoffset")) _BandOffset = ParseBandValues(varmap["bandoffset"].as<string>());
		_NoData = varmap.count("nodata") ? true : false;
		if (_NoData) _NoDataValue = varmap["nodata"].as<double>();

		if (varmap.count("threshold")) _Threshold = varmap["threshold"].as<double>();
		if (varmap.count("window")) _Window = varmap["window"].as<int>();
		if (varmap.count("minperiods")) _MinPeriods = varmap["minperiods"].as<int>();
		if (varmap.count("vector")) _VectorFile = varmap["vector"].as<string>();
		if (varmap.count("where")) _Where = varmap["where"].as<string>();

		_Prefix = varmap.count("prefix") ? varmap["prefix"].as<string>() : "";
	}

	double Options::Scale(const string& band) const {
        map<string,double>::const_iterator it = _BandScale.find(boost::algorithm::to_lower_copy(band));
        return (it == _BandScale.end()) ? _Scale : it->second;
	}

	double Options::Offset(const string& band) const {
        map<string,double>::const_iterator it = _BandOffset.find(boost::algorithm::to_lower_copy(band));
        return (it == _BandOffset.end()) ? _Offset : it->second;
	}

	std::ostream& operator<<(std::ostream& out, const Options& opts) {
		using std::endl;
		out << "clearcube Options" << endl;

		unsigned int i;
		out << "Input Files:" << endl;
		for (i=0;i<opts._Inputs.size();i++) out << "\t" << opts._Inputs[i] << endl;
		out << "Quality band: " << opts._QualityBand << " (" << opts._Scheme << ")" << endl;
		out << "Categories:";
		for (i=0;i<opts._Categories.size();i++) out << " '" << opts._Categories[i] << "'";
		out << endl;
		out << "Scale: " << opts._Scale << ", Offset: " << opts._Offset << endl;
		for (map<string,double>::const_iterator it=opts._BandScale.begin(); it!=opts._BandScale.end(); it++)
			out << "\tScale " << it->first << " = " << it->second << endl;
		for (map<string,double>::const_iterator it=opts._BandOffset.begin(); it!=opts._BandOffset.end(); it++)
			out << "\tOffset " << it->first << " = " << it->second << endl;
		out << "NoData: " << opts._NoData << " " << opts._NoDataValue << endl;
		out << "Threshold: " << opts._Threshold << endl;
		out << "Rolling window: " << opts._Window << " (min periods " << opts._MinPeriods << ")" << endl;
		if (!opts._VectorFile.empty()) out << "Vector: " << opts._VectorFile << " " << opts._Where << endl;
		out << "Prefix: " << opts._Prefix << endl;
		return out;
	}
}
