#ifndef CLEARCUBE_RASTERCUBE_H
#define CLEARCUBE_RASTERCUBE_H

#include <string>
#include <vector>

#include <clearcube/GeoData.h>
#include <clearcube/GeoArray.h>
#include <clearcube/GeoRaster.h>

namespace clearcube {
	// Forward declaration
	class TimeSelection;

	//! RasterCube class
	/*!
		A RasterCube is a collection of named GeoRaster bands that share one
		grid and one strictly increasing time axis, plus an optional
		categorical quality band. Bands are looked up by name, ignoring case.
	*/
	class RasterCube : public GeoData {
	public:
		//! \name Constructors/Destructor
		//! Default constructor (empty)
		RasterCube() : _HasQuality(false) {}
		//! Empty cube over grid and times (times must be strictly increasing)
		RasterCube(const GeoData& grid, const TimeAxis& times);
		~RasterCube() { _RasterBands.clear(); }

		//! Open one file per time step, reading lazily through GDAL
		static RasterCube Open(const std::vector<std::string>& filenames, std::string qualityband="scl",
		                       std::string timekey="ACQUISITION_DATETIME");

		//! \name Cube Information
		//! Number of bands (not counting the quality band)
		unsigned int NumBands() const { return _RasterBands.size(); }
		//! Number of time steps
		unsigned int NumTimes() const { return _Times.size(); }
		//! Time axis
		const TimeAxis& Times() const { return _Times; }
		//! Get vector of band names
		std::vector<std::string> BandNames() const;
		//! Is there a band by this name
		bool HasBand(std::string name) const;
		//! Return information on cube as string
		std::string Info() const;

		// \name Band Operations
		//! Get raster band (0-based index)
		GeoRaster& operator[](unsigned int band);
		//! Get raster band, const version
		const GeoRaster& operator[](unsigned int band) const;
		//! Get raster band by name
		GeoRaster& operator[](std::string name) {
			// Call const version
			return const_cast<GeoRaster&>(static_cast<const RasterCube&>(*this)[name]);
		}
		//! Get raster band by name, const version
		const GeoRaster& operator[](std::string name) const;

		//! Adds a band (must match grid and times)
		RasterCube& AddBand(const GeoRaster& band);
		//! Remove band by name
		RasterCube& RemoveBand(std::string name);

		//! Has a quality band been set
		bool HasQuality() const { return _HasQuality; }
		//! Categorical quality codes
		const GeoArray& Quality() const;
		//! Set the quality band (must match grid and times)
		RasterCube& SetQuality(const GeoArray& quality);

		//! Adds a mask (1 for valid) to every band
		RasterCube& AddMask(const GeoMask& mask);
		//! Clear all masks
		RasterCube& ClearMasks() { for (unsigned int i=0;i<_RasterBands.size();i++) _RasterBands[i].ClearMasks(); return *this; }

		//! Restrict every band and the quality band to time steps (by index)
		RasterCube SelectTimes(const std::vector<unsigned int>& indices) const;
		//! Restrict to time steps retained by a time filter
		RasterCube SelectTimes(const TimeSelection& selection) const;

	protected:
		TimeAxis _Times;
		//! Vector of raster bands
		std::vector< GeoRaster > _RasterBands;
		bool _HasQuality;
		GeoArray _Quality;

		//! Throws ShapeMismatchError unless array matches cube
		void CheckShape(const GeoArray& array) const;
	};

	//! Write an image stack (x, y, time) to a new file, one band per time step; returns filename written
	std::string WriteImage(const CImg<float>& image, const GeoData& grid, const TimeAxis& times, std::string filename);
	//! Write an image stack (x, y, band) to a new file with the given band descriptions
	std::string WriteImage(const CImg<float>& image, const GeoData& grid, const std::vector<std::string>& descriptions, std::string filename);

} // namespace clearcube

#endif
