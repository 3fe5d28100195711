#ifndef CLEARCUBE_GEORASTER_H
#define CLEARCUBE_GEORASTER_H

#include <string>
#include <vector>

#include <boost/function.hpp>

#include <clearcube/GeoData.h>
#include <clearcube/GeoArray.h>
#include <clearcube/GeoMask.h>

namespace clearcube {

	//! A single band of a RasterCube
	/*!
		A GeoRaster holds the raw (sensor) values of a band over time along
		with its declared no-data sentinel, its gain and offset, and a list of
		masks (1 for valid). Process() returns the analysis ready band: masked
		first, then rescaled, with NaN wherever the pixel is invalid.
	*/
	class GeoRaster : public GeoData {
	public:
		//! Function producing raw values of a chunk (x, y, time) at full precision
		typedef boost::function<CImg<double> (const bbox&)> NativeReader;

		//! \name Constructors/Destructor
		//! Default constructor
		GeoRaster() : _NoData(false), _NoDataValue(0), _Gain(1.0), _Offset(0.0) {}
		//! Band from raw values
		GeoRaster(const GeoArray& raw, std::string name);
		~GeoRaster() {}

		//! \name Band Information
		//! Band name (lower case)
		std::string Description() const { return _Description; }
		//! Number of time steps
		unsigned int NumTimes() const { return _Raw.NumTimes(); }
		//! Time axis
		const TimeAxis& Times() const { return _Raw.Times(); }
		//! Raw values, no masks or scaling
		const GeoArray& Raw() const { return _Raw; }
		//! Output band info
		std::string Info() const;

		//! \name Metadata functions
		//! Get gain
		double Gain() const { return _Gain; }
		//! Get offset
		double Offset() const { return _Offset; }
		//! Set gain
		GeoRaster& SetGain(double gain) { _Gain = gain; return *this; }
		//! Set offset
		GeoRaster& SetOffset(double offset) { _Offset = offset; return *this; }
		//! Flag indicating if NoData value is used or not
		bool NoData() const { return _NoData; }
		//! Get NoDataValue (may be NaN)
		double NoDataValue() const { return _NoDataValue; }
		//! Set No Data value
		GeoRaster& SetNoData(double val) { _NoDataValue = val; _NoData = true; return *this; }
		//! Read raw values at full precision (for sources not exactly held in float)
		GeoRaster& SetNativeReader(NativeReader reader) { _Native = reader; return *this; }
		//! Is a full precision reader set
		bool HasNativeReader() const { return !_Native.empty(); }

		//! \name Processing functions
		//! Adds a mask (1 for valid), applied by Process()
		GeoRaster& AddMask(const GeoMask& mask);
		//! Remove all masks from band
		GeoRaster& ClearMasks() { _Masks.clear(); return *this; }
		//! Masks applied by Process()
		const std::vector<GeoMask>& Masks() const { return _Masks; }
		//! True where the pixel holds a real observation (not the no-data sentinel)
		GeoMask ValidityMask() const;
		//! Masked then rescaled values, NaN where invalid or masked out
		GeoArray Process() const;
		//! Restrict band (and its masks) to time steps
		GeoRaster SelectTimes(const std::vector<unsigned int>& indices) const;

	protected:
		//! Raw values
		GeoArray _Raw;
		//! Band name
		std::string _Description;
		//! Bool if nodata value is used
		bool _NoData;
		double _NoDataValue;
		double _Gain;
		double _Offset;
		//! Vector of masks to apply
		std::vector<GeoMask> _Masks;
		//! Full precision raw values, used for the sentinel test when set
		NativeReader _Native;
	};

	//! True where value is not the sentinel; NaN sentinels compare with isnan
	GeoMask ValidityMask(const GeoArray& array, double nodata);

} // namespace clearcube

#endif
