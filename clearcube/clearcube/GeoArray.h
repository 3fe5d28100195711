#ifndef CLEARCUBE_GEOARRAY_H
#define CLEARCUBE_GEOARRAY_H

#include <string>
#include <vector>

#include <boost/function.hpp>

#include <clearcube/cc_CImg.h>
#include <clearcube/GeoData.h>
#include <clearcube/GeoMask.h>

namespace clearcube {

	//! Lazily evaluated float array over {time, y, x}
	/*!
		Read(chunk) returns a CImg of chunk width x chunk height x NumTimes().
		NaN marks missing values. Deriving a new array from an existing one
		composes readers and never copies or modifies data, so arrays can be
		freely shared.
	*/
	class GeoArray : public GeoData {
	public:
		//! Function producing values of a chunk (x, y, time)
		typedef boost::function<CImg<float> (const bbox&)> Reader;

		//! \name Constructors
		//! Default constructor (empty)
		GeoArray() {}
		//! Array evaluated by reader
		GeoArray(const GeoData& grid, const TimeAxis& times, Reader reader, std::string desc="");
		//! Array wrapping in-memory data (x, y, time); data is shared, not copied on derivation
		GeoArray(const GeoData& grid, const TimeAxis& times, const CImg<float>& data, std::string desc="");

		//! \name Information
		//! Number of time steps
		unsigned int NumTimes() const { return _Times.size(); }
		//! Time axis
		const TimeAxis& Times() const { return _Times; }
		//! Description
		std::string Description() const { return _Description; }
		//! Set description
		GeoArray& SetDescription(std::string desc) { _Description = desc; return *this; }

		//! \name Evaluation
		//! Evaluate over a chunk
		CImg<float> Read(const bbox& chunk) const;
		//! Evaluate over full extent
		CImg<float> Read() const { return Read(Extent()); }
		//! Chunks sized for this array
		std::vector<bbox> Chunk() const { return GeoData::Chunk(sizeof(float), NumTimes()); }

		//! \name Derived arrays and masks (deferred)
		//! Restrict to time steps (by index, in given order)
		GeoArray SelectTimes(const std::vector<unsigned int>& indices) const;
		//! Set values to NaN where mask is false
		GeoArray Where(const GeoMask& mask) const;
		//! Mask of values greater than val (NaN is false)
		GeoMask operator>(double val) const { return Threshold(">", val); }
		//! Mask of values greater than or equal to val (NaN is false)
		GeoMask operator>=(double val) const { return Threshold(">=", val); }
		//! Mask of values less than val (NaN is false)
		GeoMask operator<(double val) const { return Threshold("<", val); }
		//! Mask of values less than or equal to val (NaN is false)
		GeoMask operator<=(double val) const { return Threshold("<=", val); }

	private:
		TimeAxis _Times;
		Reader _Reader;
		std::string _Description;

		GeoMask Threshold(std::string op, double val) const;
	};

} // namespace clearcube

#endif
