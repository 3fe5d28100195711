#ifndef CLEARCUBE_GEOMASK_H
#define CLEARCUBE_GEOMASK_H

#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>

#include <clearcube/cc_CImg.h>
#include <clearcube/GeoData.h>

namespace clearcube {

	//! Lazily evaluated boolean mask
	/*!
		A GeoMask is either temporal, over {time, y, x}, or spatial, over
		{y, x} only, in which case it broadcasts across time when combined
		with a temporal mask or array. Nothing is computed until Read() is
		called on a chunk; combining masks composes their readers.
		Values read are 1 (true) or 0 (false).
	*/
	class GeoMask : public GeoData {
	public:
		//! Function producing the mask for a chunk (x, y, time)
		typedef boost::function<CImg<unsigned char> (const bbox&)> Reader;

		//! \name Constructors
		//! Default constructor (empty, spatial)
		GeoMask() : _Spatial(true) {}
		//! Temporal mask evaluated by reader
		GeoMask(const GeoData& grid, const TimeAxis& times, Reader reader, std::string desc="");
		//! Spatial mask evaluated by reader
		GeoMask(const GeoData& grid, Reader reader, std::string desc="");
		//! Temporal mask from in-memory data (depth must equal number of times)
		GeoMask(const GeoData& grid, const TimeAxis& times, const CImg<unsigned char>& data, std::string desc="");
		//! Spatial mask from in-memory data (depth 1)
		GeoMask(const GeoData& grid, const CImg<unsigned char>& data, std::string desc="");

		//! \name Information
		//! True if mask has no time axis
		bool Spatial() const { return _Spatial; }
		//! Number of time steps (0 for spatial masks)
		unsigned int NumTimes() const { return _Times.size(); }
		//! Number of layers returned by Read (1 for spatial masks)
		unsigned int Depth() const { return _Spatial ? 1 : _Times.size(); }
		//! Time axis (empty for spatial masks)
		const TimeAxis& Times() const { return _Times; }
		//! Description
		std::string Description() const { return _Description; }
		//! Set description
		GeoMask& SetDescription(std::string desc) { _Description = desc; return *this; }

		//! \name Evaluation
		//! Evaluate mask over a chunk
		CImg<unsigned char> Read(const bbox& chunk) const;
		//! Evaluate mask over full extent
		CImg<unsigned char> Read() const { return Read(Extent()); }
		//! Chunks sized for this mask
		std::vector<bbox> Chunk() const { return GeoData::Chunk(sizeof(unsigned char), Depth()); }

		//! \name Mask algebra (deferred)
		//! Logical and, spatial masks broadcast across time
		GeoMask operator&(const GeoMask& mask) const;
		//! Logical or, spatial masks broadcast across time
		GeoMask operator|(const GeoMask& mask) const;
		//! Logical not
		GeoMask operator~() const;
		//! Restrict to time steps (by index, in given order); spatial masks are returned unchanged
		GeoMask SelectTimes(const std::vector<unsigned int>& indices) const;

		//! Throws ShapeMismatchError unless mask can be combined with an array of this grid and times
		void CheckShape(const GeoData& grid, const TimeAxis& times, std::string what) const;

	private:
		bool _Spatial;
		TimeAxis _Times;
		Reader _Reader;
		std::string _Description;

		//! Combine two masks, op is '&' or '|'
		GeoMask Combine(const GeoMask& mask, char op) const;
	};

	//! Combine two mask chunks, broadcasting a depth 1 operand
	CImg<unsigned char> CombineMasks(const CImg<unsigned char>& a, const CImg<unsigned char>& b, char op);

} // namespace clearcube

#endif
