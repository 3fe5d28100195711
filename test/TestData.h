#ifndef CLEARCUBE_TESTDATA_H
#define CLEARCUBE_TESTDATA_H

#include <vector>

#include <clearcube/GeoData.h>
#include <clearcube/GeoArray.h>
#include <clearcube/GeoMask.h>

namespace clearcube {
namespace test {

	//! Grid of unit pixels with its top left corner at (0, ysz)
	inline GeoData Grid(unsigned int xsz, unsigned int ysz) {
		double affine[6] = {0, 1, 0, (double)ysz, 0, -1};
		return GeoData(xsz, ysz, affine);
	}

	//! Daily time steps starting 2021-06-01
	inline TimeAxis Days(unsigned int n) {
		TimeAxis times;
		boost::posix_time::ptime start(boost::gregorian::date(2021, 6, 1));
		for (unsigned int i=0; i<n; i++) times.push_back(start + boost::posix_time::hours(24*i));
		return times;
	}

	//! Array filled with one value
	inline GeoArray Constant(const GeoData& grid, const TimeAxis& times, float value, std::string desc="constant") {
		return GeoArray(grid, times, CImg<float>(grid.XSize(), grid.YSize(), times.size(), 1, value), desc);
	}

	//! Temporal mask from data
	inline GeoMask Mask(const GeoData& grid, const TimeAxis& times, const CImg<unsigned char>& data) {
		return GeoMask(grid, times, data, "test mask");
	}

} // namespace test
} // namespace clearcube

#endif
