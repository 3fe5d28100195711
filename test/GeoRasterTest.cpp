#include <gtest/gtest.h>

#include <clearcube/GeoRaster.h>
#include <clearcube/Exceptions.h>

#include <boost/bind/bind.hpp>

#include <cmath>
#include <limits>

#include "TestData.h"

using namespace clearcube;
using clearcube::test::Grid;
using clearcube::test::Days;

using namespace boost::placeholders;

namespace {
	const float nan = std::numeric_limits<float>::quiet_NaN();

	//! Crop of in-memory data, counting the reads
	template<typename T> CImg<T> CountedRead(const CImg<T>* data, int* reads, const bbox& chunk) {
		(*reads)++;
		return data->get_crop(chunk.min_corner().x(), chunk.min_corner().y(), 0,
		                      chunk.max_corner().x(), chunk.max_corner().y(), data->depth()-1);
	}
}

TEST(GeoRasterTest, ValidityFalseOnlyAtSentinel) {
	CImg<float> data(4, 1, 1, 1, 0.0f);
	data(0,0) = -9999.0f;
	data(1,0) = -9998.999f;
	data(2,0) = -10000.0f;
	data(3,0) = 0.0f;
	GeoRaster band(GeoArray(Grid(4,1), Days(1), data, "blue"), "Blue");
	band.SetNoData(-9999);
	CImg<unsigned char> valid = band.ValidityMask().Read();
	EXPECT_EQ(0, valid(0,0));
	EXPECT_EQ(1, valid(1,0));
	EXPECT_EQ(1, valid(2,0));
	EXPECT_EQ(1, valid(3,0));
	EXPECT_EQ("blue", band.Description());
}

TEST(GeoRasterTest, NaNSentinelUsesNaNAwareEquality) {
	CImg<float> data(3, 1, 1, 1, 5.0f);
	data(1,0) = nan;
	GeoArray raw(Grid(3,1), Days(1), data, "red");
	CImg<unsigned char> valid = ValidityMask(raw, std::numeric_limits<double>::quiet_NaN()).Read();
	EXPECT_EQ(1, valid(0,0));
	EXPECT_EQ(0, valid(1,0));
	EXPECT_EQ(1, valid(2,0));
	// a finite sentinel does not treat NaN as missing
	CImg<unsigned char> finite = ValidityMask(raw, 0).Read();
	EXPECT_EQ(1, finite(1,0));
}

TEST(GeoRasterTest, ScaleAppliedAfterMasking) {
	CImg<float> data(2, 1, 1, 1, 10000.0f);
	GeoRaster band(GeoArray(Grid(2,1), Days(1), data, "nir"), "nir");
	band.SetGain(0.0001).SetOffset(0);
	CImg<unsigned char> keep(2, 1, 1, 1, 0);
	keep(0,0) = 1;
	band.AddMask(GeoMask(Grid(2,1), Days(1), keep, "quality"));
	CImg<float> out = band.Process().Read();
	EXPECT_NEAR(1.0, out(0,0), 1e-6);
	EXPECT_TRUE(std::isnan(out(1,0)));
}

TEST(GeoRasterTest, SentinelNeverScaledIntoData) {
	CImg<float> data(2, 1, 1, 1, 0.0f);
	data(1,0) = 500.0f;
	GeoRaster band(GeoArray(Grid(2,1), Days(1), data, "green"), "green");
	band.SetNoData(0).SetGain(2).SetOffset(1);
	CImg<float> out = band.Process().Read();
	EXPECT_TRUE(std::isnan(out(0,0)));
	EXPECT_FLOAT_EQ(1001.0f, out(1,0));
}

TEST(GeoRasterTest, ValidityOfCleanedOutputRoundTrip) {
	CImg<float> data(3, 3, 2, 1, 100.0f);
	data(0,0,0) = -1;
	data(2,1,1) = -1;
	GeoRaster band(GeoArray(Grid(3,3), Days(2), data, "swir1"), "swir1");
	band.SetNoData(-1).SetGain(0.01);
	CImg<unsigned char> quality(3, 3, 2, 1, 1);
	quality(1,2,0) = 0;
	band.AddMask(GeoMask(Grid(3,3), Days(2), quality, "quality"));

	CImg<unsigned char> before = (band.ValidityMask() & band.Masks()[0]).Read();
	GeoArray clean = band.Process();
	CImg<unsigned char> after = ValidityMask(clean, std::numeric_limits<double>::quiet_NaN()).Read();
	cimg_forXYZ(after,x,y,z) EXPECT_EQ(before(x,y,z), after(x,y,z));
	EXPECT_EQ(0, after(0,0,0));
	EXPECT_EQ(0, after(2,1,1));
	EXPECT_EQ(0, after(1,2,0));
	EXPECT_EQ(1, after(1,2,1));
}

TEST(GeoRasterTest, MaskMustMatchBand) {
	GeoRaster band(GeoArray(Grid(2,2), Days(2), CImg<float>(2, 2, 2, 1, 1.0f), "red"), "red");
	GeoMask other(Grid(2,2), Days(3), CImg<unsigned char>(2, 2, 3, 1, 1), "other");
	EXPECT_THROW(band.AddMask(other), ShapeMismatchError);
	EXPECT_TRUE(band.Masks().empty());
}

TEST(GeoRasterTest, SelectTimesAppliesToMasks) {
	CImg<float> data(1, 1, 3, 1, 0.0f);
	data(0,0,0) = 1; data(0,0,1) = 2; data(0,0,2) = 3;
	CImg<unsigned char> keep(1, 1, 3, 1, 1);
	keep(0,0,1) = 0;
	GeoRaster band(GeoArray(Grid(1,1), Days(3), data, "red"), "red");
	band.AddMask(GeoMask(Grid(1,1), Days(3), keep, "keep"));
	std::vector<unsigned int> indices;
	indices.push_back(1);
	indices.push_back(2);
	CImg<float> out = band.SelectTimes(indices).Process().Read();
	EXPECT_EQ(2, out.depth());
	EXPECT_TRUE(std::isnan(out(0,0,0)));
	EXPECT_FLOAT_EQ(3.0f, out(0,0,1));
}

TEST(GeoRasterTest, NativeReaderKeepsValuesNextToSentinel) {
	// 32 bit integers near the top of their range collapse onto one float
	CImg<double> native(3, 1, 2, 1, 2147483647.0);
	native(1,0,0) = 2147483600.0;
	native(2,0,0) = 5.0;
	native(1,0,1) = 7.0;
	CImg<float> held(native);
	int rawreads(0), nativereads(0);
	GeoArray raw(Grid(3,1), Days(2), boost::bind(&CountedRead<float>, &held, &rawreads, _1), "b1");
	GeoRaster band(raw, "b1");
	band.SetNoData(2147483647.0);
	EXPECT_EQ(0, band.ValidityMask().Read()(1,0,0));
	band.SetNativeReader(boost::bind(&CountedRead<double>, &native, &nativereads, _1));
	EXPECT_TRUE(band.HasNativeReader());

	CImg<unsigned char> valid = band.ValidityMask().Read();
	EXPECT_EQ(0, valid(0,0,0));
	EXPECT_EQ(1, valid(1,0,0));
	EXPECT_EQ(1, valid(2,0,0));
	EXPECT_EQ(1, valid(1,0,1));
	EXPECT_EQ(0, valid(2,0,1));

	rawreads = 0;
	nativereads = 0;
	CImg<float> out = band.Process().Read();
	EXPECT_EQ(0, rawreads);
	EXPECT_EQ(1, nativereads);
	EXPECT_TRUE(std::isnan(out(0,0,0)));
	EXPECT_FLOAT_EQ(2147483600.0f, out(1,0,0));
	EXPECT_FLOAT_EQ(5.0f, out(2,0,0));

	std::vector<unsigned int> last(1, 1);
	CImg<unsigned char> selected = band.SelectTimes(last).ValidityMask().Read();
	EXPECT_EQ(1, selected.depth());
	EXPECT_EQ(1, selected(1,0,0));
	EXPECT_EQ(0, selected(2,0,0));
}

TEST(GeoRasterTest, ProcessReadsRawValuesOnce) {
	CImg<float> data(2, 2, 2, 1, 3.0f);
	data(0,0,1) = -1;
	int reads(0);
	GeoRaster band(GeoArray(Grid(2,2), Days(2), boost::bind(&CountedRead<float>, &data, &reads, _1), "red"), "red");
	band.SetNoData(-1);
	CImg<float> out = band.Process().Read();
	EXPECT_EQ(1, reads);
	EXPECT_TRUE(std::isnan(out(0,0,1)));
	EXPECT_FLOAT_EQ(3.0f, out(1,1,1));
}

TEST(GeoRasterTest, SentinelOutsideFloatRange) {
	CImg<float> data(2, 1, 1, 1, 1.0f);
	data(0,0) = -std::numeric_limits<float>::max();
	GeoRaster band(GeoArray(Grid(2,1), Days(1), data, "nir"), "nir");
	band.SetNoData(-std::numeric_limits<double>::max());
	CImg<unsigned char> valid = band.ValidityMask().Read();
	EXPECT_EQ(1, valid(0,0));
	EXPECT_EQ(1, valid(1,0));
	GeoRaster doubles(GeoArray(Grid(1,1), Days(1), CImg<float>(1, 1, 1, 1, 0.0f), "swir1"), "swir1");
	CImg<double> values(1, 1, 1, 1, -std::numeric_limits<double>::max());
	int reads(0);
	doubles.SetNativeReader(boost::bind(&CountedRead<double>, &values, &reads, _1));
	doubles.SetNoData(-std::numeric_limits<double>::max());
	EXPECT_EQ(0, doubles.ValidityMask().Read()(0,0));
}
