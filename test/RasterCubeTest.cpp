#include <gtest/gtest.h>

#include <clearcube/RasterCube.h>
#include <clearcube/TimeFilter.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Utils.h>

#include <gdal/gdal_priv.h>

#include <boost/filesystem.hpp>

#include <cmath>
#include <limits>

#include "TestData.h"

using namespace clearcube;
using clearcube::test::Grid;
using clearcube::test::Days;
using clearcube::test::Constant;

namespace {
	//! Scratch directory removed at the end of each test
	class RasterCubeFileTest : public ::testing::Test {
	protected:
		virtual void SetUp() {
			_Dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("clearcube-%%%%-%%%%");
			boost::filesystem::create_directories(_Dir);
		}
		virtual void TearDown() {
			boost::filesystem::remove_all(_Dir);
		}
		std::string Path(std::string name) const { return (_Dir / name).string(); }

		//! Scene with a red band (value) and an scl band (code), 3x2 pixels; swapped stores scl first
		std::string Scene(std::string name, std::string key, std::string stamp, short value, short code,
		                  double scale=0.0001, bool swapped=false) {
			std::string filename = Path(name);
			GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
			GDALDataset* ds = driver->Create(filename.c_str(), 3, 2, 2, GDT_Int16, NULL);
			double affine[6] = {100, 10, 0, 200, 0, -10};
			ds->SetGeoTransform(affine);
			if (key != "") ds->SetMetadataItem(key.c_str(), stamp.c_str());
			short red[6] = {value, value, value, value, value, -9999};
			short scl[6] = {code, code, code, code, code, 0};
			GDALRasterBand* band = ds->GetRasterBand(swapped ? 2 : 1);
			band->SetDescription("Red");
			band->SetNoDataValue(-9999);
			band->SetScale(scale);
			band->SetOffset(0);
			EXPECT_EQ(CE_None, band->RasterIO(GF_Write, 0, 0, 3, 2, red, 3, 2, GDT_Int16, 0, 0));
			band = ds->GetRasterBand(swapped ? 1 : 2);
			band->SetDescription("SCL");
			EXPECT_EQ(CE_None, band->RasterIO(GF_Write, 0, 0, 3, 2, scl, 3, 2, GDT_Int16, 0, 0));
			GDALClose(ds);
			return filename;
		}

		//! Single Int32 band scene, 2x1 pixels
		std::string Int32Scene(std::string name, std::string stamp, int a, int b, double nodata) {
			std::string filename = Path(name);
			GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
			GDALDataset* ds = driver->Create(filename.c_str(), 2, 1, 1, GDT_Int32, NULL);
			double affine[6] = {0, 10, 0, 10, 0, -10};
			ds->SetGeoTransform(affine);
			ds->SetMetadataItem("ACQUISITION_DATETIME", stamp.c_str());
			int values[2] = {a, b};
			GDALRasterBand* band = ds->GetRasterBand(1);
			band->SetDescription("count");
			band->SetNoDataValue(nodata);
			EXPECT_EQ(CE_None, band->RasterIO(GF_Write, 0, 0, 2, 1, values, 2, 1, GDT_Int32, 0, 0));
			GDALClose(ds);
			return filename;
		}

		boost::filesystem::path _Dir;
	};
}

TEST(RasterCubeTest, TimesMustIncrease) {
	TimeAxis times = Days(3);
	std::swap(times[0], times[1]);
	EXPECT_THROW(RasterCube(Grid(2,2), times), std::invalid_argument);
	TimeAxis repeated = Days(2);
	repeated.push_back(repeated[1]);
	EXPECT_THROW(RasterCube(Grid(2,2), repeated), std::invalid_argument);
}

TEST(RasterCubeTest, BandsByName) {
	RasterCube cube(Grid(2,2), Days(2));
	cube.AddBand(GeoRaster(Constant(cube, cube.Times(), 1), "Green"));
	cube.AddBand(GeoRaster(Constant(cube, cube.Times(), 2), "nir"));
	EXPECT_EQ(2u, cube.NumBands());
	EXPECT_TRUE(cube.HasBand("GREEN"));
	EXPECT_EQ("green", cube["Green"].Description());
	EXPECT_EQ("nir", cube[1].Description());
	EXPECT_THROW(cube["swir1"], std::out_of_range);
	EXPECT_THROW(cube[2], std::out_of_range);
	EXPECT_THROW(cube.AddBand(GeoRaster(Constant(cube, cube.Times(), 1), "green")), std::invalid_argument);
	cube.RemoveBand("green");
	EXPECT_FALSE(cube.HasBand("green"));
	EXPECT_FALSE(cube.HasQuality());
	EXPECT_THROW(cube.Quality(), std::out_of_range);
}

TEST(RasterCubeTest, BandsShareShape) {
	RasterCube cube(Grid(2,2), Days(2));
	EXPECT_THROW(cube.AddBand(GeoRaster(Constant(Grid(3,2), Days(2), 1), "red")), ShapeMismatchError);
	EXPECT_THROW(cube.AddBand(GeoRaster(Constant(Grid(2,2), Days(3), 1), "red")), ShapeMismatchError);
	EXPECT_THROW(cube.SetQuality(Constant(Grid(2,2), Days(1), 4)), ShapeMismatchError);
	EXPECT_EQ(0u, cube.NumBands());
}

TEST(RasterCubeTest, MasksApplyToEveryBand) {
	RasterCube cube(Grid(2,1), Days(1));
	cube.AddBand(GeoRaster(Constant(cube, cube.Times(), 1), "red"));
	cube.AddBand(GeoRaster(Constant(cube, cube.Times(), 2), "nir"));
	CImg<unsigned char> left(2, 1, 1, 1, 0);
	left(0,0) = 1;
	cube.AddMask(GeoMask(cube, left, "left"));
	EXPECT_EQ(1u, cube["red"].Masks().size());
	EXPECT_TRUE(std::isnan(cube["nir"].Process().Read()(1,0,0)));
	EXPECT_FLOAT_EQ(2.0f, cube["nir"].Process().Read()(0,0,0));
	cube.ClearMasks();
	EXPECT_TRUE(cube["nir"].Masks().empty());
}

TEST(RasterCubeTest, SelectTimesRestrictsEverything) {
	RasterCube cube(Grid(1,1), Days(3));
	CImg<float> values(1, 1, 3, 1, 0.0f);
	values(0,0,0) = 10; values(0,0,1) = 20; values(0,0,2) = 30;
	cube.AddBand(GeoRaster(GeoArray(cube, cube.Times(), values, "red"), "red"));
	cube.SetQuality(GeoArray(cube, cube.Times(), values, "scl"));
	std::vector<double> fractions;
	fractions.push_back(1); fractions.push_back(0); fractions.push_back(1);
	TimeSelection selection(cube.Times(), fractions, 0.5);
	RasterCube selected = cube.SelectTimes(selection);
	ASSERT_EQ(2u, selected.NumTimes());
	EXPECT_EQ(cube.Times()[2], selected.Times()[1]);
	EXPECT_FLOAT_EQ(30.0f, selected["red"].Raw().Read()(0,0,1));
	EXPECT_FLOAT_EQ(30.0f, selected.Quality().Read()(0,0,1));
	// selection from another time axis
	TimeSelection other(Days(2), std::vector<double>(2, 1.0), 0.5);
	EXPECT_THROW(cube.SelectTimes(other), ShapeMismatchError);
}

TEST_F(RasterCubeFileTest, OpenSortsByTimeAndReadsLazily) {
	std::vector<std::string> files;
	files.push_back(Scene("late.tif", "ACQUISITION_DATETIME", "2021-06-05T10:30:00Z", 2000, 9));
	files.push_back(Scene("early.tif", "ACQUISITION_DATETIME", "2021-06-02T10:30:00Z", 1000, 4));
	RasterCube cube = RasterCube::Open(files, "scl", "ACQUISITION_DATETIME");
	ASSERT_EQ(2u, cube.NumTimes());
	EXPECT_EQ(ParseTime("2021-06-02T10:30:00"), cube.Times()[0]);
	EXPECT_EQ(3u, cube.XSize());
	EXPECT_EQ(2u, cube.YSize());
	EXPECT_DOUBLE_EQ(100.0, cube.PixelArea());
	ASSERT_EQ(1u, cube.NumBands());
	ASSERT_TRUE(cube.HasQuality());

	const GeoRaster& red = cube["red"];
	EXPECT_TRUE(red.NoData());
	EXPECT_DOUBLE_EQ(-9999, red.NoDataValue());
	EXPECT_DOUBLE_EQ(0.0001, red.Gain());
	CImg<float> raw = red.Raw().Read();
	EXPECT_FLOAT_EQ(1000.0f, raw(0,0,0));
	EXPECT_FLOAT_EQ(2000.0f, raw(0,0,1));
	CImg<float> processed = red.Process().Read();
	EXPECT_NEAR(0.1, processed(1,0,0), 1e-6);
	EXPECT_TRUE(std::isnan(processed(2,1,1)));
	CImg<float> quality = cube.Quality().Read();
	EXPECT_FLOAT_EQ(4.0f, quality(0,0,0));
	EXPECT_FLOAT_EQ(9.0f, quality(0,0,1));
}

TEST_F(RasterCubeFileTest, OpenFallsBackToTiffDatetime) {
	std::vector<std::string> files;
	files.push_back(Scene("scene.tif", "TIFFTAG_DATETIME", "2021:06:03 09:15:00", 1000, 4));
	RasterCube cube = RasterCube::Open(files);
	EXPECT_EQ(ParseTime("2021-06-03 09:15:00"), cube.Times()[0]);
}

TEST_F(RasterCubeFileTest, OpenRejectsBadInputs) {
	std::vector<std::string> duplicate;
	duplicate.push_back(Scene("a.tif", "ACQUISITION_DATETIME", "2021-06-02", 1000, 4));
	duplicate.push_back(Scene("b.tif", "ACQUISITION_DATETIME", "2021-06-02", 1000, 4));
	EXPECT_THROW(RasterCube::Open(duplicate), std::invalid_argument);

	std::vector<std::string> undated(1, Scene("c.tif", "", "", 1000, 4));
	EXPECT_THROW(RasterCube::Open(undated), std::runtime_error);

	EXPECT_THROW(RasterCube::Open(std::vector<std::string>(1, Path("missing.tif"))), std::runtime_error);
	EXPECT_THROW(RasterCube::Open(std::vector<std::string>()), std::invalid_argument);
}

TEST_F(RasterCubeFileTest, WriteImageOneBandPerTime) {
	double affine[6] = {100, 10, 0, 200, 0, -10};
	GeoData grid(2, 2, affine);
	CImg<float> image(2, 2, 2, 1, 0.5f);
	image(1,1,1) = std::numeric_limits<float>::quiet_NaN();
	std::string filename = WriteImage(image, grid, Days(2), Path("ndci"));
	EXPECT_EQ(Path("ndci.tif"), filename);

	GDALDataset* ds = (GDALDataset*)GDALOpen(filename.c_str(), GA_ReadOnly);
	ASSERT_TRUE(ds != NULL);
	EXPECT_EQ(2, ds->GetRasterCount());
	EXPECT_EQ(GDT_Float32, ds->GetRasterBand(1)->GetRasterDataType());
	EXPECT_EQ(std::string("2021-06-02T00:00:00"), ds->GetRasterBand(2)->GetDescription());
	int hasnodata(0);
	EXPECT_TRUE(std::isnan(ds->GetRasterBand(1)->GetNoDataValue(&hasnodata)));
	EXPECT_TRUE(hasnodata);
	float pix[4];
	EXPECT_EQ(CE_None, ds->GetRasterBand(2)->RasterIO(GF_Read, 0, 0, 2, 2, pix, 2, 2, GDT_Float32, 0, 0));
	EXPECT_FLOAT_EQ(0.5f, pix[0]);
	EXPECT_TRUE(std::isnan(pix[3]));
	GDALClose(ds);

	EXPECT_THROW(WriteImage(image, grid, Days(3), Path("bad")), ShapeMismatchError);
}

TEST_F(RasterCubeFileTest, OpenComparesSentinelAtNativePrecision) {
	std::vector<std::string> files;
	files.push_back(Int32Scene("a.tif", "2021-06-02", 2147483600, 2147483647, 2147483647));
	files.push_back(Int32Scene("b.tif", "2021-06-03", 2147483647, 12, 2147483647));
	RasterCube cube = RasterCube::Open(files);
	EXPECT_FALSE(cube.HasQuality());
	const GeoRaster& band = cube["count"];
	EXPECT_TRUE(band.HasNativeReader());
	CImg<unsigned char> valid = band.ValidityMask().Read();
	EXPECT_EQ(1, valid(0,0,0));
	EXPECT_EQ(0, valid(1,0,0));
	EXPECT_EQ(0, valid(0,0,1));
	EXPECT_EQ(1, valid(1,0,1));
	CImg<float> values = band.Process().Read();
	EXPECT_FLOAT_EQ(2147483600.0f, values(0,0,0));
	EXPECT_TRUE(std::isnan(values(1,0,0)));
	EXPECT_FLOAT_EQ(12.0f, values(1,0,1));
	// 16 bit bands are exact in float and read directly
	RasterCube small = RasterCube::Open(std::vector<std::string>(1, Scene("c.tif", "ACQUISITION_DATETIME", "2021-06-02", 1000, 4)));
	EXPECT_FALSE(small["red"].HasNativeReader());
}

TEST_F(RasterCubeFileTest, OpenRejectsDifferentBandLayout) {
	std::vector<std::string> swapped;
	swapped.push_back(Scene("a.tif", "ACQUISITION_DATETIME", "2021-06-02", 1000, 4));
	swapped.push_back(Scene("b.tif", "ACQUISITION_DATETIME", "2021-06-03", 1000, 4, 0.0001, true));
	EXPECT_THROW(RasterCube::Open(swapped), ShapeMismatchError);

	std::vector<std::string> rescaled;
	rescaled.push_back(Scene("c.tif", "ACQUISITION_DATETIME", "2021-06-02", 1000, 4));
	rescaled.push_back(Scene("d.tif", "ACQUISITION_DATETIME", "2021-06-03", 1000, 4, 0.001));
	EXPECT_THROW(RasterCube::Open(rescaled), ShapeMismatchError);
}
