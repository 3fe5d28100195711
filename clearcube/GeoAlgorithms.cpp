#include <clearcube/GeoAlgorithms.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Options.h>
#include <clearcube/Utils.h>

#include <gdal/gdal_priv.h>
#include <gdal/gdal_alg.h>
#include <gdal/ogrsf_frmts.h>

#include <boost/bind/bind.hpp>
#include <boost/shared_ptr.hpp>

#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace clearcube {
    using std::string;
    using std::vector;
    using std::map;
    using namespace boost::placeholders;

    namespace {
        CImg<unsigned char> CategoryChunk(GeoArray quality, std::set<int> codes, const bbox& chunk) {
            CImg<float> img = quality.Read(chunk);
            CImg<unsigned char> mask(img.width(), img.height(), img.depth(), 1, 0);
            const double lo = std::numeric_limits<int>::min();
            const double hi = std::numeric_limits<int>::max();
            cimg_forXYZ(img,x,y,z) {
                double code = std::floor(img(x,y,z) + 0.5);
                // NaN, infinite and out of range codes match no category
                if (!(code >= lo && code <= hi)) continue;
                if (codes.count((int)code)) mask(x,y,z) = 1;
            }
            return mask;
        }

        //! Burn polygons into an in-memory dataset covering the chunk
        CImg<unsigned char> RasterizeChunk(GeoVector polygons, GeoData grid, const bbox& chunk) {
            int width = ChunkWidth(chunk);
            int height = ChunkHeight(chunk);
            GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("MEM");
            if (driver == NULL) throw std::runtime_error("GDAL MEM driver not available, call GDALAllRegister");
            GDALDataset* ds = driver->Create("", width, height, 1, GDT_Byte, NULL);
            if (ds == NULL) throw std::runtime_error("Error creating rasterization buffer: " + string(CPLGetLastErrorMsg()));
            boost::shared_ptr<GDALDataset> dsptr(ds, GDALClose);

            // geotransform shifted to the chunk origin
            double affine[6];
            grid.GetAffine(affine);
            double x0 = chunk.min_corner().x(), y0 = chunk.min_corner().y();
            affine[0] = grid.Affine(0) + x0*grid.Affine(1) + y0*grid.Affine(2);
            affine[3] = grid.Affine(3) + x0*grid.Affine(4) + y0*grid.Affine(5);
            ds->SetGeoTransform(affine);

            vector<OGRGeometryH> geoms;
            vector<double> burn;
            for (unsigned int i=0; i<polygons.NumGeometries(); i++) {
                geoms.push_back((OGRGeometryH)polygons.Geometry(i));
                burn.push_back(1);
            }
            int bands[] = {1};
            CPLErr err = GDALRasterizeGeometries(ds, 1, &bands[0], geoms.size(), &geoms[0], NULL, NULL, &burn[0],
                                                 NULL, NULL, NULL);
            if (err != CE_None) throw std::runtime_error(polygons.Source() + ": rasterization failed: " + CPLGetLastErrorMsg());

            CImg<unsigned char> mask(width, height, 1, 1, 0);
            err = ds->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, width, height, mask.data(), width, height, GDT_Byte, 0, 0);
            if (err != CE_None) throw std::runtime_error("Error reading rasterization buffer: " + string(CPLGetLastErrorMsg()));
            cimg_for(mask,ptr,unsigned char) if (*ptr) *ptr = 1;
            return mask;
        }

        CImg<float> NormDiffChunk(GeoArray a, GeoArray b, const bbox& chunk) {
            CImg<float> imga = a.Read(chunk);
            CImg<float> imgb = b.Read(chunk);
            CImg<float> sum = imga + imgb;
            CImg<float> out = (imga - imgb).div(sum);
            const float nan = std::numeric_limits<float>::quiet_NaN();
            cimg_forXYZ(out,x,y,z) {
                if (std::isnan(imga(x,y,z)) || std::isnan(imgb(x,y,z)) || sum(x,y,z) == 0) out(x,y,z) = nan;
            }
            return out;
        }
    }

	map<string,GeoMask> ValidityMasks(const RasterCube& cube) {
		map<string,GeoMask> masks;
		for (unsigned int b=0; b<cube.NumBands(); b++) {
			masks[cube[b].Description()] = cube[b].ValidityMask();
		}
		return masks;
	}

	GeoMask CategoryMask(const GeoArray& quality, const QualityScheme& scheme, const vector<string>& labels) {
		// Labels are checked here so that typos fail before any data is read
		std::set<int> codes = scheme.Codes(labels);
		if (Options::Verbose() > 1) {
			std::cout << quality.Description() << ": accepting";
			for (std::set<int>::const_iterator c=codes.begin(); c!=codes.end(); c++)
				std::cout << " " << *c << " (" << scheme.Label(*c) << ")";
			std::cout << std::endl;
		}
		return GeoMask(quality, quality.Times(), boost::bind(&CategoryChunk, quality, codes, _1),
		               quality.Description() + " in " + to_string(codes.size()) + " categories");
	}

	/*!
	 * A pixel is set when its center is inside a polygon (GDAL rasterization
	 * without ALL_TOUCHED). Polygons must be in the projection of the grid.
	 */
	GeoMask Rasterize(const GeoVector& polygons, const GeoData& grid) {
		if (polygons.NumGeometries() == 0) throw EmptyGeometryError(polygons.Source());
		if (Options::Verbose() > 1)
			std::cout << "Rasterizing " << polygons.NumGeometries() << " polygons from " << polygons.Source() << std::endl;
		return GeoMask(grid, boost::bind(&RasterizeChunk, polygons, grid, _1), polygons.Source());
	}

	RasterCube Clean(const RasterCube& cube, const GeoMask& quality) {
		quality.CheckShape(cube, cube.Times(), "quality mask");
		RasterCube out(cube, cube.Times());
		for (unsigned int b=0; b<cube.NumBands(); b++) {
			GeoRaster band(cube[b]);
			band.AddMask(quality);
			GeoRaster clean(band.Process(), band.Description());
			clean.SetNoData(std::numeric_limits<double>::quiet_NaN());
			out.AddBand(clean);
		}
		if (cube.HasQuality()) out.SetQuality(cube.Quality());
		if (Options::Verbose() > 0)
			std::cout << "Cleaned " << cube.NumBands() << " bands over " << cube.NumTimes() << " time steps" << std::endl;
		return out;
	}

	GeoArray NormDiff(const GeoArray& a, const GeoArray& b, string desc) {
		if (!a.SameGrid(b) || a.NumTimes() != b.NumTimes() || a.Times() != b.Times()) {
			throw ShapeMismatchError(a.Description() + " (" + to_string(a.XSize()) + "x" + to_string(a.YSize()) + "x"
				+ to_string(a.NumTimes()) + ") and " + b.Description() + " (" + to_string(b.XSize()) + "x"
				+ to_string(b.YSize()) + "x" + to_string(b.NumTimes()) + ")");
		}
		if (desc == "") desc = "nd(" + a.Description() + "," + b.Description() + ")";
		return GeoArray(a, a.Times(), boost::bind(&NormDiffChunk, a, b, _1), desc);
	}

	GeoArray MNDWI(const RasterCube& cube, string green, string swir) {
		return NormDiff(cube[green].Process(), cube[swir].Process(), "mndwi");
	}

	GeoArray NDCI(const RasterCube& cube, string rededge, string red) {
		return NormDiff(cube[rededge].Process(), cube[red].Process(), "ndci");
	}

	GeoArray NDVI(const RasterCube& cube, string nir, string red) {
		return NormDiff(cube[nir].Process(), cube[red].Process(), "ndvi");
	}

} // namespace clearcube
