#include <clearcube/RasterCube.h>
#include <clearcube/TimeFilter.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Options.h>
#include <clearcube/Utils.h>

#include <gdal/gdal_priv.h>

#include <boost/bind/bind.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace clearcube {
    using std::string;
    using std::vector;
    using namespace boost::placeholders;
    typedef boost::shared_ptr<GDALDataset> DatasetPtr;

    namespace {
        //! Read one band of every dataset over a chunk, one slice per dataset
        template<typename T> CImg<T> ReadBandChunk(vector<DatasetPtr> datasets, int bandnum, GDALDataType type, const bbox& chunk) {
            int width = ChunkWidth(chunk);
            int height = ChunkHeight(chunk);
            CImg<T> img(width, height, datasets.size(), 1, (T)0);
            for (unsigned int t=0; t<datasets.size(); t++) {
                GDALRasterBand* band = datasets[t]->GetRasterBand(bandnum);
                CPLErr err = band->RasterIO(GF_Read, chunk.min_corner().x(), chunk.min_corner().y(), width, height,
                                            img.data(0,0,t), width, height, type, 0, 0);
                if (err != CE_None) {
                    throw std::runtime_error(string(datasets[t]->GetDescription()) + ": error reading band "
                        + to_string(bandnum) + ": " + CPLGetLastErrorMsg());
                }
            }
            if (Options::Verbose() > 2)
                std::cout << "Read band " << bandnum << " rows " << chunk.min_corner().y() << "-" << chunk.max_corner().y() << std::endl;
            return img;
        }

        //! Can every value of a GDAL data type be held exactly in a float
        bool ExactInFloat(GDALDataType type) {
            return (type == GDT_Byte) || (type == GDT_UInt16) || (type == GDT_Int16) || (type == GDT_Float32);
        }

        //! Equal, or both NaN
        bool SameValue(double a, double b) {
            return (a == b) || (std::isnan(a) && std::isnan(b));
        }

        bool EarlierTime(const std::pair<boost::posix_time::ptime,DatasetPtr>& a,
                         const std::pair<boost::posix_time::ptime,DatasetPtr>& b) {
            return a.first < b.first;
        }

        string BandName(GDALRasterBand* band, int bandnum) {
            string name = boost::algorithm::to_lower_copy(string(band->GetDescription()));
            boost::algorithm::trim(name);
            if (name.empty()) name = "band" + to_string(bandnum);
            return name;
        }
    }

	RasterCube::RasterCube(const GeoData& grid, const TimeAxis& times)
		: GeoData(grid), _Times(times), _HasQuality(false) {
		for (unsigned int i=1; i<_Times.size(); i++) {
			if (!(_Times[i-1] < _Times[i])) {
				throw std::invalid_argument("RasterCube: timestamps must be strictly increasing ("
					+ TimeString(_Times[i-1]) + " followed by " + TimeString(_Times[i]) + ")");
			}
		}
	}

	/*!
	 * Each file is one time step, all files must share grid and band layout.
	 * The timestamp is read from the metadata item timekey, falling back to
	 * TIFFTAG_DATETIME. Pixel values are not read until a chunk is evaluated.
	 */
	RasterCube RasterCube::Open(const vector<string>& filenames, string qualityband, string timekey) {
		if (filenames.empty()) throw std::invalid_argument("RasterCube: no input files");
		vector< std::pair<boost::posix_time::ptime,DatasetPtr> > scenes;
		for (vector<string>::const_iterator f=filenames.begin(); f!=filenames.end(); f++) {
			GDALDataset* ds = (GDALDataset*)GDALOpenShared(f->c_str(), GA_ReadOnly);
			if (ds == NULL) {
				throw std::runtime_error(*f + ": " + to_string(CPLGetLastErrorNo()) + ": " + string(CPLGetLastErrorMsg()));
			}
			DatasetPtr dsptr(ds, GDALClose);
			const char* stamp = ds->GetMetadataItem(timekey.c_str());
			if (stamp == NULL) stamp = ds->GetMetadataItem("TIFFTAG_DATETIME");
			if (stamp == NULL) throw std::runtime_error(*f + ": no timestamp in metadata item " + timekey);
			boost::posix_time::ptime t;
			try {
				t = ParseTime(stamp);
			} catch (std::exception& e) {
				throw std::runtime_error(*f + ": unable to parse timestamp '" + string(stamp) + "': " + e.what());
			}
			scenes.push_back(std::make_pair(t, dsptr));
		}
		std::stable_sort(scenes.begin(), scenes.end(), EarlierTime);

		TimeAxis times;
		vector<DatasetPtr> datasets;
		for (unsigned int i=0; i<scenes.size(); i++) {
			if (i > 0 && scenes[i].first == scenes[i-1].first) {
				throw std::invalid_argument(string(scenes[i].second->GetDescription()) + ": duplicate timestamp "
					+ TimeString(scenes[i].first));
			}
			times.push_back(scenes[i].first);
			datasets.push_back(scenes[i].second);
		}

		GeoData grid(datasets[0].get());
		int numbands = datasets[0]->GetRasterCount();
		for (unsigned int i=1; i<datasets.size(); i++) {
			GeoData other(datasets[i].get());
			if (!grid.SameGrid(other) || datasets[i]->GetRasterCount() != numbands) {
				throw ShapeMismatchError(string(datasets[i]->GetDescription()) + " is " + to_string(other.XSize()) + "x"
					+ to_string(other.YSize()) + " with " + to_string(datasets[i]->GetRasterCount()) + " bands, expected "
					+ to_string(grid.XSize()) + "x" + to_string(grid.YSize()) + " with " + to_string(numbands) + " bands");
			}
		}

		// Bands are matched by number, so every scene must describe them the same way
		for (unsigned int i=1; i<datasets.size(); i++) {
			for (int b=1; b<=numbands; b++) {
				GDALRasterBand* first = datasets[0]->GetRasterBand(b);
				GDALRasterBand* band = datasets[i]->GetRasterBand(b);
				string what = string(datasets[i]->GetDescription()) + " band " + to_string(b);
				if (BandName(band, b) != BandName(first, b)) {
					throw ShapeMismatchError(what + " is '" + BandName(band, b) + "', expected '" + BandName(first, b) + "'");
				}
				int has1(0), has2(0);
				double nodata1 = first->GetNoDataValue(&has1);
				double nodata2 = band->GetNoDataValue(&has2);
				if (has1 != has2 || (has1 && !SameValue(nodata1, nodata2)))
					throw ShapeMismatchError(what + ": no-data value differs from " + datasets[0]->GetDescription());
				if (first->GetScale() != band->GetScale() || first->GetOffset() != band->GetOffset())
					throw ShapeMismatchError(what + ": scale or offset differs from " + datasets[0]->GetDescription());
				if (first->GetRasterDataType() != band->GetRasterDataType())
					throw ShapeMismatchError(what + ": data type differs from " + datasets[0]->GetDescription());
			}
		}

		RasterCube cube(grid, times);
		qualityband = boost::algorithm::to_lower_copy(qualityband);
		for (int b=1; b<=numbands; b++) {
			GDALRasterBand* band = datasets[0]->GetRasterBand(b);
			string name = BandName(band, b);
			GeoArray raw(grid, times, boost::bind(&ReadBandChunk<float>, datasets, b, GDT_Float32, _1), name);
			if (name == qualityband) {
				cube.SetQuality(raw);
				continue;
			}
			GeoRaster raster(raw, name);
			if (!ExactInFloat(band->GetRasterDataType()))
				raster.SetNativeReader(boost::bind(&ReadBandChunk<double>, datasets, b, GDT_Float64, _1));
			int hasval(0);
			double nodata = band->GetNoDataValue(&hasval);
			if (hasval) raster.SetNoData(nodata);
			double gain = band->GetScale(&hasval);
			if (hasval) raster.SetGain(gain);
			double offset = band->GetOffset(&hasval);
			if (hasval) raster.SetOffset(offset);
			cube.AddBand(raster);
		}
		if (Options::Verbose() > 1) std::cout << cube.Info() << std::endl;
		return cube;
	}

	vector<string> RasterCube::BandNames() const {
		vector<string> names;
		for (vector<GeoRaster>::const_iterator b=_RasterBands.begin(); b!=_RasterBands.end(); b++)
			names.push_back(b->Description());
		return names;
	}

	bool RasterCube::HasBand(string name) const {
		boost::algorithm::to_lower(name);
		for (vector<GeoRaster>::const_iterator b=_RasterBands.begin(); b!=_RasterBands.end(); b++)
			if (b->Description() == name) return true;
		return false;
	}

	GeoRaster& RasterCube::operator[](unsigned int band) {
		return const_cast<GeoRaster&>(static_cast<const RasterCube&>(*this)[band]);
	}

	const GeoRaster& RasterCube::operator[](unsigned int band) const {
		if (band >= _RasterBands.size())
			throw std::out_of_range("RasterCube: band index " + to_string(band) + " out of range");
		return _RasterBands[band];
	}

	const GeoRaster& RasterCube::operator[](string name) const {
		string key = boost::algorithm::to_lower_copy(name);
		for (vector<GeoRaster>::const_iterator b=_RasterBands.begin(); b!=_RasterBands.end(); b++)
			if (b->Description() == key) return *b;
		throw std::out_of_range("RasterCube: no band named '" + name + "'");
	}

	void RasterCube::CheckShape(const GeoArray& array) const {
		if (!SameGrid(array) || array.NumTimes() != NumTimes()) {
			throw ShapeMismatchError(array.Description() + " is " + to_string(array.XSize()) + "x"
				+ to_string(array.YSize()) + "x" + to_string(array.NumTimes()) + ", cube is "
				+ to_string(XSize()) + "x" + to_string(YSize()) + "x" + to_string(NumTimes()));
		}
		if (array.Times() != _Times)
			throw ShapeMismatchError(array.Description() + ": time axis differs from cube");
	}

	RasterCube& RasterCube::AddBand(const GeoRaster& band) {
		CheckShape(band.Raw());
		if (HasBand(band.Description()))
			throw std::invalid_argument("RasterCube: band '" + band.Description() + "' already exists");
		_RasterBands.push_back(band);
		return *this;
	}

	RasterCube& RasterCube::RemoveBand(string name) {
		boost::algorithm::to_lower(name);
		for (vector<GeoRaster>::iterator b=_RasterBands.begin(); b!=_RasterBands.end(); b++) {
			if (b->Description() == name) {
				_RasterBands.erase(b);
				return *this;
			}
		}
		throw std::out_of_range("RasterCube: no band named '" + name + "'");
	}

	const GeoArray& RasterCube::Quality() const {
		if (!_HasQuality) throw std::out_of_range("RasterCube: no quality band");
		return _Quality;
	}

	RasterCube& RasterCube::SetQuality(const GeoArray& quality) {
		CheckShape(quality);
		_Quality = quality;
		_HasQuality = true;
		return *this;
	}

	RasterCube& RasterCube::AddMask(const GeoMask& mask) {
		for (unsigned int i=0;i<_RasterBands.size();i++) _RasterBands[i].AddMask(mask);
		return *this;
	}

	RasterCube RasterCube::SelectTimes(const vector<unsigned int>& indices) const {
		TimeAxis times;
		for (vector<unsigned int>::const_iterator i=indices.begin(); i!=indices.end(); i++) {
			if (*i >= NumTimes())
				throw std::out_of_range("RasterCube: time index " + to_string(*i) + " out of range");
			times.push_back(_Times[*i]);
		}
		RasterCube cube(*this, times);
		for (vector<GeoRaster>::const_iterator b=_RasterBands.begin(); b!=_RasterBands.end(); b++)
			cube.AddBand(b->SelectTimes(indices));
		if (_HasQuality) cube.SetQuality(_Quality.SelectTimes(indices));
		return cube;
	}

	RasterCube RasterCube::SelectTimes(const TimeSelection& selection) const {
		if (selection.NumTotal() != NumTimes()) {
			throw ShapeMismatchError("time selection over " + to_string(selection.NumTotal())
				+ " time steps applied to cube with " + to_string(NumTimes()));
		}
		return SelectTimes(selection.Indices());
	}

	string RasterCube::Info() const {
		std::stringstream info;
		info << GeoData::Info() << ", " << NumTimes() << " time steps";
		if (NumTimes() > 0) info << " (" << TimeString(_Times.front()) << " to " << TimeString(_Times.back()) << ")";
		info << std::endl;
		for (vector<GeoRaster>::const_iterator b=_RasterBands.begin(); b!=_RasterBands.end(); b++)
			info << "   " << b->Info() << std::endl;
		if (_HasQuality) info << "   quality: " << _Quality.Description() << std::endl;
		return info.str();
	}

	string WriteImage(const CImg<float>& image, const GeoData& grid, const TimeAxis& times, string filename) {
		vector<string> descriptions;
		for (unsigned int t=0; t<times.size(); t++) descriptions.push_back(TimeString(times[t]));
		return WriteImage(image, grid, descriptions, filename);
	}

	string WriteImage(const CImg<float>& image, const GeoData& grid, const vector<string>& descriptions, string filename) {
		if ((unsigned int)image.width() != grid.XSize() || (unsigned int)image.height() != grid.YSize()
				|| (unsigned int)image.depth() != descriptions.size()) {
			throw ShapeMismatchError(filename + ": image " + to_string(image.width()) + "x" + to_string(image.height())
				+ "x" + to_string(image.depth()) + " does not match grid " + to_string(grid.XSize()) + "x"
				+ to_string(grid.YSize()) + "x" + to_string(descriptions.size()));
		}
		if (descriptions.empty()) throw std::invalid_argument(filename + ": no bands to write");
		string format = Options::DefaultFormat();
		GDALDriver *driver = GetGDALDriverManager()->GetDriverByName(format.c_str());
		if (driver == NULL) throw std::runtime_error("GDAL driver " + format + " not available");
		// Check extension
		boost::filesystem::path path(filename);
		const char* ext = driver->GetMetadataItem(GDAL_DMD_EXTENSION);
		if (ext != NULL && string(ext) != "" && path.extension().string() != ('.' + string(ext)))
			path = boost::filesystem::path(path.string() + '.' + ext);

		GDALDataset* ds = driver->Create(path.string().c_str(), grid.XSize(), grid.YSize(), descriptions.size(), GDT_Float32, NULL);
		if (ds == NULL) throw std::runtime_error("Error creating " + path.string() + ": " + CPLGetLastErrorMsg());
		boost::shared_ptr<GDALDataset> dsptr(ds, GDALClose);
		double affine[6];
		grid.GetAffine(affine);
		ds->SetGeoTransform(affine);
		if (grid.Projection() != "") ds->SetProjection(grid.Projection().c_str());
		for (unsigned int b=0; b<descriptions.size(); b++) {
			GDALRasterBand* band = ds->GetRasterBand(b+1);
			CPLErr err = band->RasterIO(GF_Write, 0, 0, image.width(), image.height(), (void*)image.data(0,0,b),
			                            image.width(), image.height(), GDT_Float32, 0, 0);
			if (err != CE_None) throw std::runtime_error("Error writing " + path.string() + ": " + CPLGetLastErrorMsg());
			band->SetNoDataValue(std::numeric_limits<double>::quiet_NaN());
			band->SetDescription(descriptions[b].c_str());
		}
		if (Options::Verbose() > 0) std::cout << "Wrote " << path.string() << std::endl;
		return path.string();
	}

} // namespace clearcube
