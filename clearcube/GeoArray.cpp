#include <clearcube/GeoArray.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Utils.h>

#include <boost/bind/bind.hpp>
#include <boost/make_shared.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace clearcube {
    using std::string;
    using std::vector;
    using namespace boost::placeholders;

    namespace {
        CImg<float> CropData(boost::shared_ptr< const CImg<float> > data, const bbox& chunk) {
            return data->get_crop(chunk.min_corner().x(), chunk.min_corner().y(), 0,
                                  chunk.max_corner().x(), chunk.max_corner().y(), data->depth()-1);
        }

        CImg<float> SelectChunk(GeoArray::Reader a, vector<unsigned int> indices, const bbox& chunk) {
            CImg<float> img = a(chunk);
            CImg<float> out(img.width(), img.height(), indices.size(), 1, 0.0f);
            for (unsigned int t=0; t<indices.size(); t++) {
                cimg_forXY(out,x,y) out(x,y,t) = img(x,y,indices[t]);
            }
            return out;
        }

        CImg<float> WhereChunk(GeoArray::Reader a, GeoMask mask, const bbox& chunk) {
            CImg<float> img = a(chunk);
            CImg<unsigned char> cmask = mask.Read(chunk);
            const float nan = std::numeric_limits<float>::quiet_NaN();
            cimg_forXYZ(img,x,y,z) {
                if (!cmask(x, y, cmask.depth() == 1 ? 0 : z)) img(x,y,z) = nan;
            }
            return img;
        }

        CImg<unsigned char> ThresholdChunk(GeoArray::Reader a, string op, double val, const bbox& chunk) {
            CImg<float> img = a(chunk);
            CImg<unsigned char> mask(img.width(), img.height(), img.depth(), 1, 0);
            cimg_forXYZ(img,x,y,z) {
                float v = img(x,y,z);
                if (std::isnan(v)) continue;
                if (op == ">") mask(x,y,z) = v > val;
                else if (op == ">=") mask(x,y,z) = v >= val;
                else if (op == "<") mask(x,y,z) = v < val;
                else mask(x,y,z) = v <= val;
            }
            return mask;
        }
    }

	GeoArray::GeoArray(const GeoData& grid, const TimeAxis& times, Reader reader, string desc)
        : GeoData(grid), _Times(times), _Reader(reader), _Description(desc) {}

	GeoArray::GeoArray(const GeoData& grid, const TimeAxis& times, const CImg<float>& data, string desc)
        : GeoData(grid), _Times(times), _Description(desc) {
        if ((unsigned int)data.width() != grid.XSize() || (unsigned int)data.height() != grid.YSize()
                || (unsigned int)data.depth() != times.size()) {
            throw ShapeMismatchError(desc + ": data " + to_string(data.width()) + "x" + to_string(data.height())
                + "x" + to_string(data.depth()) + " does not match grid " + to_string(grid.XSize()) + "x"
                + to_string(grid.YSize()) + "x" + to_string(times.size()));
        }
        boost::shared_ptr< const CImg<float> > ptr = boost::make_shared< const CImg<float> >(data);
        _Reader = boost::bind(&CropData, ptr, _1);
	}

	CImg<float> GeoArray::Read(const bbox& chunk) const {
        if (_Reader.empty()) throw std::runtime_error("GeoArray: reading an empty array");
        if (NumTimes() == 0) return CImg<float>();
        CImg<float> img = _Reader(chunk);
        if (img.width() != ChunkWidth(chunk) || img.height() != ChunkHeight(chunk) || (unsigned int)img.depth() != NumTimes()) {
            throw ShapeMismatchError(_Description + ": chunk evaluated to " + to_string(img.width()) + "x"
                + to_string(img.height()) + "x" + to_string(img.depth()));
        }
        return img;
	}

	GeoArray GeoArray::SelectTimes(const vector<unsigned int>& indices) const {
        TimeAxis times;
        for (vector<unsigned int>::const_iterator i=indices.begin(); i!=indices.end(); i++) {
            if (*i >= NumTimes())
                throw std::out_of_range(_Description + ": time index " + to_string(*i) + " out of range");
            times.push_back(_Times[*i]);
        }
        return GeoArray(*this, times, boost::bind(&SelectChunk, _Reader, indices, _1), _Description);
	}

	GeoArray GeoArray::Where(const GeoMask& mask) const {
        mask.CheckShape(*this, _Times, _Description);
        return GeoArray(*this, _Times, boost::bind(&WhereChunk, _Reader, mask, _1), _Description);
	}

	GeoMask GeoArray::Threshold(string op, double val) const {
        return GeoMask(*this, _Times, boost::bind(&ThresholdChunk, _Reader, op, val, _1),
                       _Description + " " + op + " " + to_string(val));
	}

} // namespace clearcube
