#include <clearcube/GeoMask.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Options.h>
#include <clearcube/Utils.h>

#include <boost/bind/bind.hpp>
#include <boost/make_shared.hpp>

#include <stdexcept>
#include <algorithm>

namespace clearcube {
    using std::string;
    using std::vector;
    using namespace boost::placeholders;

    namespace {
        CImg<unsigned char> CropData(boost::shared_ptr< const CImg<unsigned char> > data, const bbox& chunk) {
            return data->get_crop(chunk.min_corner().x(), chunk.min_corner().y(), 0,
                                  chunk.max_corner().x(), chunk.max_corner().y(), data->depth()-1);
        }

        CImg<unsigned char> CombineChunk(GeoMask::Reader a, GeoMask::Reader b, char op, const bbox& chunk) {
            return CombineMasks(a(chunk), b(chunk), op);
        }

        CImg<unsigned char> InvertChunk(GeoMask::Reader a, const bbox& chunk) {
            CImg<unsigned char> mask = a(chunk);
            cimg_for(mask,ptr,unsigned char) *ptr = (*ptr) ? 0 : 1;
            return mask;
        }

        CImg<unsigned char> SelectChunk(GeoMask::Reader a, vector<unsigned int> indices, const bbox& chunk) {
            CImg<unsigned char> mask = a(chunk);
            CImg<unsigned char> out(mask.width(), mask.height(), indices.size(), 1, 0);
            for (unsigned int t=0; t<indices.size(); t++) {
                cimg_forXY(out,x,y) out(x,y,t) = mask(x,y,indices[t]);
            }
            return out;
        }

        void CheckData(const GeoData& grid, unsigned int depth, const CImg<unsigned char>& data, const string& desc) {
            if ((unsigned int)data.width() != grid.XSize() || (unsigned int)data.height() != grid.YSize()
                    || (unsigned int)data.depth() != depth) {
                throw ShapeMismatchError(desc + ": mask data " + to_string(data.width()) + "x" + to_string(data.height())
                    + "x" + to_string(data.depth()) + " does not match grid " + to_string(grid.XSize()) + "x"
                    + to_string(grid.YSize()) + "x" + to_string(depth));
            }
        }
    }

	GeoMask::GeoMask(const GeoData& grid, const TimeAxis& times, Reader reader, string desc)
        : GeoData(grid), _Spatial(false), _Times(times), _Reader(reader), _Description(desc) {}

	GeoMask::GeoMask(const GeoData& grid, Reader reader, string desc)
        : GeoData(grid), _Spatial(true), _Reader(reader), _Description(desc) {}

	GeoMask::GeoMask(const GeoData& grid, const TimeAxis& times, const CImg<unsigned char>& data, string desc)
        : GeoData(grid), _Spatial(false), _Times(times), _Description(desc) {
        CheckData(grid, times.size(), data, desc);
        boost::shared_ptr< const CImg<unsigned char> > ptr = boost::make_shared< const CImg<unsigned char> >(data);
        _Reader = boost::bind(&CropData, ptr, _1);
	}

	GeoMask::GeoMask(const GeoData& grid, const CImg<unsigned char>& data, string desc)
        : GeoData(grid), _Spatial(true), _Description(desc) {
        CheckData(grid, 1, data, desc);
        boost::shared_ptr< const CImg<unsigned char> > ptr = boost::make_shared< const CImg<unsigned char> >(data);
        _Reader = boost::bind(&CropData, ptr, _1);
	}

	CImg<unsigned char> GeoMask::Read(const bbox& chunk) const {
        if (_Reader.empty()) throw std::runtime_error("GeoMask: reading an empty mask");
        if (Depth() == 0) return CImg<unsigned char>();
        CImg<unsigned char> mask = _Reader(chunk);
        if (mask.width() != ChunkWidth(chunk) || mask.height() != ChunkHeight(chunk) || (unsigned int)mask.depth() != Depth()) {
            throw ShapeMismatchError(_Description + ": chunk evaluated to " + to_string(mask.width()) + "x"
                + to_string(mask.height()) + "x" + to_string(mask.depth()));
        }
        return mask;
	}

	void GeoMask::CheckShape(const GeoData& grid, const TimeAxis& times, string what) const {
        if (!SameGrid(grid)) {
            throw ShapeMismatchError(what + ": mask '" + _Description + "' is " + to_string(XSize()) + "x" + to_string(YSize())
                + ", expected " + to_string(grid.XSize()) + "x" + to_string(grid.YSize()));
        }
        if (!_Spatial && _Times != times) {
            throw ShapeMismatchError(what + ": mask '" + _Description + "' has " + to_string(NumTimes())
                + " time steps, expected " + to_string(times.size()) + " matching time steps");
        }
	}

	GeoMask GeoMask::Combine(const GeoMask& mask, char op) const {
        string desc = "(" + _Description + " " + op + " " + mask._Description + ")";
        if (!SameGrid(mask)) {
            throw ShapeMismatchError(desc + ": grids " + to_string(XSize()) + "x" + to_string(YSize()) + " and "
                + to_string(mask.XSize()) + "x" + to_string(mask.YSize()));
        }
        Reader reader = boost::bind(&CombineChunk, _Reader, mask._Reader, op, _1);
        if (_Spatial && mask._Spatial) return GeoMask(*this, reader, desc);
        if (_Spatial) return GeoMask(*this, mask._Times, reader, desc);
        if (!mask._Spatial && _Times != mask._Times) {
            throw ShapeMismatchError(desc + ": time axes differ (" + to_string(NumTimes()) + " and "
                + to_string(mask.NumTimes()) + " time steps)");
        }
        return GeoMask(*this, _Times, reader, desc);
	}

	GeoMask GeoMask::operator&(const GeoMask& mask) const { return Combine(mask, '&'); }

	GeoMask GeoMask::operator|(const GeoMask& mask) const { return Combine(mask, '|'); }

	GeoMask GeoMask::operator~() const {
        Reader reader = boost::bind(&InvertChunk, _Reader, _1);
        if (_Spatial) return GeoMask(*this, reader, "~" + _Description);
        return GeoMask(*this, _Times, reader, "~" + _Description);
	}

	GeoMask GeoMask::SelectTimes(const vector<unsigned int>& indices) const {
        if (_Spatial) return *this;
        TimeAxis times;
        for (vector<unsigned int>::const_iterator i=indices.begin(); i!=indices.end(); i++) {
            if (*i >= NumTimes())
                throw std::out_of_range(_Description + ": time index " + to_string(*i) + " out of range");
            times.push_back(_Times[*i]);
        }
        return GeoMask(*this, times, boost::bind(&SelectChunk, _Reader, indices, _1), _Description);
	}

	CImg<unsigned char> CombineMasks(const CImg<unsigned char>& a, const CImg<unsigned char>& b, char op) {
        if (a.width() != b.width() || a.height() != b.height())
            throw ShapeMismatchError("mask chunks differ in size");
        int depth = std::max(a.depth(), b.depth());
        if ((a.depth() != depth && a.depth() != 1) || (b.depth() != depth && b.depth() != 1))
            throw ShapeMismatchError("mask chunks differ in number of time steps");
        CImg<unsigned char> out(a.width(), a.height(), depth, 1, 0);
        cimg_forXYZ(out,x,y,z) {
            bool va = a(x, y, a.depth() == 1 ? 0 : z) != 0;
            bool vb = b(x, y, b.depth() == 1 ? 0 : z) != 0;
            out(x,y,z) = (op == '&') ? (va && vb) : (va || vb);
        }
        return out;
	}

} // namespace clearcube
