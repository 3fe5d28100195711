#include <clearcube/GeoRaster.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Options.h>
#include <clearcube/Utils.h>

#include <boost/bind/bind.hpp>
#include <boost/algorithm/string.hpp>

#include <cmath>
#include <limits>
#include <sstream>

namespace clearcube {
    using std::string;
    using std::vector;
    using namespace boost::placeholders;

    namespace {
        //! 0 where value is the sentinel, compared at the precision of T; NaN sentinels compare with isnan
        template<typename T> CImg<unsigned char> SentinelMask(const CImg<T>& img, double nodata) {
            CImg<unsigned char> mask(img.width(), img.height(), img.depth(), 1, 1);
            if (std::isnan(nodata)) {
                cimg_forXYZ(img,x,y,z) if (std::isnan(img(x,y,z))) mask(x,y,z) = 0;
                return mask;
            }
            // a sentinel outside the range of T can not occur in the data
            if (std::fabs(nodata) > std::numeric_limits<T>::max()) return mask;
            T val = (T)nodata;
            cimg_forXYZ(img,x,y,z) if (img(x,y,z) == val) mask(x,y,z) = 0;
            return mask;
        }

        CImg<double> ReadNative(GeoRaster::NativeReader native, const GeoArray& raw, const bbox& chunk) {
            CImg<double> img = native(chunk);
            if (img.width() != ChunkWidth(chunk) || img.height() != ChunkHeight(chunk) || (unsigned int)img.depth() != raw.NumTimes()) {
                throw ShapeMismatchError(raw.Description() + ": native chunk evaluated to " + to_string(img.width()) + "x"
                    + to_string(img.height()) + "x" + to_string(img.depth()));
            }
            return img;
        }

        CImg<unsigned char> ValidChunk(GeoArray raw, double nodata, const bbox& chunk) {
            return SentinelMask(raw.Read(chunk), nodata);
        }

        CImg<unsigned char> NativeValidChunk(GeoRaster::NativeReader native, GeoArray raw, double nodata, const bbox& chunk) {
            return SentinelMask(ReadNative(native, raw, chunk), nodata);
        }

        CImg<double> SelectNative(GeoRaster::NativeReader native, vector<unsigned int> indices, const bbox& chunk) {
            CImg<double> img = native(chunk);
            CImg<double> out(img.width(), img.height(), indices.size(), 1, 0.0);
            for (unsigned int t=0; t<indices.size(); t++) {
                cimg_forXY(out,x,y) out(x,y,t) = img(x,y,indices[t]);
            }
            return out;
        }

        //! Raw values are read once, validity is derived from the same values
        CImg<float> ProcessChunk(GeoArray raw, GeoRaster::NativeReader native, double nodata, vector<GeoMask> masks,
                                 double gain, double offset, const bbox& chunk) {
            CImg<double> values;
            CImg<unsigned char> cmask;
            if (native.empty()) {
                CImg<float> img = raw.Read(chunk);
                cmask = SentinelMask(img, nodata);
                values = img;
            } else {
                values = ReadNative(native, raw, chunk);
                cmask = SentinelMask(values, nodata);
            }
            for (vector<GeoMask>::const_iterator m=masks.begin(); m!=masks.end(); m++) {
                cmask = CombineMasks(cmask, m->Read(chunk), '&');
            }
            const float nan = std::numeric_limits<float>::quiet_NaN();
            CImg<float> img(values.width(), values.height(), values.depth(), 1, nan);
            // Scaling only touches pixels that survived masking
            cimg_forXYZ(img,x,y,z) {
                if (cmask(x, y, cmask.depth() == 1 ? 0 : z)) img(x,y,z) = values(x,y,z) * gain + offset;
            }
            return img;
        }

        double Sentinel(bool hasnodata, double nodata) {
            return hasnodata ? nodata : std::numeric_limits<double>::quiet_NaN();
        }
    }

	GeoRaster::GeoRaster(const GeoArray& raw, string name)
		: GeoData(raw), _Raw(raw), _Description(boost::algorithm::to_lower_copy(name)),
		  _NoData(false), _NoDataValue(0), _Gain(1.0), _Offset(0.0) {
		_Raw.SetDescription(_Description);
	}

	GeoRaster& GeoRaster::AddMask(const GeoMask& mask) {
		mask.CheckShape(*this, Times(), _Description);
		if (Options::Verbose() > 1)
			std::cout << _Description << ": adding mask " << mask.Description() << std::endl;
		_Masks.push_back(mask);
		return *this;
	}

	GeoMask GeoRaster::ValidityMask() const {
		if (_Native.empty()) return clearcube::ValidityMask(_Raw, Sentinel(_NoData, _NoDataValue));
		return GeoMask(*this, Times(), boost::bind(&NativeValidChunk, _Native, _Raw, Sentinel(_NoData, _NoDataValue), _1),
		               _Description + " valid");
	}

	GeoArray GeoRaster::Process() const {
		if (Options::Verbose() > 1) {
			std::cout << _Description << ": applying " << _Masks.size() << " masks, gain " << _Gain
			          << " and offset " << _Offset << std::endl;
		}
		return GeoArray(*this, Times(), boost::bind(&ProcessChunk, _Raw, _Native,
			Sentinel(_NoData, _NoDataValue), _Masks, _Gain, _Offset, _1), _Description);
	}

	GeoRaster GeoRaster::SelectTimes(const vector<unsigned int>& indices) const {
		GeoRaster band(*this);
		band._Raw = _Raw.SelectTimes(indices);
		if (!_Native.empty()) band._Native = boost::bind(&SelectNative, _Native, indices, _1);
		band._Masks.clear();
		for (vector<GeoMask>::const_iterator m=_Masks.begin(); m!=_Masks.end(); m++)
			band._Masks.push_back(m->SelectTimes(indices));
		return band;
	}

	string GeoRaster::Info() const {
		std::stringstream info;
		info << _Description << ": " << XSize() << " x " << YSize() << " x " << NumTimes();
		info << ", Gain = " << Gain() << ", Offset = " << Offset();
		if (_NoData) info << ", NoData = " << NoDataValue();
		if (!_Masks.empty()) info << ", " << _Masks.size() << " masks";
		return info.str();
	}

	GeoMask ValidityMask(const GeoArray& array, double nodata) {
		return GeoMask(array, array.Times(), boost::bind(&ValidChunk, array, nodata, _1), array.Description() + " valid");
	}

} // namespace clearcube
