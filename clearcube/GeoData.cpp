#include <clearcube/GeoData.h>
#include <clearcube/Options.h>
#include <clearcube/Utils.h>

#include <gdal/gdal_priv.h>

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <algorithm>

namespace clearcube {
    using std::string;
    using std::vector;

	GeoData::GeoData(unsigned int xsz, unsigned int ysz, const double affine[6], string projection)
		: _XSize(xsz), _YSize(ysz), _Projection(projection) {
		for (int i=0;i<6;i++) _Affine[i] = affine[i];
	}

	GeoData::GeoData(GDALDataset* ds) : _XSize(0), _YSize(0), _Projection("") {
		if (ds == NULL) throw std::runtime_error("GeoData: null GDAL dataset");
		_XSize = ds->GetRasterXSize();
		_YSize = ds->GetRasterYSize();
		if (ds->GetGeoTransform(_Affine) != CE_None) {
			// GDAL fills the default 0,1,0,0,0,1 transform when none is set
			if (Options::Verbose() > 1)
				std::cout << ds->GetDescription() << ": no geotransform, using pixel coordinates" << std::endl;
		}
		const char* wkt = ds->GetProjectionRef();
		if (wkt != NULL) _Projection = wkt;
	}

	/*!
	 * Using the geotransform get geo-located coordinates
	 */
	point GeoData::GeoLoc(float xloc, float yloc) const {
		point Coord(_Affine[0] + xloc*_Affine[1] + yloc*_Affine[2], _Affine[3] + xloc*_Affine[4] + yloc*_Affine[5]);
		return Coord;
	}

	double GeoData::PixelArea() const {
		return std::fabs(_Affine[1]*_Affine[5] - _Affine[2]*_Affine[4]);
	}

	/*!
	 * Chunk() breaks up the grid into blocks of rows, with each block
	 * being no bigger than Options::ChunkSize() megabytes over all layers
	 */
	vector<bbox> GeoData::Chunk(unsigned int bytes, unsigned int depth) const {
		vector<bbox> Chunks;
		if (Size() == 0) return Chunks;
		if (depth == 0) depth = 1;
		double rowbytes = (double)bytes * XSize() * depth;
		unsigned int rows = (unsigned int)std::floor( (Options::ChunkSize()*1024*1024) / rowbytes );
		rows = std::max(rows, 1u);
		rows = std::min(rows, YSize());
		unsigned int numchunks = (unsigned int)std::ceil( YSize()/(double)rows );
		for (unsigned int i=0; i<numchunks; i++) {
			point p1(0, rows*i);
			point p2(XSize()-1, std::min(rows*(i+1)-1, YSize()-1));
			Chunks.push_back(bbox(p1,p2));
		}
		if (Options::Verbose() > 2)
			std::cout << "Grid " << XSize() << " x " << YSize() << " x " << depth << " broken into " << numchunks << " chunks" << std::endl;
		return Chunks;
	}

	string GeoData::Info() const {
		std::stringstream info;
		info << XSize() << " x " << YSize() << " pixels, origin ("
		     << _Affine[0] << ", " << _Affine[3] << "), resolution ("
		     << _Affine[1] << ", " << _Affine[5] << ")";
		return info.str();
	}

} // namespace clearcube
