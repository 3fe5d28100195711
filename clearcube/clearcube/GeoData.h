#ifndef CLEARCUBE_GEODATA_H
#define CLEARCUBE_GEODATA_H

#include <vector>
#include <string>

#include <boost/geometry/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

class GDALDataset;

namespace clearcube {
	typedef boost::geometry::model::d2::point_xy<float> point;
	typedef boost::geometry::model::box<point> bbox;
	//! Ordered acquisition timestamps of a cube
	typedef std::vector<boost::posix_time::ptime> TimeAxis;

	//! Pixel grid geometry shared by every array of a cube
	/*!
		GeoData holds the size of the grid, the affine geotransform and the
		projection. It knows how to break the grid into chunks (blocks of
		rows) which is the unit all lazy evaluation is done on.
	*/
	class GeoData {
	public:
		//! \name Constructors/Destructor
		//! Default constructor (empty grid)
		GeoData() : _XSize(0), _YSize(0), _Projection("") {
			for (int i=0;i<6;i++) _Affine[i] = 0;
			_Affine[1] = 1;
			_Affine[5] = -1;
		}
		//! Grid of given size, with geotransform and projection
		GeoData(unsigned int xsz, unsigned int ysz, const double affine[6], std::string projection="");
		//! Grid of an existing GDAL dataset
		explicit GeoData(GDALDataset* ds);

		//! \name Spatial Information
		//! X Size of grid, in pixels
		unsigned int XSize() const { return _XSize; }
		//! Y Size of grid, in pixels
		unsigned int YSize() const { return _YSize; }
		//! Total number of pixels
		unsigned long Size() const { return (unsigned long)XSize() * YSize(); }
		//! Projection (WKT)
		std::string Projection() const { return _Projection; }
		//! Geotransform coefficient
		double Affine(int i) const { return _Affine[i]; }
		//! Copy geotransform into array of 6
		void GetAffine(double affine[6]) const { for (int i=0;i<6;i++) affine[i] = _Affine[i]; }
		//! Geolocated coordinates of a pixel location
		point GeoLoc(float xloc, float yloc) const;
		//! Coordinates of top left
		point TopLeft() const { return GeoLoc(0,0); }
		//! Coordinates of bottom right
		point LowerRight() const { return GeoLoc(XSize(),YSize()); }
		//! Area of a single pixel, in projection units
		double PixelArea() const;

		//! Do two grids have the same size
		bool SameGrid(const GeoData& grid) const { return (_XSize == grid._XSize) && (_YSize == grid._YSize); }

		//! \name Processing functions
		//! Box covering the whole grid
		bbox Extent() const { return bbox(point(0,0), point(XSize()-1, YSize()-1)); }
		//! Break up grid into chunks (bytes per value and number of layers determine rows per chunk)
		std::vector<bbox> Chunk(unsigned int bytes=4, unsigned int depth=1) const;

		//! Grid description
		std::string Info() const;

	protected:
		unsigned int _XSize;
		unsigned int _YSize;
		double _Affine[6];
		std::string _Projection;
	}; //class GeoData

	//! Width of a chunk, in pixels
	inline int ChunkWidth(const bbox& chunk) { return (int)(chunk.max_corner().x() - chunk.min_corner().x()) + 1; }
	//! Height of a chunk, in pixels
	inline int ChunkHeight(const bbox& chunk) { return (int)(chunk.max_corner().y() - chunk.min_corner().y()) + 1; }

} // namespace clearcube

#endif
