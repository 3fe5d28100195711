#ifndef CLEARCUBE_GEOVECTOR_H
#define CLEARCUBE_GEOVECTOR_H

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

class OGRGeometry;

namespace clearcube {

	//! Ordered set of polygons, already in the CRS of the cube they are applied to
	class GeoVector {
	public:
		//! \name Constructors
		//! Default constructor (no polygons)
		GeoVector() : _Source("empty selection") {}
		//! Polygons read from the first layer of an OGR vector source, optionally filtered on attributes
		explicit GeoVector(std::string filename, std::string where="");

		//! Polygons from WKT strings (POLYGON or MULTIPOLYGON)
		static GeoVector FromWKT(const std::vector<std::string>& wkt);
		//! Single polygon from WKT
		static GeoVector FromWKT(std::string wkt) { return FromWKT(std::vector<std::string>(1, wkt)); }

		//! \name Information
		//! Number of polygons (multipolygons count once)
		unsigned int NumGeometries() const { return _Geometries.size(); }
		//! Where the polygons came from (file and filter, or WKT)
		std::string Source() const { return _Source; }
		//! Geometry i (owned by this GeoVector)
		OGRGeometry* Geometry(unsigned int i) const;

		//! Append a polygon, takes ownership of geom
		GeoVector& AddGeometry(OGRGeometry* geom);

	private:
		std::string _Source;
		std::vector< boost::shared_ptr<OGRGeometry> > _Geometries;
	};

} // namespace clearcube

#endif
