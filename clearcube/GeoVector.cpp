#include <clearcube/GeoVector.h>
#include <clearcube/Options.h>
#include <clearcube/Utils.h>

#include <gdal/gdal_priv.h>
#include <gdal/ogrsf_frmts.h>

#include <stdexcept>

namespace clearcube {
    using std::string;
    using std::vector;

	GeoVector::GeoVector(string filename, string where) : _Source(filename) {
		if (where != "") _Source += " where " + where;
		GDALDataset* ds = (GDALDataset*)GDALOpenEx(filename.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, NULL, NULL, NULL);
		if (ds == NULL) throw std::runtime_error(filename + ": " + string(CPLGetLastErrorMsg()));
		boost::shared_ptr<GDALDataset> dsptr(ds, GDALClose);
		OGRLayer* layer = ds->GetLayer(0);
		if (layer == NULL) throw std::runtime_error(filename + ": no vector layer");
		if (where != "" && layer->SetAttributeFilter(where.c_str()) != OGRERR_NONE)
			throw std::invalid_argument(filename + ": invalid attribute filter '" + where + "'");
		layer->ResetReading();
		OGRFeature* feature;
		while ((feature = layer->GetNextFeature()) != NULL) {
			OGRGeometry* geom = feature->GetGeometryRef();
			OGRGeometry* copy = (geom == NULL) ? NULL : geom->clone();
			OGRFeature::DestroyFeature(feature);
			if (copy != NULL) AddGeometry(copy);
		}
		if (Options::Verbose() > 1)
			std::cout << _Source << ": " << NumGeometries() << " polygons" << std::endl;
	}

	GeoVector GeoVector::FromWKT(const vector<string>& wkt) {
		GeoVector geoms;
		geoms._Source = "WKT";
		for (unsigned int i=0; i<wkt.size(); i++) {
			OGRGeometry* geom = NULL;
			OGRErr err = OGRGeometryFactory::createFromWkt(wkt[i].c_str(), NULL, &geom);
			if (err != OGRERR_NONE || geom == NULL)
				throw std::invalid_argument("invalid WKT geometry: " + wkt[i]);
			geoms.AddGeometry(geom);
		}
		return geoms;
	}

	GeoVector& GeoVector::AddGeometry(OGRGeometry* geom) {
		boost::shared_ptr<OGRGeometry> ptr(geom, OGRGeometryFactory::destroyGeometry);
		OGRwkbGeometryType type = wkbFlatten(geom->getGeometryType());
		if (type != wkbPolygon && type != wkbMultiPolygon) {
			throw std::invalid_argument(_Source + ": only polygons can be rasterized, got "
				+ string(OGRGeometryTypeToName(type)));
		}
		_Geometries.push_back(ptr);
		return *this;
	}

	OGRGeometry* GeoVector::Geometry(unsigned int i) const {
		if (i >= _Geometries.size())
			throw std::out_of_range(_Source + ": geometry " + to_string(i) + " out of range");
		return _Geometries[i].get();
	}

} // namespace clearcube
