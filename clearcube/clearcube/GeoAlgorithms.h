#ifndef CLEARCUBE_GEOALGORITHMS_H
#define CLEARCUBE_GEOALGORITHMS_H

#include <string>
#include <vector>
#include <map>

#include <clearcube/RasterCube.h>
#include <clearcube/GeoMask.h>
#include <clearcube/GeoVector.h>
#include <clearcube/QualityScheme.h>

namespace clearcube {

	//! Validity mask of every band (true where not the band's no-data value), keyed by band name
	std::map<std::string,GeoMask> ValidityMasks(const RasterCube& cube);

	//! True where the quality code is one of the acceptable labels; unknown labels throw UnknownCategoryError
	GeoMask CategoryMask(const GeoArray& quality, const QualityScheme& scheme, const std::vector<std::string>& labels);

	//! Spatial mask of pixels whose center falls inside any polygon; empty vector throws EmptyGeometryError
	GeoMask Rasterize(const GeoVector& polygons, const GeoData& grid);

	//! Apply validity, quality mask and gain/offset to every band
	RasterCube Clean(const RasterCube& cube, const GeoMask& quality);

	//! Normalized difference (a-b)/(a+b), NaN where a+b is 0 or either input is NaN
	GeoArray NormDiff(const GeoArray& a, const GeoArray& b, std::string desc="");

	//! Modified normalized difference water index
	GeoArray MNDWI(const RasterCube& cube, std::string green="green", std::string swir="swir1");

	//! Normalized difference chlorophyll index
	GeoArray NDCI(const RasterCube& cube, std::string rededge="rededge1", std::string red="red");

	//! Normalized difference vegetation index
	GeoArray NDVI(const RasterCube& cube, std::string nir="nir", std::string red="red");

} // namespace clearcube

#endif
