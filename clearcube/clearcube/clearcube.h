#ifndef CLEARCUBE_CLEARCUBE_H
#define CLEARCUBE_CLEARCUBE_H

#include <clearcube/Options.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Utils.h>
#include <clearcube/GeoData.h>
#include <clearcube/GeoMask.h>
#include <clearcube/GeoArray.h>
#include <clearcube/GeoRaster.h>
#include <clearcube/RasterCube.h>
#include <clearcube/QualityScheme.h>
#include <clearcube/GeoVector.h>
#include <clearcube/GeoAlgorithms.h>
#include <clearcube/TimeFilter.h>
#include <clearcube/TemporalStats.h>

#include <gdal/gdal_priv.h>

#endif
