#pragma once
#ifndef mf_region_h
#define mf_region_h

#include"maskfill_pch.hpp"
#include"Geometry.hpp"

namespace maskfill {

	//The union of every polygon in a vector file
	class Region : public MultiPolygon {
	public:
		Region() = default;
		explicit Region(const CoordRef& crs);

		//Reads every feature of every layer of a GDAL-readable vector file (shapefile, GeoJSON, etc)
		//The CRS of the region is the CRS of the first layer; other layers are reprojected into it
		//Features with no geometry or an empty one are skipped
		//throws FormatError if the file can't be opened, and GeometryError if any geometry isn't polygonal or is malformed
		explicit Region(const std::string& filename);

	private:
		void _addGeometry(const OGRGeometry& geom, const CoordRef& layerCrs);
	};
}

#endif
