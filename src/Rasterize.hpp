#pragma once
#ifndef mf_rasterize_h
#define mf_rasterize_h

#include"maskfill_pch.hpp"
#include"Raster.hpp"
#include"Geometry.hpp"

namespace maskfill {

	//which cells count as inside a polygon
	//cellCenter: cells whose center is inside. Centers on a left or top edge (in pixel space) are inside, centers on a right or bottom edge are not
	//allTouched: cellCenter, plus every cell that any ring of the polygon passes through or touches
	enum class RasterizePolicy {
		cellCenter, allTouched
	};

	//accepts "center" or "all_touched", case-insensitive
	//throws ParameterError on anything else
	RasterizePolicy parseRasterizePolicy(const std::string& s);
	std::string rasterizePolicyName(RasterizePolicy policy);

	//Produces a raster on the given alignment whose values are 1 inside the region and 0 outside. Every cell has a value
	//throws ReprojectionError if the CRSs are inconsistent, and FormatError if the alignment's transform is not invertible
	Raster<mask_t> rasterizeRegion(const Alignment& a, const MultiPolygon& region, RasterizePolicy policy = RasterizePolicy::cellCenter);
}

#endif
