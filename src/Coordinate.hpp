#pragma once
#ifndef MF_COORDINATE_H
#define MF_COORDINATE_H

#include<vector>
#include"MaskFillTypeDefs.hpp"

namespace maskfill {
	struct CoordXY {
		coord_t x, y;
		CoordXY() : x(0), y(0) {}
		CoordXY(coord_t x, coord_t y) : x(x), y(y) {}
		bool operator==(const CoordXY& other) const = default;
	};

	using CoordXYVector = std::vector<CoordXY>;
}

#endif
