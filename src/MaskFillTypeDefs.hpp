#pragma once
#ifndef mf_maskfilltypedefs_h
#define mf_maskfilltypedefs_h

#include<cstdint>

namespace maskfill {

	using coord_t = double;
	using cell_t = int64_t;
	using rowcol_t = int32_t;
	using band_t = int32_t;
	using mask_t = uint8_t;
	constexpr coord_t MASKFILL_EPSILON = 0.0001;
	constexpr double MASKFILL_DEFAULT_FILL = -9999.;
}

#endif
