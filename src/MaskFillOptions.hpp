#pragma once
#ifndef mf_maskfilloptions_h
#define mf_maskfilloptions_h

#include"maskfill_pch.hpp"
#include"MaskFillTypeDefs.hpp"
#include"Rasterize.hpp"

namespace maskfill {

	//how mask grids are reused and kept between runs
	enum class CacheMode {
		ignoreAndDelete, //always compute masks, never save them
		ignoreAndSave, //always compute masks, save them
		useCache, //use saved masks when available, save new ones
		useAndSave, //same as useCache
		useCacheDelete, //use saved masks when available, delete the ones used afterwards
		maskGridOnly //compute and save masks, but don't produce any output
	};

	//case-insensitive
	//throws ParameterError if the name isn't one of the modes
	CacheMode parseCacheMode(const std::string& s);
	std::string cacheModeName(CacheMode mode);

	bool cacheModeLoads(CacheMode mode);
	bool cacheModeSaves(CacheMode mode);

	//everything about a mask fill run besides the input files
	struct MaskFillOptions {
		std::filesystem::path outputDir = ".";
		std::filesystem::path cacheDir; //empty means the output directory
		CacheMode cacheMode = CacheMode::ignoreAndDelete;
		double defaultFill = MASKFILL_DEFAULT_FILL;
		RasterizePolicy policy = RasterizePolicy::cellCenter;

		std::filesystem::path effectiveCacheDir() const;
	};
}

#endif
