#pragma once
#ifndef mf_maskfillcaching_h
#define mf_maskfillcaching_h

#include"maskfill_pch.hpp"
#include"MaskFillOptions.hpp"
#include"Region.hpp"
#include"Raster.hpp"

namespace maskfill {

	//A stable identifier for the mask of the given region file on the given grid
	std::string maskGridId(const Alignment& a, const std::string& regionPath, RasterizePolicy policy);

	//Produces mask grids for one region file, reusing them in memory and, depending on the cache mode, on disk
	//Cached masks are single band Byte GeoTIFFs named <id>.tif in the cache directory
	class MaskGridCache {
	public:
		MaskGridCache(const std::string& regionPath, const MaskFillOptions& options);

		//the mask of the region on the given grid. The region is read the first time a mask has to be computed
		//throws the errors of Region's constructor and of rasterizeRegion
		const Raster<mask_t>& getMask(const Alignment& a);

		//saves the masks computed so far, or deletes the cached masks that were used, depending on the cache mode
		//throws IOError if a mask can't be saved
		void finish();

		std::filesystem::path pathForId(const std::string& id) const;
		CacheMode mode() const;

	private:
		std::string _regionPath;
		std::filesystem::path _cacheDir;
		CacheMode _mode;
		RasterizePolicy _policy;

		std::optional<Region> _region;
		std::unordered_map<std::string, Raster<mask_t>> _masks;
		std::vector<std::string> _computed;
		std::vector<std::string> _loaded;

		std::optional<Raster<mask_t>> _loadFromDisk(const std::string& id, const Alignment& a) const;
		Raster<mask_t> _compute(const Alignment& a);
	};
}

#endif
