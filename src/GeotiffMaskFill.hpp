#pragma once
#ifndef mf_geotiffmaskfill_h
#define mf_geotiffmaskfill_h

#include"maskfill_pch.hpp"
#include"MaskFillCaching.hpp"

namespace maskfill {

	//Writes a copy of the raster at inputPath to maskedFilePath(inputPath, options.outputDir), with every cell outside the region
	//replaced by the fill value: the nodata value of the first band if it has one, otherwise options.defaultFill
	//The output uses the input's driver and metadata, and only appears once it's completely written
	//Returns the output path, or nothing if the cache mode is MaskGrid_Only
	//throws FormatError, GeometryError, ReprojectionError, IOError, and ParameterError
	std::optional<std::filesystem::path> produceMaskedGeotiff(const std::string& inputPath, MaskGridCache& cache, const MaskFillOptions& options);

	//the same, with a cache for the region at regionPath that lives only as long as this call
	std::optional<std::filesystem::path> produceMaskedGeotiff(const std::string& inputPath, const std::string& regionPath, const MaskFillOptions& options);

	//the fill value for a raster: the nodata value of its first band, else defaultFill converted to its type
	//throws FormatError if it has no bands, and ParameterError if defaultFill can't be represented as T
	template<class T>
	T geotiffFillValue(GDALDataset& ds, double defaultFill);
}

#endif
