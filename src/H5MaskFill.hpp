#pragma once
#ifndef mf_h5maskfill_h
#define mf_h5maskfill_h

#include"maskfill_pch.hpp"
#include"MaskFillCaching.hpp"
#include"H5Wrappers.hpp"

namespace maskfill {

	//Writes a copy of the HDF5 file at inputPath to maskedFilePath(inputPath, options.outputDir), with every two dimensional dataset mask filled
	//Datasets that aren't two dimensional or aren't numeric are copied unchanged
	//The grid of each dataset comes from its CF metadata; see h5DatasetAlignment
	//The observed_max, observed_min, and observed_mean attributes are recomputed, over the values not equal to the fill value, where they exist
	//Returns the output path, or nothing if the cache mode is MaskGrid_Only, in which case the input is only read
	//throws CFComplianceError, FormatError, GeometryError, ReprojectionError, IOError, and ParameterError
	std::optional<std::filesystem::path> produceMaskedHdf(const std::string& inputPath, MaskGridCache& cache, const MaskFillOptions& options);

	//the same, with a cache for the region at regionPath that lives only as long as this call
	std::optional<std::filesystem::path> produceMaskedHdf(const std::string& inputPath, const std::string& regionPath, const MaskFillOptions& options);

	//the dataset's _FillValue attribute, or defaultFill converted to its type if it doesn't have one
	template<class T>
	T h5FillValue(hid_t dataset, double defaultFill);
}

#endif
