#pragma once
#ifndef mf_gdalwrappers_h
#define mf_gdalwrappers_h

#include"maskfill_pch.hpp"

namespace maskfill {

	//GDALAllRegister is not safe to call from several threads at once
	void gdalAllRegisterThreadSafe();

	struct GdalDatasetCloser {
		void operator()(GDALDataset* p) const;
	};
	using UniqueGdalDataset = std::unique_ptr<GDALDataset, GdalDatasetCloser>;
	UniqueGdalDataset makeUniqueGdalDataset(GDALDataset* p);

	struct GdalStringFreer {
		void operator()(char* p) const;
	};
	using UniqueGdalString = std::unique_ptr<char, GdalStringFreer>;
	UniqueGdalString exportToWktWrapper(const OGRSpatialReference& osr);

	//these return a null pointer if the file can't be opened
	UniqueGdalDataset rasterGDALWrapper(const std::string& filename);
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename);

	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, int nband, GDALDataType gdt);
	UniqueGdalDataset gdalCreateCopyWrapper(GDALDriver* driver, const std::string& file, GDALDataset* source);

	//returns the message of the most recent CPLError, or an empty string
	std::string lastGdalErrorMessage();
}

#endif
