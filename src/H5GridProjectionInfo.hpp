#pragma once
#ifndef mf_h5gridprojectioninfo_h
#define mf_h5gridprojectioninfo_h

#include"maskfill_pch.hpp"
#include"Alignment.hpp"
#include"H5Wrappers.hpp"

namespace maskfill {

	//the proj string used for datasets whose coordinates are in degrees
	constexpr const char* GEOGRAPHIC_PROJ_STRING = "+proj=longlat +ellps=WGS84 +datum=WGS84 +no_defs";

	//The grid of a two dimensional dataset, described by CF conventions:
	//the dimension scales attached to dimension 0 and 1 give the y and x coordinates of the cell centers,
	//and either the x coordinate's units are degrees or the dataset's grid_mapping attribute names a CF grid mapping variable
	//throws CFComplianceError if any of that is missing
	Alignment h5DatasetAlignment(hid_t file, hid_t dataset);

	//reads the attributes of a CF grid mapping variable and interprets them with GDAL
	//throws CFComplianceError if they don't describe a CRS
	CoordRef crsFromCFGridMapping(hid_t gridMapping, const std::string& units);
}

#endif
