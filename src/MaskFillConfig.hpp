#pragma once
#ifndef mf_maskfillconfig_h
#define mf_maskfillconfig_h

#include"maskfill_pch.hpp"
#include"MaskFillOptions.hpp"

namespace maskfill {

	//the kind of container an input file is, judged by its extension
	enum class InputFormat {
		geotiff, hdf5
	};

	//everything the utility was asked to do
	struct MaskFillConfig {
		std::vector<std::string> inputFiles;
		std::string shapeFile;
		MaskFillOptions options;
		bool verbose = false;
		bool help = false;
	};

	//Reads the options from the command line and, if --CONFIG names one, from an INI style file. The command line takes precedence
	//Returns a config with help set, and nothing else guaranteed, if --help was given
	//throws ParameterError for unknown options, values that can't be parsed, an unknown cache mode or boundary policy, and a missing config file
	MaskFillConfig parseMaskFillArguments(int argc, const char* const* argv);

	//the description of the options printed by --help
	std::string maskFillUsage();

	//Checks the options shared by every input file: that an input and a shapefile are given, the shapefile's type, and that the paths exist
	//throws ParameterError, with kind missing for absent values and paths
	void validateMaskFillConfig(const MaskFillConfig& config);

	//Checks that an input file is a local GeoTIFF or HDF5 file that exists, and returns which it is
	//throws ParameterError, with kind missing if the file doesn't exist
	InputFormat validateInputFile(const std::string& path);

	//parses a number, the whole string
	//throws ParameterError if it isn't one
	double parseFillValue(const std::string& s);
}

#endif
