#include"MaskFillConfig.hpp"
#include"MaskFillExceptions.hpp"
#include<fstream>
#include<boost/program_options.hpp>

namespace po = boost::program_options;

namespace maskfill {

	namespace {
		const std::vector<std::string> GEOTIFF_EXTENSIONS = { ".tif", ".tiff" };
		const std::vector<std::string> HDF5_EXTENSIONS = { ".h5", ".hdf5", ".he5" };
		const std::vector<std::string> SHAPE_EXTENSIONS = { ".shp", ".geojson", ".json" };

		po::options_description fileOptions() {
			po::options_description desc("Options");
			desc.add_options()
				("FILE_URLS", po::value<std::vector<std::string>>()->multitoken(), "One or more GeoTIFF (.tif, .tiff) or HDF5 (.h5, .hdf5, .he5) files to mask fill")
				("SHAPEFILE", po::value<std::string>(), "The region to keep, as a shapefile (.shp) or GeoJSON (.geojson, .json)")
				("OUTPUT_DIR", po::value<std::string>()->default_value("."), "The directory to write output to")
				("CACHE_DIR", po::value<std::string>(), "The directory to keep mask grids in. Defaults to the output directory")
				("MASK_GRID_CACHE", po::value<std::string>()->default_value("ignore_and_delete"),
					"ignore_and_delete | ignore_and_save | use_cache | use_and_save | use_cache_delete | MaskGrid_Only")
				("DEFAULT_FILL", po::value<std::string>()->default_value("-9999"), "The fill value for data that doesn't specify its own")
				("BOUNDARY", po::value<std::string>()->default_value("center"),
					"center: keep cells whose center is inside the region\nall_touched: keep every cell the region touches")
				("VERBOSE", po::bool_switch(), "Print debugging information to stderr")
				;
			return desc;
		}

		po::options_description commandLineOptions() {
			po::options_description desc;
			desc.add(fileOptions());
			desc.add_options()
				("CONFIG", po::value<std::string>(), "An INI style file with any of the options above, written as NAME=value")
				("help,h", "Print this message")
				;
			return desc;
		}

		bool isRemote(const std::string& path) {
			return path.find("://") != std::string::npos;
		}

		//case-insensitive
		bool hasExtension(const std::string& path, const std::vector<std::string>& extensions) {
			std::string ext = std::filesystem::path(path).extension().string();
			return std::any_of(extensions.begin(), extensions.end(),
				[&](const std::string& e) {return EQUAL(ext.c_str(), e.c_str()); });
		}

		void checkExists(const std::string& path) {
			std::error_code ec;
			if (!std::filesystem::exists(path, ec)) {
				throw ParameterError("The path " + path + " does not exist", ParameterError::Kind::missing);
			}
		}
	}

	MaskFillConfig parseMaskFillArguments(int argc, const char* const* argv)
	{
		po::variables_map vm;
		try {
			po::store(po::parse_command_line(argc, argv, commandLineOptions()), vm);
			if (vm.count("help")) {
				MaskFillConfig out;
				out.help = true;
				return out;
			}
			if (vm.count("CONFIG")) {
				std::string configFile = vm["CONFIG"].as<std::string>();
				std::ifstream ifs{ configFile };
				if (!ifs) {
					throw ParameterError("Unable to open the config file " + configFile, ParameterError::Kind::missing);
				}
				po::store(po::parse_config_file(ifs, fileOptions()), vm);
			}
			po::notify(vm);
		}
		catch (const po::error& e) {
			throw ParameterError(e.what());
		}

		MaskFillConfig out;
		if (vm.count("FILE_URLS")) {
			out.inputFiles = vm["FILE_URLS"].as<std::vector<std::string>>();
		}
		if (vm.count("SHAPEFILE")) {
			out.shapeFile = vm["SHAPEFILE"].as<std::string>();
		}
		out.options.outputDir = vm["OUTPUT_DIR"].as<std::string>();
		if (vm.count("CACHE_DIR")) {
			out.options.cacheDir = vm["CACHE_DIR"].as<std::string>();
		}
		out.options.cacheMode = parseCacheMode(vm["MASK_GRID_CACHE"].as<std::string>());
		out.options.defaultFill = parseFillValue(vm["DEFAULT_FILL"].as<std::string>());
		out.options.policy = parseRasterizePolicy(vm["BOUNDARY"].as<std::string>());
		out.verbose = vm["VERBOSE"].as<bool>();
		return out;
	}

	std::string maskFillUsage()
	{
		std::ostringstream out;
		out << "Usage: maskfill --FILE_URLS <file>... --SHAPEFILE <file> [options]\n\n"
			<< "Replaces the values outside of a region with a fill value, writing <stem>_mf<ext> to the output directory\n\n"
			<< commandLineOptions();
		return out.str();
	}

	void validateMaskFillConfig(const MaskFillConfig& config)
	{
		if (config.inputFiles.empty()) {
			throw ParameterError("An input data file is required for the mask fill utility", ParameterError::Kind::missing);
		}
		if (config.shapeFile.empty()) {
			throw ParameterError("A shapefile is required for the mask fill utility", ParameterError::Kind::missing);
		}
		if (isRemote(config.shapeFile)) {
			throw ParameterError("The shapefile must be a local path; " + config.shapeFile + " is remote");
		}
		if (!hasExtension(config.shapeFile, SHAPE_EXTENSIONS)) {
			throw ParameterError("The input shapefile must be a .shp, .geojson, or .json file type");
		}
		checkExists(config.shapeFile);
		checkExists(config.options.outputDir.string());
	}

	InputFormat validateInputFile(const std::string& path)
	{
		if (isRemote(path)) {
			throw ParameterError("The input data file must be a local path; " + path + " is remote");
		}
		std::optional<InputFormat> format;
		if (hasExtension(path, GEOTIFF_EXTENSIONS)) {
			format = InputFormat::geotiff;
		}
		else if (hasExtension(path, HDF5_EXTENSIONS)) {
			format = InputFormat::hdf5;
		}
		else {
			throw ParameterError("The input data file must be a GeoTIFF or HDF5 file type");
		}
		checkExists(path);
		return *format;
	}

	double parseFillValue(const std::string& s)
	{
		size_t used = 0;
		double out = 0;
		try {
			out = std::stod(s, &used);
		}
		catch (const std::logic_error&) {
			throw ParameterError("The default fill value must be a number");
		}
		if (used != s.size()) {
			throw ParameterError("The default fill value must be a number");
		}
		return out;
	}
}
