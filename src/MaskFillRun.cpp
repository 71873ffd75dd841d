#include"MaskFillRun.hpp"
#include"AgentResponse.hpp"
#include"GeotiffMaskFill.hpp"
#include"H5MaskFill.hpp"
#include"MaskFillExceptions.hpp"

namespace maskfill {

	namespace {
		std::optional<std::filesystem::path> maskFillFile(const std::string& inputFile, MaskGridCache& cache, const MaskFillOptions& options) {
			switch (validateInputFile(inputFile)) {
			case InputFormat::geotiff:
				return produceMaskedGeotiff(inputFile, cache, options);
			case InputFormat::hdf5:
				return produceMaskedHdf(inputFile, cache, options);
			}
			throw ParameterError("The input data file must be a GeoTIFF or HDF5 file type");
		}
	}

	int reportMaskFillFailure(const std::exception& e, std::ostream& out)
	{
		MaskFillFailure failure = failureFromException(e);
		CPLError(CE_Failure, CPLE_AppDefined, "%s", e.what());
		out << xmlErrorResponse(failure) << std::endl;
		return failure.exitStatus == MASKFILL_STATUS_INTERNAL ? 1 : failure.exitStatus;
	}

	int runMaskFill(const MaskFillConfig& config, std::ostream& out)
	{
		try {
			validateMaskFillConfig(config);
		}
		catch (const MaskFillException& e) {
			return reportMaskFillFailure(e, out);
		}

		int exitStatus = MASKFILL_STATUS_SUCCESS;
		auto recordFailure = [&](const std::exception& e) {
			int status = reportMaskFillFailure(e, out);
			if (exitStatus == MASKFILL_STATUS_SUCCESS) {
				exitStatus = status;
			}
			};

		MaskGridCache cache{ config.shapeFile, config.options };
		for (const std::string& inputFile : config.inputFiles) {
			try {
				std::optional<std::filesystem::path> masked = maskFillFile(inputFile, cache, config.options);
				out << xmlSuccessResponse(inputFile, config.shapeFile, masked ? masked->string() : std::string()) << std::endl;
				CPLDebug("MASKFILL", "Finished %s", inputFile.c_str());
			}
			catch (const std::exception& e) {
				recordFailure(e);
			}
		}

		try {
			cache.finish();
		}
		catch (const std::exception& e) {
			recordFailure(e);
		}
		return exitStatus;
	}
}
