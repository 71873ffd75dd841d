#include"maskfill_pch.hpp"
#include"MaskFillConfig.hpp"
#include"MaskFillExceptions.hpp"
#include"MaskFillRun.hpp"
#include<iostream>

using namespace maskfill;

namespace {
	//standard output is reserved for the agent responses
	void CPL_STDCALL stderrErrorHandler(CPLErr level, CPLErrorNum, const char* msg) {
		switch (level) {
		case CE_Debug:
			std::cerr << "DEBUG: " << msg << '\n';
			break;
		case CE_Warning:
			std::cerr << "WARNING: " << msg << '\n';
			break;
		case CE_None:
			std::cerr << msg << '\n';
			break;
		default:
			std::cerr << "ERROR: " << msg << '\n';
			break;
		}
	}
}

int main(int argc, char* argv[]) {
	CPLSetErrorHandler(stderrErrorHandler);

	MaskFillConfig config;
	try {
		config = parseMaskFillArguments(argc, argv);
	}
	catch (const MaskFillException& e) {
		return reportMaskFillFailure(e, std::cout);
	}
	if (config.help) {
		std::cout << maskFillUsage() << std::endl;
		return 0;
	}
	if (config.verbose) {
		CPLSetConfigOption("CPL_DEBUG", "MASKFILL");
	}
	return runMaskFill(config, std::cout);
}
