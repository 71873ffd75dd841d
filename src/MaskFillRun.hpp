#pragma once
#ifndef mf_maskfillrun_h
#define mf_maskfillrun_h

#include"maskfill_pch.hpp"
#include"MaskFillConfig.hpp"

namespace maskfill {

	//Writes the Exception document for e to out and logs it
	//Returns the exit status for the failure; failures with no specific status return 1
	int reportMaskFillFailure(const std::exception& e, std::ostream& out);

	//Validates the config, then mask fills every input file in order with one shared mask grid cache
	//One agentResponse or Exception document is written to out per input file. A file that fails doesn't stop the ones after it
	//If the config itself is invalid, a single Exception document is written and nothing is processed
	//Returns 0 if everything succeeded, and otherwise the exit status of the first failure
	int runMaskFill(const MaskFillConfig& config, std::ostream& out);
}

#endif
