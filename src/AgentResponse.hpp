#pragma once
#ifndef mf_agentresponse_h
#define mf_agentresponse_h

#include"maskfill_pch.hpp"

namespace maskfill {

	//exit statuses of the utility, as understood by the ESI agent
	constexpr int MASKFILL_STATUS_SUCCESS = 0;
	constexpr int MASKFILL_STATUS_INVALID_PARAMETER = 1;
	constexpr int MASKFILL_STATUS_MISSING_PARAMETER = 2;
	constexpr int MASKFILL_STATUS_NO_MATCHING_DATA = 3;
	//for errors that don't correspond to one of the statuses above
	constexpr int MASKFILL_STATUS_INTERNAL = -1;

	//the reason a file could not be mask filled
	struct MaskFillFailure {
		int exitStatus = MASKFILL_STATUS_INTERNAL;
		std::string message;
	};

	//classifies an exception thrown while mask filling a file
	MaskFillFailure failureFromException(const std::exception& e);

	//InvalidParameterValue, MissingParameterValue, NoMatchingData, or InternalError
	std::string errorCodeForStatus(int exitStatus);

	//the agentResponse document reporting a successful mask fill
	//outputFile is empty when no output was written
	std::string xmlSuccessResponse(const std::string& inputFile, const std::string& shapeFile, const std::string& outputFile);

	//the Exception document reporting a failure; an empty message is replaced by the default message for the status
	std::string xmlErrorResponse(const MaskFillFailure& failure);
}

#endif
