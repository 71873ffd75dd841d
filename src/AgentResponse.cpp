#include"AgentResponse.hpp"
#include"MaskFillExceptions.hpp"
#include<boost/property_tree/ptree.hpp>
#include<boost/property_tree/xml_parser.hpp>

namespace pt = boost::property_tree;

namespace maskfill {

	namespace {
		std::string writeXml(const pt::ptree& tree) {
			std::ostringstream out;
			pt::write_xml(out, tree, pt::xml_writer_make_settings<std::string>(' ', 4));
			return out.str();
		}

		std::string defaultMessageForStatus(int exitStatus) {
			switch (exitStatus) {
			case MASKFILL_STATUS_INVALID_PARAMETER:
				return "Incorrect parameter specified for given dataset(s).";
			case MASKFILL_STATUS_MISSING_PARAMETER:
				return "No parameter value(s) specified for given dataset(s).";
			case MASKFILL_STATUS_NO_MATCHING_DATA:
				return "No data found that matched the subset constraints.";
			default:
				return "An internal error occurred.";
			}
		}
	}

	MaskFillFailure failureFromException(const std::exception& e)
	{
		if (dynamic_cast<const CFComplianceError*>(&e)) {
			return { MASKFILL_STATUS_INVALID_PARAMETER, "The given data file does not follow CF conventions and cannot be mask filled" };
		}
		if (const ParameterError* pe = dynamic_cast<const ParameterError*>(&e)) {
			int status = pe->kind() == ParameterError::Kind::missing ? MASKFILL_STATUS_MISSING_PARAMETER : MASKFILL_STATUS_INVALID_PARAMETER;
			return { status, e.what() };
		}
		return { MASKFILL_STATUS_INTERNAL, e.what() };
	}

	std::string errorCodeForStatus(int exitStatus)
	{
		switch (exitStatus) {
		case MASKFILL_STATUS_INVALID_PARAMETER:
			return "InvalidParameterValue";
		case MASKFILL_STATUS_MISSING_PARAMETER:
			return "MissingParameterValue";
		case MASKFILL_STATUS_NO_MATCHING_DATA:
			return "NoMatchingData";
		default:
			return "InternalError";
		}
	}

	std::string xmlSuccessResponse(const std::string& inputFile, const std::string& shapeFile, const std::string& outputFile)
	{
		pt::ptree tree;
		pt::ptree& response = tree.add("ns2:agentResponse", "");
		response.add("<xmlattr>.xmlns:ns2", "http://eosdis.nasa.gov/esi/rsp/i");
		response.add("downloadUrls", outputFile);
		response.add("processInfo.message",
			"INFILE = " + inputFile + ", SHAPEFILE = " + shapeFile + ", OUTFILE = " + outputFile);
		return writeXml(tree);
	}

	std::string xmlErrorResponse(const MaskFillFailure& failure)
	{
		pt::ptree tree;
		pt::ptree& exception = tree.add("iesi:Exception", "");
		exception.add("<xmlattr>.xmlns:iesi", "http://eosdis.nasa.gov/esi/rsp/i");
		exception.add("<xmlattr>.xmlns:xsi", "http://www.w3.org/2001/XMLSchema-instance");
		exception.add("<xmlattr>.xmlns:esi", "http://eosdis.nasa.gov/esi/rsp");
		exception.add("<xmlattr>.xmlns:ssw", "http://newsroom.gsfc.nasa.gov/esi/rsp/ssw");
		exception.add("<xmlattr>.xmlns:eesi", "http://eosdis.nasa.gov/esi/rsp/e");
		exception.add("<xmlattr>.xsi:schemaLocation",
			"http://eosdis.nasa.gov/esi/rsp/i http://newsroom.gsfc.nasa.gov/esi/8.1/schemas/ESIAgentResponseInternal.xsd");
		exception.add("Code", errorCodeForStatus(failure.exitStatus));

		std::string message = failure.message.empty() ? defaultMessageForStatus(failure.exitStatus) : failure.message;
		if (failure.exitStatus != MASKFILL_STATUS_INTERNAL) {
			message += " MaskFillUtility failed with code " + std::to_string(failure.exitStatus);
		}
		exception.add("Message", message);
		return writeXml(tree);
	}
}
