#include"MaskFillExceptions.hpp"

namespace maskfill {
	MaskFillException::MaskFillException(const std::string& error) : std::runtime_error(error) {}
	FormatError::FormatError(const std::string& error) : MaskFillException(error) {}
	CFComplianceError::CFComplianceError(const std::string& error) : FormatError(error) {}
	GeometryError::GeometryError(const std::string& error) : MaskFillException(error) {}
	ReprojectionError::ReprojectionError(const std::string& error) : MaskFillException(error) {}
	IOError::IOError(const std::string& error) : MaskFillException(error) {}

	ParameterError::ParameterError(const std::string& error, Kind kind) : MaskFillException(error), _kind(kind) {}
	ParameterError::Kind ParameterError::kind() const
	{
		return _kind;
	}

	OutsideGridException::OutsideGridException(const std::string& error) : std::out_of_range(error) {}
}
