#pragma once
#ifndef mf_maskfillexceptions_h
#define mf_maskfillexceptions_h

#include<stdexcept>
#include<string>

namespace maskfill {

	class MaskFillException : public std::runtime_error {
	public:
		MaskFillException(const std::string& error);
	};

	//the raster or vector container could not be decoded
	class FormatError : public MaskFillException {
	public:
		FormatError(const std::string& error);
	};

	//an HDF5 file is missing the CF metadata needed to locate its grid
	class CFComplianceError : public FormatError {
	public:
		CFComplianceError(const std::string& error);
	};

	class GeometryError : public MaskFillException {
	public:
		GeometryError(const std::string& error);
	};

	class ReprojectionError : public MaskFillException {
	public:
		ReprojectionError(const std::string& error);
	};

	class IOError : public MaskFillException {
	public:
		IOError(const std::string& error);
	};

	class ParameterError : public MaskFillException {
	public:
		enum class Kind {
			invalid, missing
		};
		ParameterError(const std::string& error, Kind kind = Kind::invalid);
		Kind kind() const;
	private:
		Kind _kind;
	};

	class OutsideGridException : public std::out_of_range {
	public:
		OutsideGridException(const std::string& error);
	};
}

#endif
