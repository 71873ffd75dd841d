#pragma once
#ifndef mf_coordref_h
#define mf_coordref_h

#include"maskfill_pch.hpp"
#include"ProjWrappers.hpp"

namespace maskfill {

	//A coordinate reference system. A default-constructed CoordRef is 'unknown', and is considered consistent with every other CRS
	class CoordRef {
	public:
		CoordRef() = default;

		//accepts anything proj_create understands (WKT, PROJ strings, AUTHORITY:CODE), or a bare EPSG code
		//throws ReprojectionError if the string can't be interpreted
		CoordRef(const std::string& s);
		CoordRef(const char* s);
		CoordRef(const OGRSpatialReference* osr);

		bool isEmpty() const;

		std::string getCompleteWKT() const;
		std::string getProj4() const;
		std::string getShortName() const;

		bool isConsistentHoriz(const CoordRef& other) const;

		const SharedPJ& getSharedPtr() const;

		bool equalForHash(const CoordRef& other) const;

	private:
		SharedPJ _p;
		std::string _wkt;

		void _initFromString(const std::string& s);
	};

	struct CoordRefHasher {
		size_t operator()(const CoordRef& c) const;
	};
}

#endif
