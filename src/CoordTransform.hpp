#pragma once
#ifndef mf_coordtransform_h
#define mf_coordtransform_h

#include"maskfill_pch.hpp"
#include"CoordRef.hpp"
#include"Coordinate.hpp"

namespace maskfill {

	//A transformation between the horizontal parts of two CRSs. If the two are consistent, this is a no-op
	class CoordTransform {
	public:
		CoordTransform() = default;
		CoordTransform(const CoordRef& src, const CoordRef& dst);

		//these throw ReprojectionError if any coordinate fails to transform
		void transformXY(CoordXYVector& points) const;
		CoordXY transformSingleXY(coord_t x, coord_t y) const;

		bool isNoOp() const;

		PJ* getPtr();
		const PJ* getPtr() const;
		const SharedPJ& getSharedPtr() const;

		const CoordRef& src() const;
		const CoordRef& dst() const;

	private:
		SharedPJ _tr;
		CoordRef _src, _dst;
		bool _needXYConv = false;

		static void _checkFinite(coord_t x, coord_t y);
	};

	//PJ objects are expensive to create, so the first transform between any two CRSs is kept around
	class CoordTransformFactory {
	public:
		static const CoordTransform& getTransform(const CoordRef& src, const CoordRef& dst);

	private:
		using CoordRefPair = std::pair<CoordRef, CoordRef>;
		struct CoordRefPairHasher {
			size_t operator()(const CoordRefPair& p) const;
		};
		struct CoordRefPairEqual {
			bool operator()(const CoordRefPair& a, const CoordRefPair& b) const;
		};

		static std::shared_mutex _mut;
		static std::unordered_map<CoordRefPair, std::unique_ptr<CoordTransform>, CoordRefPairHasher, CoordRefPairEqual> _cache;
	};
}

#endif
