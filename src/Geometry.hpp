#pragma once
#ifndef mf_geometry_h
#define mf_geometry_h

#include"maskfill_pch.hpp"
#include"CoordRef.hpp"
#include"CoordTransform.hpp"

namespace maskfill {

	class Geometry {
	public:
		const CoordRef& crs() const;
		void setCrs(const CoordRef& crs);

		//throws ReprojectionError if the geometry can't be moved into newCrs
		void projectInPlace(const CoordRef& newCrs);
		virtual void projectInPlace(const CoordTransform& transform) = 0;

		virtual ~Geometry() = default;

	protected:
		CoordRef _crs;
		Geometry() = default;
		Geometry(const Geometry&) = default;
		Geometry& operator=(const Geometry&) = default;
	};

	//A polygon with an outer ring and any number of holes
	//Every ring must be closed, have at least four vertices, and contain only finite coordinates,
	//and the outer ring must enclose some area. Violations throw GeometryError
	class Polygon : public Geometry {
	public:
		Polygon() = default;
		Polygon(const OGRGeometry& geom);
		Polygon(const OGRGeometry& geom, const CoordRef& crs);
		Polygon(const CoordXYVector& outerRing);
		Polygon(const CoordXYVector& outerRing, const CoordRef& crs);

		void addInnerRing(const CoordXYVector& innerRing);

		const CoordXYVector& getOuterRing() const;
		int nInnerRings() const;
		const CoordXYVector& getInnerRing(int index) const;

		//the crossing-number test; points on the left or lower edge of the polygon are inside, points on the right or upper edge are not
		bool containsPoint(coord_t x, coord_t y) const;
		bool containsPoint(CoordXY xy) const;

		void projectInPlace(const CoordTransform& transform) override;
		using Geometry::projectInPlace;

	private:
		CoordXYVector _outerRing;
		std::vector<CoordXYVector> _innerRings;

		static coord_t _areaFromRing(const CoordXYVector& ring);
		static void _validateRing(const CoordXYVector& ring);
		void _sharedConstructorFromGdal(const OGRGeometry& geom);
	};

	class MultiPolygon : public Geometry {
	public:
		MultiPolygon() = default;
		explicit MultiPolygon(const CoordRef& crs);
		MultiPolygon(const OGRGeometry& geom);
		MultiPolygon(const OGRGeometry& geom, const CoordRef& crs);

		size_t nPolygon() const;
		bool isEmpty() const;

		std::vector<Polygon>::iterator begin();
		std::vector<Polygon>::iterator end();
		std::vector<Polygon>::const_iterator begin() const;
		std::vector<Polygon>::const_iterator end() const;

		//throws ReprojectionError if the polygon's CRS is inconsistent with this one
		void addPolygon(const Polygon& polygon);

		bool containsPoint(coord_t x, coord_t y) const;
		bool containsPoint(CoordXY xy) const;

		void projectInPlace(const CoordTransform& transform) override;
		using Geometry::projectInPlace;

	protected:
		std::vector<Polygon> _polygons;

	private:
		void _sharedConstructorFromGdal(const OGRGeometry& geom, const CoordRef& crs);
	};
}

#endif
