#include"Geometry.hpp"
#include"MaskFillExceptions.hpp"

namespace maskfill {

    const CoordRef& Geometry::crs() const
    {
        return _crs;
    }
    void Geometry::setCrs(const CoordRef& crs)
    {
        _crs = crs;
    }

    void Geometry::projectInPlace(const CoordRef& newCrs)
    {
        const CoordTransform& transform = CoordTransformFactory::getTransform(_crs, newCrs);
        projectInPlace(transform);
    }

    Polygon::Polygon(const OGRGeometry& geom)
    {
        _sharedConstructorFromGdal(geom);
        setCrs(CoordRef(geom.getSpatialReference()));
    }
    Polygon::Polygon(const OGRGeometry& geom, const CoordRef& crs)
    {
        _sharedConstructorFromGdal(geom);
        setCrs(crs);
    }
    Polygon::Polygon(const CoordXYVector& outerRing)
        : _outerRing(outerRing)
    {
        _validateRing(_outerRing);
        if (_areaFromRing(_outerRing) <= 0) {
            throw GeometryError("Polygon outer ring encloses no area");
        }
    }
    Polygon::Polygon(const CoordXYVector& outerRing, const CoordRef& crs)
        : Polygon(outerRing)
    {
        setCrs(crs);
    }
    void Polygon::addInnerRing(const CoordXYVector& innerRing)
    {
        _validateRing(innerRing);
        _innerRings.push_back(innerRing);
    }
    const CoordXYVector& Polygon::getOuterRing() const {
        return _outerRing;
    }
    int Polygon::nInnerRings() const
    {
        return (int)_innerRings.size();
    }
    const CoordXYVector& Polygon::getInnerRing(int index) const
    {
        return _innerRings.at(index);
    }
    bool Polygon::containsPoint(coord_t x, coord_t y) const
    {
        auto pointInRing = [](const CoordXYVector& ring, coord_t x, coord_t y) {
            bool within = false;
            for (size_t i = 1; i < ring.size(); ++i) {
                const CoordXY& a = ring[i - 1];
                const CoordXY& b = ring[i];
                if (((a.y > y) != (b.y > y)) &&
                    (x < (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x)) {
                    within = !within;
                }
            }
            return within;
            };

        if (!pointInRing(_outerRing, x, y)) {
            return false;
        }
        for (const CoordXYVector& innerRing : _innerRings) {
            if (pointInRing(innerRing, x, y)) {
                return false;
            }
        }
        return true;
    }
    bool Polygon::containsPoint(CoordXY xy) const
    {
        return containsPoint(xy.x, xy.y);
    }
    void Polygon::projectInPlace(const CoordTransform& transform)
    {
        transform.transformXY(_outerRing);
        for (CoordXYVector& innerRing : _innerRings) {
            transform.transformXY(innerRing);
        }
        setCrs(transform.dst());
    }
    coord_t Polygon::_areaFromRing(const CoordXYVector& ring)
    {
        if (ring.size() < 4) { //3 for a triangle, plus the duplicated point
            return 0;
        }
        //shoelace formula
        coord_t area = 0;
        for (size_t i = 1; i < ring.size(); ++i) {
            area += ring[i - 1].x * ring[i].y - ring[i].x * ring[i - 1].y;
        }
        return std::abs(area) / 2.0;
    }
    void Polygon::_validateRing(const CoordXYVector& ring)
    {
        if (ring.size() < 4) {
            throw GeometryError("Polygon rings must have at least four vertices");
        }
        for (const CoordXY& xy : ring) {
            if (!std::isfinite(xy.x) || !std::isfinite(xy.y)) {
                throw GeometryError("Polygon ring contains a non-finite coordinate");
            }
        }
        if (ring.front() != ring.back()) {
            throw GeometryError("Polygon ring is not closed");
        }
    }
    void Polygon::_sharedConstructorFromGdal(const OGRGeometry& geom) {
        if (wkbFlatten(geom.getGeometryType()) != wkbPolygon) {
            throw GeometryError(std::string("Expected a polygon, got ") + geom.getGeometryName());
        }
        const OGRPolygon* gdalPolygon = geom.toPolygon();

        const OGRLinearRing* exteriorRing = gdalPolygon->getExteriorRing();
        if (!exteriorRing) {
            throw GeometryError("Polygon has no exterior ring");
        }
        for (const OGRPoint& point : *exteriorRing) {
            _outerRing.emplace_back(point.getX(), point.getY());
        }
        _validateRing(_outerRing);
        if (_areaFromRing(_outerRing) <= 0) {
            throw GeometryError("Polygon outer ring encloses no area");
        }
        for (int i = 0; i < gdalPolygon->getNumInteriorRings(); i++) {
            const OGRLinearRing* innerRing = gdalPolygon->getInteriorRing(i);
            CoordXYVector innerCoords;
            for (const OGRPoint& point : *innerRing) {
                innerCoords.emplace_back(point.getX(), point.getY());
            }
            addInnerRing(innerCoords);
        }
    }

    MultiPolygon::MultiPolygon(const CoordRef& crs)
    {
        setCrs(crs);
    }
    MultiPolygon::MultiPolygon(const OGRGeometry& geom)
    {
        CoordRef crs{ geom.getSpatialReference() };
        _sharedConstructorFromGdal(geom, crs);
        setCrs(crs);
    }
    MultiPolygon::MultiPolygon(const OGRGeometry& geom, const CoordRef& crs)
    {
        _sharedConstructorFromGdal(geom, crs);
        setCrs(crs);
    }
    size_t MultiPolygon::nPolygon() const
    {
        return _polygons.size();
    }
    bool MultiPolygon::isEmpty() const
    {
        return _polygons.empty();
    }
    std::vector<Polygon>::iterator MultiPolygon::begin() {
        return _polygons.begin();
    }
    std::vector<Polygon>::iterator MultiPolygon::end() {
        return _polygons.end();
    }
    std::vector<Polygon>::const_iterator MultiPolygon::begin() const
    {
        return _polygons.begin();
    }
    std::vector<Polygon>::const_iterator MultiPolygon::end() const
    {
        return _polygons.end();
    }
    void MultiPolygon::addPolygon(const Polygon& polygon)
    {
        if (!polygon.crs().isConsistentHoriz(_crs)) {
            throw ReprojectionError("Polygon CRS does not match MultiPolygon CRS");
        }
        _polygons.push_back(polygon);
        if (_crs.isEmpty()) {
            _crs = polygon.crs();
        }
    }
    bool MultiPolygon::containsPoint(coord_t x, coord_t y) const
    {
        for (const Polygon& poly : _polygons) {
            if (poly.containsPoint(x, y)) {
                return true;
            }
        }
        return false;
    }
    bool MultiPolygon::containsPoint(CoordXY xy) const
    {
        return containsPoint(xy.x, xy.y);
    }
    void MultiPolygon::projectInPlace(const CoordTransform& transform)
    {
        for (Polygon& poly : _polygons) {
            poly.projectInPlace(transform);
        }
        setCrs(transform.dst());
    }
    void MultiPolygon::_sharedConstructorFromGdal(const OGRGeometry& geom, const CoordRef& crs)
    {
        OGRwkbGeometryType type = wkbFlatten(geom.getGeometryType());
        if (type == wkbPolygon) {
            _polygons.emplace_back(geom, crs);
            return;
        }
        if (type != wkbMultiPolygon) {
            throw GeometryError(std::string("Expected a polygon or multipolygon, got ") + geom.getGeometryName());
        }
        const OGRMultiPolygon* gdalMultiPolygon = geom.toMultiPolygon();
        for (int i = 0; i < gdalMultiPolygon->getNumGeometries(); i++) {
            const OGRGeometry* part = gdalMultiPolygon->getGeometryRef(i);
            if (part->IsEmpty()) {
                continue;
            }
            _polygons.emplace_back(*part, crs);
        }
    }
}
