#include"Region.hpp"
#include"GDALWrappers.hpp"
#include"MaskFillExceptions.hpp"

namespace maskfill {
	Region::Region(const CoordRef& crs)
		: MultiPolygon(crs)
	{
	}
	Region::Region(const std::string& filename)
	{
		UniqueGdalDataset shp = vectorGDALWrapper(filename);
		if (!shp) {
			throw FormatError("Unable to open " + filename + " as a vector file: " + lastGdalErrorMessage());
		}

		bool crsSet = false;
		for (OGRLayer* layer : shp->GetLayers()) {
			CoordRef layerCrs{ layer->GetSpatialRef() };
			if (!crsSet) {
				setCrs(layerCrs);
				crsSet = true;
			}
			const CoordTransform& transform = CoordTransformFactory::getTransform(layerCrs, _crs);

			size_t nBefore = _polygons.size();
			layer->ResetReading();
			for (const OGRFeatureUniquePtr& feature : layer) {
				const OGRGeometry* geom = feature->GetGeometryRef();
				if (!geom || geom->IsEmpty()) {
					CPLDebug("MASKFILL", "Skipping feature %lld of layer %s, which has no geometry",
						(long long)feature->GetFID(), layer->GetName());
					continue;
				}
				_addGeometry(*geom, layerCrs);
			}
			for (size_t i = nBefore; i < _polygons.size(); ++i) {
				_polygons[i].projectInPlace(transform);
			}
			CPLDebug("MASKFILL", "Read %d polygons from layer %s of %s",
				(int)(_polygons.size() - nBefore), layer->GetName(), filename.c_str());
		}
	}
	void Region::_addGeometry(const OGRGeometry& geom, const CoordRef& layerCrs)
	{
		if (geom.IsEmpty()) {
			return;
		}
		switch (wkbFlatten(geom.getGeometryType())) {
		case wkbPolygon:
		case wkbMultiPolygon:
			for (const Polygon& poly : MultiPolygon(geom, layerCrs)) {
				_polygons.push_back(poly);
			}
			return;
		case wkbCurvePolygon:
		case wkbMultiSurface: {
			std::unique_ptr<OGRGeometry> linear{ geom.getLinearGeometry() };
			if (!linear) {
				throw GeometryError(std::string("Unable to linearize ") + geom.getGeometryName());
			}
			_addGeometry(*linear, layerCrs);
			return;
		}
		case wkbGeometryCollection: {
			const OGRGeometryCollection* collection = geom.toGeometryCollection();
			for (const OGRGeometry* sub : *collection) {
				_addGeometry(*sub, layerCrs);
			}
			return;
		}
		default:
			throw GeometryError(std::string("Region geometries must be polygons, got ") + geom.getGeometryName());
		}
	}
}
