#include"H5GridProjectionInfo.hpp"
#include"MaskFillExceptions.hpp"
#include<hdf5_hl.h>

namespace maskfill {

	namespace {
		struct DimensionScale {
			bool found = false;
			std::vector<double> values;
			std::optional<std::string> units;
		};

		herr_t readScale(hid_t, unsigned, hid_t scale, void* visitorData) {
			DimensionScale* out = static_cast<DimensionScale*>(visitorData);
			std::vector<hsize_t> dims;
			try {
				dims = h5DatasetDims(scale);
			}
			catch (const FormatError&) {
				return -1;
			}
			if (dims.size() != 1) {
				return -1;
			}
			out->values.resize((size_t)dims[0]);
			if (dims[0] > 0 && H5Dread(scale, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, out->values.data()) < 0) {
				return -1;
			}
			out->units = h5ReadStringAttribute(scale, "units");
			out->found = true;
			return 1; //only the first scale attached to the dimension is used
		}

		DimensionScale dimensionScale(hid_t dataset, unsigned dim, const std::string& datasetName) {
			DimensionScale scale;
			if (H5DSiterate_scales(dataset, dim, nullptr, readScale, &scale) < 0 || !scale.found) {
				throw CFComplianceError("Unable to read the dimension scale for dimension " + std::to_string(dim) + " of " + datasetName);
			}
			return scale;
		}

		herr_t collectCFAttribute(hid_t loc, const char* name, const H5A_info_t*, void* opData) {
			CPLStringList* out = static_cast<CPLStringList*>(opData);
			std::optional<std::string> s = h5ReadStringAttribute(loc, name);
			if (s) {
				out->AddNameValue(name, s->c_str());
				return 0;
			}
			std::optional<std::vector<double>> v = h5ReadNumericAttribute(loc, name);
			if (!v) {
				return 0;
			}
			if (v->size() == 1) {
				out->AddNameValue(name, CPLSPrintf("%.17g", v->front()));
				return 0;
			}
			//arrays are written the way GDAL's netCDF driver reports them
			std::string joined = "{";
			for (size_t i = 0; i < v->size(); ++i) {
				joined += (i ? "," : "") + std::string(CPLSPrintf("%.17g", (*v)[i]));
			}
			joined += "}";
			out->AddNameValue(name, joined.c_str());
			return 0;
		}
	}

	CoordRef crsFromCFGridMapping(hid_t gridMapping, const std::string& units)
	{
		CPLStringList keyValues;
		hsize_t idx = 0;
		if (H5Aiterate2(gridMapping, H5_INDEX_NAME, H5_ITER_INC, &idx, collectCFAttribute, &keyValues) < 0) {
			throw CFComplianceError("Unable to read the attributes of grid mapping " + h5ObjectName(gridMapping));
		}
		OGRSpatialReference osr;
		if (osr.importFromCF1(keyValues.List(), units.empty() ? nullptr : units.c_str()) != OGRERR_NONE) {
			throw CFComplianceError("The grid mapping " + h5ObjectName(gridMapping) + " does not describe a supported CRS");
		}
		return CoordRef(&osr);
	}

	Alignment h5DatasetAlignment(hid_t file, hid_t dataset)
	{
		std::string name = h5ObjectName(dataset);
		std::vector<hsize_t> dims = h5DatasetDims(dataset);
		if (dims.size() != 2) {
			throw CFComplianceError(name + " is not two dimensional");
		}
		if (!h5AttributeExists(dataset, "DIMENSION_LIST")) {
			throw CFComplianceError("The dataset " + name + " does not have a DIMENSION_LIST attribute");
		}
		DimensionScale y = dimensionScale(dataset, 0, name);
		DimensionScale x = dimensionScale(dataset, 1, name);
		if (x.values.size() != dims[1] || y.values.size() != dims[0]) {
			throw CFComplianceError("The dimension scales of " + name + " do not match its shape");
		}
		if (x.values.size() < 2 || y.values.size() < 2) {
			throw CFComplianceError("The cell size of " + name + " cannot be determined from fewer than two coordinates");
		}
		if (!x.units) {
			throw CFComplianceError("The dataset " + name + " does not have a units attribute");
		}

		CoordRef crs;
		if (x.units->find("degrees") != std::string::npos) {
			crs = CoordRef(GEOGRAPHIC_PROJ_STRING);
		}
		else {
			std::optional<std::string> gridMappingName = h5ReadStringAttribute(dataset, "grid_mapping");
			if (!gridMappingName) {
				throw CFComplianceError("The dataset " + name + " is not geographically gridded and does not have a grid mapping attribute");
			}
			UniqueH5Id gridMapping = h5OpenObjectWrapper(file, *gridMappingName);
			if (!gridMapping) {
				throw CFComplianceError("The grid mapping " + *gridMappingName + " of " + name + " does not exist");
			}
			crs = crsFromCFGridMapping(gridMapping.get(), *x.units);
		}

		coord_t dx = x.values[1] - x.values[0];
		coord_t dy = y.values[1] - y.values[0];
		GeoTransform gt = { x.values[0] - dx / 2, dx, 0, y.values[0] - dy / 2, 0, dy };
		return Alignment(gt, (rowcol_t)dims[0], (rowcol_t)dims[1], crs);
	}
}
