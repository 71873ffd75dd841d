#pragma once
#ifndef mf_testfixtures_h
#define mf_testfixtures_h

#include"test_pch.hpp"
#include<atomic>
#include<fstream>
#include"../Alignment.hpp"
#include"../Raster.hpp"
#include"../H5Wrappers.hpp"
#include<hdf5_hl.h>

namespace maskfill {

	constexpr const char* TEST_EPSG = "32611";

	//a directory that is removed, along with everything in it, when this goes out of scope
	class TempDir {
	public:
		TempDir() {
			static std::atomic<int> counter = 0;
			_path = std::filesystem::temp_directory_path()
				/ ("maskfill_test_" + std::to_string(CPLGetPID()) + "_" + std::to_string(counter++));
			std::filesystem::create_directories(_path);
		}
		~TempDir() {
			std::error_code ec;
			std::filesystem::remove_all(_path, ec);
		}
		TempDir(const TempDir&) = delete;
		TempDir& operator=(const TempDir&) = delete;

		const std::filesystem::path& path() const {
			return _path;
		}
		std::string file(const std::string& name) const {
			return (_path / name).string();
		}

	private:
		std::filesystem::path _path;
	};

	inline void writeText(const std::string& path, const std::string& text) {
		std::ofstream ofs{ path };
		ofs << text;
	}

	//a GeoJSON feature collection with one polygon feature per ring, in the given EPSG code
	//an empty epsg leaves the crs member out, which GDAL reads as WGS84 longitude/latitude
	inline void writeGeoJson(const std::string& path, const std::vector<CoordXYVector>& rings, const std::string& epsg = TEST_EPSG) {
		std::ostringstream out;
		out.precision(17);
		out << "{\"type\":\"FeatureCollection\",";
		if (!epsg.empty()) {
			out << "\"crs\":{\"type\":\"name\",\"properties\":{\"name\":\"urn:ogc:def:crs:EPSG::" << epsg << "\"}},";
		}
		out << "\"features\":[";
		for (size_t i = 0; i < rings.size(); ++i) {
			out << (i ? "," : "") << "{\"type\":\"Feature\",\"properties\":{},\"geometry\":{\"type\":\"Polygon\",\"coordinates\":[[";
			for (size_t j = 0; j < rings[i].size(); ++j) {
				out << (j ? "," : "") << "[" << rings[i][j].x << "," << rings[i][j].y << "]";
			}
			out << "]]}}";
		}
		out << "]}";
		writeText(path, out.str());
	}

	//a closed axis-aligned rectangle
	inline CoordXYVector rectangleRing(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax) {
		return { {xmin,ymin},{xmax,ymin},{xmax,ymax},{xmin,ymax},{xmin,ymin} };
	}

	//writes a GeoTIFF with one band per entry of bands
	template<class T>
	void writeTestGeotiff(const std::string& path, const Alignment& a, const std::vector<std::vector<T>>& bands, std::optional<double> nodata = std::nullopt) {
		UniqueGdalDataset wgd = gdalCreateWrapper("GTiff", path, a.ncol(), a.nrow(), (int)bands.size(), gdalTypeFor<T>());
		ASSERT_TRUE(wgd);
		GeoTransform gt = a.geoTransform();
		wgd->SetGeoTransform(gt.data());
		if (!a.crs().isEmpty()) {
			wgd->SetProjection(a.crs().getCompleteWKT().c_str());
		}
		wgd->SetMetadataItem("PRODUCER", "maskfill tests");
		for (int i = 0; i < (int)bands.size(); ++i) {
			GDALRasterBand* band = wgd->GetRasterBand(i + 1);
			if (nodata) {
				band->SetNoDataValue(*nodata);
			}
			std::vector<T> values = bands[i];
			ASSERT_EQ(band->RasterIO(GF_Write, 0, 0, a.ncol(), a.nrow(), values.data(), a.ncol(), a.nrow(), gdalTypeFor<T>(), 0, 0), CE_None);
		}
	}

	inline void writeH5StringAttribute(hid_t obj, const std::string& name, const std::string& value) {
		UniqueH5Id type{ H5Tcopy(H5T_C_S1), H5Tclose };
		H5Tset_size(type.get(), value.size());
		UniqueH5Id space{ H5Screate(H5S_SCALAR), H5Sclose };
		UniqueH5Id attr{ H5Acreate2(obj, name.c_str(), type.get(), space.get(), H5P_DEFAULT, H5P_DEFAULT), H5Aclose };
		ASSERT_TRUE(attr);
		ASSERT_GE(H5Awrite(attr.get(), type.get(), value.c_str()), 0);
	}

	template<class T>
	void writeH5ScalarAttribute(hid_t obj, const std::string& name, T value) {
		UniqueH5Id space{ H5Screate(H5S_SCALAR), H5Sclose };
		UniqueH5Id attr{ H5Acreate2(obj, name.c_str(), h5NativeType<T>(), space.get(), H5P_DEFAULT, H5P_DEFAULT), H5Aclose };
		ASSERT_TRUE(attr);
		ASSERT_GE(H5Awrite(attr.get(), h5NativeType<T>(), &value), 0);
	}

	template<class T>
	UniqueH5Id writeH5Dataset(hid_t loc, const std::string& name, const std::vector<hsize_t>& dims, const std::vector<T>& values) {
		UniqueH5Id space{ H5Screate_simple((int)dims.size(), dims.data(), nullptr), H5Sclose };
		UniqueH5Id ds{ H5Dcreate2(loc, name.c_str(), h5NativeType<T>(), space.get(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT), H5Dclose };
		if (ds && !values.empty()) {
			H5Dwrite(ds.get(), h5NativeType<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data());
		}
		return ds;
	}

	//how the grid of the 2D dataset in a test HDF5 file is described
	struct TestHdf5Grid {
		std::vector<double> x;
		std::vector<double> y;
		std::string units = "m";
		bool attachScales = true;
		bool writeUnits = true;
		//"wkt" writes a grid mapping with crs_wkt for TEST_EPSG, "cf" one with only the CF projection parameters, "" none
		std::string gridMapping = "wkt";
	};

	//Writes /science/data, a float dataset on the given grid, plus /x and /y dimension scales, a 1D /science/count, and /crs
	inline void writeTestHdf5(const std::string& path, const TestHdf5Grid& grid, const std::vector<float>& data,
		std::optional<float> fillValue = std::nullopt, bool statistics = false) {
		UniqueH5Id file{ H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT), H5Fclose };
		ASSERT_TRUE(file);

		UniqueH5Id x = writeH5Dataset<double>(file.get(), "x", { (hsize_t)grid.x.size() }, grid.x);
		UniqueH5Id y = writeH5Dataset<double>(file.get(), "y", { (hsize_t)grid.y.size() }, grid.y);
		ASSERT_GE(H5DSset_scale(x.get(), "x"), 0);
		ASSERT_GE(H5DSset_scale(y.get(), "y"), 0);
		if (grid.writeUnits) {
			writeH5StringAttribute(x.get(), "units", grid.units);
			writeH5StringAttribute(y.get(), "units", grid.units);
		}

		if (!grid.gridMapping.empty()) {
			UniqueH5Id scalar{ H5Screate(H5S_SCALAR), H5Sclose };
			UniqueH5Id crs{ H5Dcreate2(file.get(), "crs", H5T_NATIVE_INT32, scalar.get(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT), H5Dclose };
			ASSERT_TRUE(crs);
			if (grid.gridMapping == "wkt") {
				writeH5StringAttribute(crs.get(), "crs_wkt", CoordRef(TEST_EPSG).getCompleteWKT());
			}
			writeH5StringAttribute(crs.get(), "grid_mapping_name", "transverse_mercator");
			writeH5ScalarAttribute<double>(crs.get(), "longitude_of_central_meridian", -117.);
			writeH5ScalarAttribute<double>(crs.get(), "latitude_of_projection_origin", 0.);
			writeH5ScalarAttribute<double>(crs.get(), "scale_factor_at_central_meridian", 0.9996);
			writeH5ScalarAttribute<double>(crs.get(), "false_easting", 500000.);
			writeH5ScalarAttribute<double>(crs.get(), "false_northing", 0.);
			writeH5ScalarAttribute<double>(crs.get(), "semi_major_axis", 6378137.);
			writeH5ScalarAttribute<double>(crs.get(), "inverse_flattening", 298.257223563);
		}

		UniqueH5Id group{ H5Gcreate2(file.get(), "science", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT), H5Gclose };
		ASSERT_TRUE(group);
		UniqueH5Id ds = writeH5Dataset<float>(group.get(), "data", { (hsize_t)grid.y.size(), (hsize_t)grid.x.size() }, data);
		ASSERT_TRUE(ds);
		if (grid.attachScales) {
			ASSERT_GE(H5DSattach_scale(ds.get(), y.get(), 0), 0);
			ASSERT_GE(H5DSattach_scale(ds.get(), x.get(), 1), 0);
		}
		if (!grid.gridMapping.empty()) {
			writeH5StringAttribute(ds.get(), "grid_mapping", "/crs");
		}
		if (fillValue) {
			writeH5ScalarAttribute<float>(ds.get(), "_FillValue", *fillValue);
		}
		if (statistics) {
			writeH5ScalarAttribute<double>(ds.get(), "observed_max", 0.);
			writeH5ScalarAttribute<double>(ds.get(), "observed_min", 0.);
			writeH5ScalarAttribute<double>(ds.get(), "observed_mean", 0.);
		}

		std::vector<int32_t> counts = { 1,2,3 };
		UniqueH5Id count = writeH5Dataset<int32_t>(group.get(), "count", { 3 }, counts);
		ASSERT_TRUE(count);
	}

	//reads a whole dataset as T
	template<class T>
	std::vector<T> readH5Dataset(const std::string& path, const std::string& name) {
		UniqueH5Id file = h5OpenFileWrapper(path, false);
		EXPECT_TRUE(file);
		UniqueH5Id ds{ H5Dopen2(file.get(), name.c_str(), H5P_DEFAULT), H5Dclose };
		EXPECT_TRUE(ds);
		hsize_t n = 1;
		for (hsize_t d : h5DatasetDims(ds.get())) {
			n *= d;
		}
		std::vector<T> out((size_t)n);
		EXPECT_GE(H5Dread(ds.get(), h5NativeType<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()), 0);
		return out;
	}

	inline double readH5DoubleAttribute(const std::string& path, const std::string& dataset, const std::string& name) {
		UniqueH5Id file = h5OpenFileWrapper(path, false);
		UniqueH5Id ds = h5OpenObjectWrapper(file.get(), dataset);
		std::optional<std::vector<double>> v = h5ReadNumericAttribute(ds.get(), name);
		EXPECT_TRUE(v.has_value());
		return v ? v->front() : std::numeric_limits<double>::quiet_NaN();
	}
}

#endif
