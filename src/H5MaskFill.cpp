#include"H5MaskFill.hpp"
#include"H5GridProjectionInfo.hpp"
#include"MaskFill.hpp"
#include<hdf5_hl.h>

namespace maskfill {

	template<class T>
	T h5FillValue(hid_t dataset, double defaultFill)
	{
		UniqueH5Id attr = h5OpenAttributeWrapper(dataset, "_FillValue");
		if (attr) {
			UniqueH5Id space{ H5Aget_space(attr.get()), H5Sclose };
			if (space && H5Sget_simple_extent_npoints(space.get()) == 1) {
				T value;
				if (H5Aread(attr.get(), h5NativeType<T>(), &value) >= 0) {
					return value;
				}
			}
			CPLError(CE_Warning, CPLE_AppDefined, "Unable to read the _FillValue attribute of %s", h5ObjectName(dataset).c_str());
		}
		CPLDebug("MASKFILL", "%s has no fill value; using the default fill value %g", h5ObjectName(dataset).c_str(), defaultFill);
		return fillValueAs<T>(defaultFill);
	}

	namespace {
		const std::array<std::string, 3> STATISTICS_ATTRIBUTES = { "observed_max", "observed_min", "observed_mean" };

		template<class T>
		void updateStatistics(hid_t dataset, const std::vector<T>& data, T fill) {
			bool anyStatistics = std::any_of(STATISTICS_ATTRIBUTES.begin(), STATISTICS_ATTRIBUTES.end(),
				[&](const std::string& name) {return h5AttributeExists(dataset, name); });
			if (!anyStatistics) {
				return;
			}

			bool any = false;
			T maxValue = fill;
			T minValue = fill;
			double sum = 0;
			size_t count = 0;
			for (T v : data) {
				if (v == fill) {
					continue;
				}
				if constexpr (std::is_floating_point_v<T>) {
					if (std::isnan(v)) {
						continue;
					}
				}
				if (!any) {
					maxValue = v;
					minValue = v;
					any = true;
				}
				maxValue = std::max(maxValue, v);
				minValue = std::min(minValue, v);
				sum += (double)v;
				++count;
			}
			if (!any) {
				CPLDebug("MASKFILL", "%s has no values left after masking; leaving its statistics unchanged", h5ObjectName(dataset).c_str());
				return;
			}

			if (h5AttributeExists(dataset, "observed_max")) {
				h5WriteNumericAttribute(dataset, "observed_max", (double)maxValue);
			}
			if (h5AttributeExists(dataset, "observed_min")) {
				h5WriteNumericAttribute(dataset, "observed_min", (double)minValue);
			}
			if (h5AttributeExists(dataset, "observed_mean")) {
				h5WriteNumericAttribute(dataset, "observed_mean", sum / (double)count);
			}
		}

		template<class T>
		void maskFillDatasetTyped(hid_t dataset, const Raster<mask_t>& mask, double defaultFill) {
			std::string name = h5ObjectName(dataset);
			T fill = h5FillValue<T>(dataset, defaultFill);

			std::vector<T> data((size_t)mask.ncell());
			if (H5Dread(dataset, h5NativeType<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
				throw IOError("Unable to read the dataset " + name);
			}
			maskFillArray(data, mask, fill);
			if (H5Dwrite(dataset, h5NativeType<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
				throw IOError("Unable to write the dataset " + name);
			}
			updateStatistics(dataset, data, fill);
			CPLDebug("MASKFILL", "Mask filled the dataset %s", name.c_str());
		}

		void maskFillDataset(hid_t dataset, const Raster<mask_t>& mask, double defaultFill) {
			UniqueH5Id type = h5DatasetTypeWrapper(dataset);
			if (!type) {
				throw FormatError("Unable to read the type of " + h5ObjectName(dataset));
			}
			H5T_class_t typeClass = H5Tget_class(type.get());
			size_t size = H5Tget_size(type.get());
			if (typeClass == H5T_FLOAT) {
				switch (size) {
				case 4:
					return maskFillDatasetTyped<float>(dataset, mask, defaultFill);
				case 8:
					return maskFillDatasetTyped<double>(dataset, mask, defaultFill);
				}
			}
			else if (typeClass == H5T_INTEGER) {
				bool isSigned = H5Tget_sign(type.get()) == H5T_SGN_2;
				switch (size) {
				case 1:
					return isSigned ? maskFillDatasetTyped<int8_t>(dataset, mask, defaultFill) : maskFillDatasetTyped<uint8_t>(dataset, mask, defaultFill);
				case 2:
					return isSigned ? maskFillDatasetTyped<int16_t>(dataset, mask, defaultFill) : maskFillDatasetTyped<uint16_t>(dataset, mask, defaultFill);
				case 4:
					return isSigned ? maskFillDatasetTyped<int32_t>(dataset, mask, defaultFill) : maskFillDatasetTyped<uint32_t>(dataset, mask, defaultFill);
				case 8:
					return isSigned ? maskFillDatasetTyped<int64_t>(dataset, mask, defaultFill) : maskFillDatasetTyped<uint64_t>(dataset, mask, defaultFill);
				}
			}
			CPLDebug("MASKFILL", "The dataset %s does not have a numeric type and cannot be mask filled", h5ObjectName(dataset).c_str());
		}

		//true if the dataset holds data that should be masked
		bool isMaskableDataset(hid_t dataset, const std::string& name) {
			if (h5DatasetDims(dataset).size() != 2) {
				CPLDebug("MASKFILL", "The dataset %s is not two dimensional and cannot be mask filled", name.c_str());
				return false;
			}
			if (H5DSis_scale(dataset) > 0) {
				CPLDebug("MASKFILL", "The dataset %s is a dimension scale and will not be mask filled", name.c_str());
				return false;
			}
			return true;
		}

		void processFile(const std::string& path, MaskGridCache& cache, const MaskFillOptions& options) {
			bool writing = cache.mode() != CacheMode::maskGridOnly;
			UniqueH5Id file = h5OpenFileWrapper(path, writing);
			if (!file) {
				throw FormatError("Unable to open " + path + " as an HDF5 file");
			}
			for (const std::string& name : h5AllDatasetNames(file.get())) {
				UniqueH5Id dataset{ H5Dopen2(file.get(), name.c_str(), H5P_DEFAULT), H5Dclose };
				if (!dataset) {
					throw FormatError("Unable to open the dataset " + name + " in " + path);
				}
				if (!isMaskableDataset(dataset.get(), name)) {
					continue;
				}
				const Raster<mask_t>& mask = cache.getMask(h5DatasetAlignment(file.get(), dataset.get()));
				if (!writing) {
					continue;
				}
				if (nCellsInside(mask) == 0) {
					CPLError(CE_Warning, CPLE_AppDefined, "The region does not intersect %s; every cell will be filled", name.c_str());
				}
				maskFillDataset(dataset.get(), mask, options.defaultFill);
			}
			if (writing && H5Fflush(file.get(), H5F_SCOPE_GLOBAL) < 0) {
				throw IOError("Unable to write " + path);
			}
		}
	}

	std::optional<std::filesystem::path> produceMaskedHdf(const std::string& inputPath, MaskGridCache& cache, const MaskFillOptions& options)
	{
		namespace fs = std::filesystem;
		H5ErrorPrintingSuppressor suppressor;

		if (cache.mode() == CacheMode::maskGridOnly) {
			processFile(inputPath, cache, options);
			return std::nullopt;
		}

		fs::path outPath = maskedFilePath(inputPath, options.outputDir);
		fs::path tmpPath = temporaryPathFor(outPath);
		std::error_code ec;
		fs::copy_file(inputPath, tmpPath, fs::copy_options::overwrite_existing, ec);
		if (ec) {
			throw IOError("Unable to copy " + inputPath + " to " + tmpPath.string() + ": " + ec.message());
		}
		try {
			processFile(tmpPath.string(), cache, options);
			fs::rename(tmpPath, outPath, ec);
			if (ec) {
				throw IOError("Unable to move " + tmpPath.string() + " to " + outPath.string() + ": " + ec.message());
			}
		}
		catch (...) {
			std::error_code removeError;
			if (fs::exists(tmpPath, removeError) && !fs::remove(tmpPath, removeError)) {
				CPLError(CE_Warning, CPLE_FileIO, "Unable to remove partial output %s", tmpPath.string().c_str());
			}
			throw;
		}
		CPLDebug("MASKFILL", "Wrote %s", outPath.string().c_str());
		return outPath;
	}

	std::optional<std::filesystem::path> produceMaskedHdf(const std::string& inputPath, const std::string& regionPath, const MaskFillOptions& options)
	{
		MaskGridCache cache{ regionPath, options };
		std::optional<std::filesystem::path> out = produceMaskedHdf(inputPath, cache, options);
		cache.finish();
		return out;
	}

	template uint8_t h5FillValue<uint8_t>(hid_t, double);
	template int8_t h5FillValue<int8_t>(hid_t, double);
	template int16_t h5FillValue<int16_t>(hid_t, double);
	template uint16_t h5FillValue<uint16_t>(hid_t, double);
	template int32_t h5FillValue<int32_t>(hid_t, double);
	template uint32_t h5FillValue<uint32_t>(hid_t, double);
	template int64_t h5FillValue<int64_t>(hid_t, double);
	template uint64_t h5FillValue<uint64_t>(hid_t, double);
	template float h5FillValue<float>(hid_t, double);
	template double h5FillValue<double>(hid_t, double);
}
