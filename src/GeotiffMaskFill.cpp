#include"GeotiffMaskFill.hpp"
#include"MaskFill.hpp"

namespace maskfill {

	template<class T>
	T geotiffFillValue(GDALDataset& ds, double defaultFill)
	{
		if (ds.GetRasterCount() < 1) {
			throw FormatError(std::string(ds.GetDescription()) + " has no raster bands");
		}
		std::optional<T> noData = noDataValueAs<T>(*ds.GetRasterBand(1));
		if (noData) {
			return *noData;
		}
		CPLDebug("MASKFILL", "%s has no nodata value; using the default fill value %g", ds.GetDescription(), defaultFill);
		return fillValueAs<T>(defaultFill);
	}

	namespace {
		template<class T>
		std::optional<std::filesystem::path> produceMaskedGeotiffTyped(GDALDataset& source, const std::string& inputPath, MaskGridCache& cache, const MaskFillOptions& options)
		{
			T fill = geotiffFillValue<T>(source, options.defaultFill);
			MultiBandRaster<T> raster{ source };
			const Raster<mask_t>& mask = cache.getMask(raster);
			if (cache.mode() == CacheMode::maskGridOnly) {
				return std::nullopt;
			}
			if (nCellsInside(mask) == 0) {
				CPLError(CE_Warning, CPLE_AppDefined, "The region does not intersect %s; every cell will be filled", inputPath.c_str());
			}
			MultiBandRaster<T> masked = maskFillRaster(raster, mask, fill);

			std::filesystem::path outPath = maskedFilePath(inputPath, options.outputDir);
			std::filesystem::path tmpPath = temporaryPathFor(outPath);
			GDALDriver* driver = source.GetDriver();

			try {
				masked.writeRasterFromTemplate(source, tmpPath.string(), fill);
				if (driver->Rename(outPath.string().c_str(), tmpPath.string().c_str()) != CE_None) {
					throw IOError("Unable to move " + tmpPath.string() + " to " + outPath.string() + ": " + lastGdalErrorMessage());
				}
			}
			catch (...) {
				VSIStatBufL stat;
				if (VSIStatL(tmpPath.string().c_str(), &stat) == 0 && driver->Delete(tmpPath.string().c_str()) != CE_None) {
					CPLError(CE_Warning, CPLE_FileIO, "Unable to remove partial output %s", tmpPath.string().c_str());
				}
				throw;
			}
			CPLDebug("MASKFILL", "Wrote %s", outPath.string().c_str());
			return outPath;
		}
	}

	std::optional<std::filesystem::path> produceMaskedGeotiff(const std::string& inputPath, MaskGridCache& cache, const MaskFillOptions& options)
	{
		UniqueGdalDataset source = rasterGDALWrapper(inputPath);
		if (!source) {
			throw FormatError("Unable to open " + inputPath + " as a raster: " + lastGdalErrorMessage());
		}
		GDALDataType gdt = dataTypeForDataset(*source);
		switch (gdt) {
		case GDT_Byte:
			return produceMaskedGeotiffTyped<uint8_t>(*source, inputPath, cache, options);
		case GDT_Int8:
			return produceMaskedGeotiffTyped<int8_t>(*source, inputPath, cache, options);
		case GDT_Int16:
			return produceMaskedGeotiffTyped<int16_t>(*source, inputPath, cache, options);
		case GDT_UInt16:
			return produceMaskedGeotiffTyped<uint16_t>(*source, inputPath, cache, options);
		case GDT_Int32:
			return produceMaskedGeotiffTyped<int32_t>(*source, inputPath, cache, options);
		case GDT_UInt32:
			return produceMaskedGeotiffTyped<uint32_t>(*source, inputPath, cache, options);
		case GDT_Int64:
			return produceMaskedGeotiffTyped<int64_t>(*source, inputPath, cache, options);
		case GDT_UInt64:
			return produceMaskedGeotiffTyped<uint64_t>(*source, inputPath, cache, options);
		case GDT_Float32:
			return produceMaskedGeotiffTyped<float>(*source, inputPath, cache, options);
		case GDT_Float64:
			return produceMaskedGeotiffTyped<double>(*source, inputPath, cache, options);
		default:
			throw FormatError(inputPath + " has an unsupported sample type: " + GDALGetDataTypeName(gdt));
		}
	}

	std::optional<std::filesystem::path> produceMaskedGeotiff(const std::string& inputPath, const std::string& regionPath, const MaskFillOptions& options)
	{
		MaskGridCache cache{ regionPath, options };
		std::optional<std::filesystem::path> out = produceMaskedGeotiff(inputPath, cache, options);
		cache.finish();
		return out;
	}

	template uint8_t geotiffFillValue<uint8_t>(GDALDataset&, double);
	template int8_t geotiffFillValue<int8_t>(GDALDataset&, double);
	template int16_t geotiffFillValue<int16_t>(GDALDataset&, double);
	template uint16_t geotiffFillValue<uint16_t>(GDALDataset&, double);
	template int32_t geotiffFillValue<int32_t>(GDALDataset&, double);
	template uint32_t geotiffFillValue<uint32_t>(GDALDataset&, double);
	template int64_t geotiffFillValue<int64_t>(GDALDataset&, double);
	template uint64_t geotiffFillValue<uint64_t>(GDALDataset&, double);
	template float geotiffFillValue<float>(GDALDataset&, double);
	template double geotiffFillValue<double>(GDALDataset&, double);
}
