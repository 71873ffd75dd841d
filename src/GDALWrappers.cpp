#include"GDALWrappers.hpp"

namespace maskfill {
	void gdalAllRegisterThreadSafe()
	{
		static std::once_flag registered;
		std::call_once(registered, []() {
			GDALAllRegister();
			});
	}
	void GdalDatasetCloser::operator()(GDALDataset* p) const
	{
		if (p) {
			GDALClose(GDALDataset::ToHandle(p));
		}
	}
	UniqueGdalDataset makeUniqueGdalDataset(GDALDataset* p)
	{
		return UniqueGdalDataset(p);
	}
	void GdalStringFreer::operator()(char* p) const
	{
		if (p) {
			CPLFree(p);
		}
	}
	UniqueGdalString exportToWktWrapper(const OGRSpatialReference& osr)
	{
		char* wkt = nullptr;
		const char* options[] = { "FORMAT=WKT2_2019", nullptr };
		if (osr.exportToWkt(&wkt, options) != OGRERR_NONE) {
			CPLFree(wkt);
			return UniqueGdalString();
		}
		return UniqueGdalString(wkt);
	}
	UniqueGdalDataset rasterGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return makeUniqueGdalDataset(GDALDataset::FromHandle(
			GDALOpenEx(filename.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
	}
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return makeUniqueGdalDataset(GDALDataset::FromHandle(
			GDALOpenEx(filename.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
	}
	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, int nband, GDALDataType gdt)
	{
		gdalAllRegisterThreadSafe();
		GDALDriver* d = GetGDALDriverManager()->GetDriverByName(driver.c_str());
		if (!d) {
			return UniqueGdalDataset();
		}
		return makeUniqueGdalDataset(d->Create(file.c_str(), ncol, nrow, nband, gdt, nullptr));
	}
	UniqueGdalDataset gdalCreateCopyWrapper(GDALDriver* driver, const std::string& file, GDALDataset* source)
	{
		if (!driver || !source) {
			return UniqueGdalDataset();
		}
		return makeUniqueGdalDataset(driver->CreateCopy(file.c_str(), source, FALSE, nullptr, nullptr, nullptr));
	}
	std::string lastGdalErrorMessage()
	{
		const char* msg = CPLGetLastErrorMsg();
		return msg ? std::string(msg) : std::string();
	}
}
