#include"MultiBandRaster.hpp"

namespace maskfill {
	GDALDataType dataTypeForDataset(GDALDataset& ds)
	{
		if (ds.GetRasterCount() < 1) {
			throw FormatError(std::string(ds.GetDescription()) + " has no raster bands");
		}
		return ds.GetRasterBand(1)->GetRasterDataType();
	}
}
