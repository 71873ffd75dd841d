#pragma once
#ifndef mf_maskfill_h
#define mf_maskfill_h

#include"maskfill_pch.hpp"
#include"MultiBandRaster.hpp"
#include"Rasterize.hpp"

namespace maskfill {

	//converts a fill value to the sample type of the data
	//throws ParameterError if the value can't be represented exactly
	template<class T>
	T fillValueAs(double fill) {
		if constexpr (std::is_integral_v<T>) {
			//max() isn't exactly representable as a double for 64-bit types, but 2^digits always is
			const double upperBound = std::ldexp(1.0, std::numeric_limits<T>::digits);
			if (!std::isfinite(fill) || std::trunc(fill) != fill
				|| fill < (double)std::numeric_limits<T>::lowest() || fill >= upperBound) {
				throw ParameterError("The fill value " + std::to_string(fill) + " cannot be represented in the data's integer type");
			}
			return (T)fill;
		}
		else {
			if (std::isfinite(fill) && std::abs(fill) > (double)std::numeric_limits<T>::max()) {
				throw ParameterError("The fill value " + std::to_string(fill) + " is out of range for the data's floating point type");
			}
			return (T)fill;
		}
	}

	//the number of cells the mask marks as inside
	cell_t nCellsInside(const Raster<mask_t>& mask);

	//Replaces every cell outside the mask (mask value 0) with fill, in every band, and copies the rest unchanged
	//Filled cells are also marked as having no value
	//throws ParameterError if the mask's dimensions don't match the raster's
	template<class T>
	MultiBandRaster<T> maskFillRaster(const MultiBandRaster<T>& raster, const Raster<mask_t>& mask, T fill) {
		if (mask.nrow() != raster.nrow() || mask.ncol() != raster.ncol()) {
			throw ParameterError("Mask dimensions do not match the raster's dimensions");
		}
		MultiBandRaster<T> out = raster;
		for (band_t band = 1; band <= out.nBands(); ++band) {
			Raster<T>& r = out.bandAtUnsafe(band);
			for (cell_t cell = 0; cell < r.ncell(); ++cell) {
				if (!mask[cell].value()) {
					r[cell].value() = fill;
					r[cell].has_value() = false;
				}
			}
		}
		return out;
	}

	//Rasterizes the region onto the raster's grid and applies maskFillRaster with the result
	//The region must already be in the raster's CRS
	//throws ReprojectionError if it isn't, and the errors of rasterizeRegion
	template<class T>
	MultiBandRaster<T> maskFillRaster(const MultiBandRaster<T>& raster, const MultiPolygon& region, T fill,
		RasterizePolicy policy = RasterizePolicy::cellCenter) {
		Raster<mask_t> mask = rasterizeRegion(raster, region, policy);
		if (nCellsInside(mask) == 0) {
			CPLError(CE_Warning, CPLE_AppDefined, "The region does not intersect the raster; every cell will be filled");
		}
		return maskFillRaster(raster, mask, fill);
	}

	//the in-place equivalent of maskFillRaster, for row-major data read directly from a file
	template<class T>
	void maskFillArray(std::vector<T>& data, const Raster<mask_t>& mask, T fill) {
		if ((cell_t)data.size() != mask.ncell()) {
			throw ParameterError("Mask dimensions do not match the data's dimensions");
		}
		for (cell_t cell = 0; cell < mask.ncell(); ++cell) {
			if (!mask[cell].value()) {
				data[cell] = fill;
			}
		}
	}

	//outputDir / (stem + "_mf" + extension)
	std::filesystem::path maskedFilePath(const std::filesystem::path& input, const std::filesystem::path& outputDir);

	//a name in the same directory as finalPath, for writing output before it's complete
	std::filesystem::path temporaryPathFor(const std::filesystem::path& finalPath);
}

#endif
