#pragma once
#ifndef MF_MULTIBANDRASTER_H
#define MF_MULTIBANDRASTER_H

#include"Raster.hpp"


namespace maskfill {

	//returns the sample type of the first band of the dataset, without reading the data in it
	//throws FormatError if the dataset has no bands
	GDALDataType dataTypeForDataset(GDALDataset& ds);

	template<typename T>
	class MultiBandRaster : public Alignment {
	public:
		MultiBandRaster() = default;

		//reads every band of the file as T
		//throws FormatError if the file can't be read
		MultiBandRaster(const std::string& filename);
		explicit MultiBandRaster(GDALDataset& ds);
		MultiBandRaster(const Alignment& a, band_t nBands);

		band_t nBands() const;

		Raster<T>& bandAt(band_t band);
		Raster<T>& bandAtUnsafe(band_t band);

		const Raster<T>& bandAt(band_t band) const;
		const Raster<T>& bandAtUnsafe(band_t band) const;

		auto atCell(cell_t cell, band_t band);
		auto atCellUnsafe(cell_t cell, band_t band);
		auto atRC(rowcol_t row, rowcol_t col, band_t band);

		const auto atCell(cell_t cell, band_t band) const;
		const auto atCellUnsafe(cell_t cell, band_t band) const;
		const auto atRC(rowcol_t row, rowcol_t col, band_t band) const;

		//Writes this raster with the driver, metadata, and band descriptions of the template
		//Values are written exactly as stored; the nodata value of every band is set to navalue
		//throws IOError if the template's shape doesn't match, or the output can't be written
		void writeRasterFromTemplate(GDALDataset& source, const std::string& fileName, const T navalue) const;

	private:
		std::vector<Raster<T>> _bands;

		void _checkBand(band_t band) const;
		void _readBands(GDALDataset& ds);
	};

	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(const std::string& filename) {
		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw FormatError("Unable to open " + filename + " as a raster: " + lastGdalErrorMessage());
		}
		_readBands(*wgd);
	}
	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(GDALDataset& ds) {
		_readBands(ds);
	}
	template<typename T>
	inline void MultiBandRaster<T>::_readBands(GDALDataset& ds) {
		alignmentInitFromGDALRaster(ds);
		checkValidAlignment();

		band_t nBand = ds.GetRasterCount();
		_bands.reserve(nBand);
		for (band_t i = 1; i <= nBand; ++i) {
			_bands.emplace_back(ds, i);
		}
	}
	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(const Alignment& a, band_t nBands)
		: Alignment(a)
	{
		for (band_t band = 0; band < nBands; ++band) {
			_bands.emplace_back(a);
		}
	}
	template<typename T>
	inline band_t MultiBandRaster<T>::nBands() const {
		return (band_t)_bands.size();
	}
	template<typename T>
	inline Raster<T>& MultiBandRaster<T>::bandAt(band_t band) {
		_checkBand(band);
		return bandAtUnsafe(band);
	}
	template<typename T>
	inline Raster<T>& MultiBandRaster<T>::bandAtUnsafe(band_t band) {
		return _bands[band - 1];
	}
	template<typename T>
	inline const Raster<T>& MultiBandRaster<T>::bandAt(band_t band) const {
		_checkBand(band);
		return bandAtUnsafe(band);
	}
	template<typename T>
	inline const Raster<T>& MultiBandRaster<T>::bandAtUnsafe(band_t band) const {
		return _bands[band - 1];
	}
	template<typename T>
	inline auto MultiBandRaster<T>::atCell(cell_t cell, band_t band) {
		return bandAt(band).atCell(cell);
	}
	template<typename T>
	inline auto MultiBandRaster<T>::atCellUnsafe(cell_t cell, band_t band) {
		return bandAtUnsafe(band).atCellUnsafe(cell);
	}
	template<typename T>
	inline auto MultiBandRaster<T>::atRC(rowcol_t row, rowcol_t col, band_t band) {
		return bandAt(band).atRC(row, col);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atCell(cell_t cell, band_t band) const {
		return bandAt(band).atCell(cell);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atCellUnsafe(cell_t cell, band_t band) const {
		return bandAtUnsafe(band).atCellUnsafe(cell);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atRC(rowcol_t row, rowcol_t col, band_t band) const {
		return bandAt(band).atRC(row, col);
	}
	template<typename T>
	inline void MultiBandRaster<T>::writeRasterFromTemplate(GDALDataset& source, const std::string& fileName, const T navalue) const
	{
		if (source.GetRasterXSize() != ncol() || source.GetRasterYSize() != nrow() || source.GetRasterCount() != nBands()) {
			throw IOError(std::string("Raster shape does not match ") + source.GetDescription());
		}

		//the in-memory copy carries every piece of metadata GDAL knows how to copy
		GDALDriver* mem = GetGDALDriverManager()->GetDriverByName("MEM");
		UniqueGdalDataset staged = gdalCreateCopyWrapper(mem, "", &source);
		if (!staged) {
			throw IOError("Unable to stage " + fileName + " in memory: " + lastGdalErrorMessage());
		}
		for (band_t band = 1; band <= nBands(); ++band) {
			GDALRasterBand* gdalBand = staged->GetRasterBand(band);
			CPLErr err = CE_None;
			if constexpr (std::is_same_v<T, std::int64_t>) {
				err = gdalBand->SetNoDataValueAsInt64(navalue);
			}
			else if constexpr (std::is_same_v<T, std::uint64_t>) {
				err = gdalBand->SetNoDataValueAsUInt64(navalue);
			}
			else {
				err = gdalBand->SetNoDataValue((double)navalue);
			}
			if (err != CE_None) {
				throw IOError("Unable to set the nodata value of " + fileName + ": " + lastGdalErrorMessage());
			}
			const std::vector<T>& values = bandAtUnsafe(band).values();
			err = gdalBand->RasterIO(GF_Write, 0, 0, _ncol, _nrow, const_cast<T*>(values.data()), _ncol, _nrow, Raster<T>::GDT(), 0, 0);
			if (err != CE_None) {
				throw IOError("Unable to write band " + std::to_string(band) + " of " + fileName + ": " + lastGdalErrorMessage());
			}
		}

		UniqueGdalDataset out = gdalCreateCopyWrapper(source.GetDriver(), fileName, staged.get());
		if (!out) {
			throw IOError("Unable to write " + fileName + ": " + lastGdalErrorMessage());
		}
		if (out->FlushCache() != CE_None) {
			throw IOError("Unable to write " + fileName + ": " + lastGdalErrorMessage());
		}
	}
	template<typename T>
	inline void MultiBandRaster<T>::_checkBand(band_t band) const {
		if (band < 1 || band > (band_t)_bands.size()) {
			throw std::out_of_range("Band out of range");
		}
	}

}

#endif
