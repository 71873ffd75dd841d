#pragma once
#ifndef mf_raster_h
#define mf_raster_h

#include"maskfill_pch.hpp"
#include"Alignment.hpp"
#include"MaskFillExceptions.hpp"

namespace maskfill {

	template<class T>
	class MultiBandRaster;

	template<class T>
	using RastData = xtl::xoptional_vector<T>;

	template<class T>
	constexpr GDALDataType gdalTypeFor() {
		if constexpr (std::is_same_v<T, std::uint8_t>) {
			return GDT_Byte;
		}
		else if constexpr (std::is_same_v<T, std::int8_t>) {
			return GDT_Int8;
		}
		else if constexpr (std::is_same_v<T, std::int16_t>) {
			return GDT_Int16;
		}
		else if constexpr (std::is_same_v<T, std::uint16_t>) {
			return GDT_UInt16;
		}
		else if constexpr (std::is_same_v<T, std::int32_t>) {
			return GDT_Int32;
		}
		else if constexpr (std::is_same_v<T, std::uint32_t>) {
			return GDT_UInt32;
		}
		else if constexpr (std::is_same_v<T, std::int64_t>) {
			return GDT_Int64;
		}
		else if constexpr (std::is_same_v<T, std::uint64_t>) {
			return GDT_UInt64;
		}
		else if constexpr (std::is_same_v<T, float>) {
			return GDT_Float32;
		}
		else if constexpr (std::is_same_v<T, double>) {
			return GDT_Float64;
		}
		else {
			return GDT_Unknown;
		}
	}

	//reads the nodata value of the band in its own type, if it has one
	template<class T>
	std::optional<T> noDataValueAs(GDALRasterBand& band) {
		int hasNoData = FALSE;
		if constexpr (std::is_same_v<T, std::int64_t>) {
			int64_t v = band.GetNoDataValueAsInt64(&hasNoData);
			return hasNoData ? std::optional<T>(v) : std::nullopt;
		}
		else if constexpr (std::is_same_v<T, std::uint64_t>) {
			uint64_t v = band.GetNoDataValueAsUInt64(&hasNoData);
			return hasNoData ? std::optional<T>(v) : std::nullopt;
		}
		else {
			double v = band.GetNoDataValue(&hasNoData);
			if (!hasNoData) {
				return std::nullopt;
			}
			if constexpr (std::is_integral_v<T>) {
				if (std::isnan(v) || v < (double)std::numeric_limits<T>::lowest() || v > (double)std::numeric_limits<T>::max()) {
					//a nodata value the band can't hold matches no cell
					return std::nullopt;
				}
			}
			return (T)v;
		}
	}

	template<class T>
	class Raster : public Alignment {
	public:

		friend class MultiBandRaster<T>;

		Raster() : Alignment(), _data() {}
		virtual ~Raster() noexcept = default;

		//creates a raster from the given alignment, and fills it with missing values
		explicit Raster(const Alignment& a) : Alignment(a) {
			_data.resize(ncell());
		}

		//Constructs a raster from a GDAL-readable file.
		//throws FormatError if the file can't be read
		Raster(const std::string& filename, const int band = 1);

		//Reads one band of an already opened dataset
		Raster(GDALDataset& ds, const int band);

		//disallow copy and move constructors from rasters with different templates. This will call the Raster(const Alignment& a) signature, which is very confusing
		template<class S>
		Raster(const Raster<S>& r) = delete;
		template<class S>
		Raster(Raster<S>&& r) = delete;
		template<class S>
		Raster<T>& operator=(const Raster<S>& r) = delete;
		template<class S>
		Raster<T>& operator=(Raster<S>&& r) = delete;

		Raster(const Raster<T>& r) = default;
		Raster(Raster<T>&& r) noexcept = default;
		Raster<T>& operator=(const Raster<T>& r) = default;
		Raster<T>& operator=(Raster<T>&& r) noexcept = default;

		//Methods to access values. As usual, operator[] does no bounds checking. The others do check.
		auto atCell(const cell_t cell) {
			_checkCell(cell);
			return (*this)[cell];
		}
		auto atRC(const rowcol_t row, const rowcol_t col) {
			return (*this)[cellFromRowCol(row, col)];
		}
		const auto atCell(const cell_t cell) const {
			_checkCell(cell);
			return (*this)[cell];
		}
		const auto atRC(const rowcol_t row, const rowcol_t col) const {
			return (*this)[cellFromRowCol(row, col)];
		}

		auto atRCUnsafe(const rowcol_t row, const rowcol_t col) {
			return (*this)[cellFromRowColUnsafe(row, col)];
		}
		const auto atRCUnsafe(const rowcol_t row, const rowcol_t col) const {
			return (*this)[cellFromRowColUnsafe(row, col)];
		}
		const auto operator[](const cell_t cell) const {
			return _data[cell];
		}
		auto operator[](const cell_t cell) {
			return _data[cell];
		}
		auto atCellUnsafe(const cell_t cell) {
			return _data[cell];
		}
		const auto atCellUnsafe(const cell_t cell) const {
			return _data[cell];
		}

		//the raw values, including those in cells without a value
		const std::vector<T>& values() const {
			return _data.value();
		}

		//Writes the raster as a single band file. Missing values are replaced by navalue
		//throws IOError if the file can't be written
		void writeRaster(const std::string& file, const std::string& driver = "GTiff", const T navalue = std::numeric_limits<T>::lowest()) const;

		auto begin() { return _data.begin(); }
		auto end() { return _data.end(); }
		auto begin() const { return _data.begin(); }
		auto end() const { return _data.end(); }

		static constexpr GDALDataType GDT() {
			return gdalTypeFor<T>();
		}

	private:
		RastData<T> _data;

		void _readBand(GDALDataset& ds, const int band);
	};

	template<class T>
	inline bool operator==(const Raster<T>& lhs, const Raster<T>& rhs) {
		if (!lhs.isSameAlignment(rhs)) {
			return false;
		}
		for (cell_t cell = 0; cell < lhs.ncell(); ++cell) {
			if (lhs[cell].has_value() != rhs[cell].has_value()) {
				return false;
			}
			if (lhs[cell].has_value() && lhs[cell].value() != rhs[cell].value()) {
				return false;
			}
		}
		return true;
	}
	template<class T>
	inline bool operator!=(const Raster<T>& lhs, const Raster<T>& rhs) {
		return !(lhs == rhs);
	}

	template<class T>
	Raster<T>::Raster(const std::string& filename, const int band) {
		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw FormatError("Unable to open " + filename + " as a raster: " + lastGdalErrorMessage());
		}
		_readBand(*wgd, band);
	}

	template<class T>
	Raster<T>::Raster(GDALDataset& ds, const int band) {
		_readBand(ds, band);
	}

	template<class T>
	void Raster<T>::_readBand(GDALDataset& ds, const int band) {
		alignmentInitFromGDALRaster(ds);
		checkValidAlignment();

		GDALRasterBand* rBand = ds.GetRasterBand(band);
		if (!rBand) {
			throw FormatError("Raster has no band " + std::to_string(band));
		}

		_data.resize(ncell());
		if (rBand->RasterIO(GF_Read, 0, 0, _ncol, _nrow, _data.value().data(), _ncol, _nrow, GDT(), 0, 0) != CE_None) {
			throw FormatError("Unable to read band " + std::to_string(band) + ": " + lastGdalErrorMessage());
		}

		std::optional<T> naValue = noDataValueAs<T>(*rBand);
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			T v = _data.value()[cell];
			bool hasValue = !naValue || v != *naValue;
			if constexpr (std::is_floating_point_v<T>) {
				hasValue = hasValue && !std::isnan(v);
			}
			_data.has_value()[cell] = hasValue;
		}
	}

	template<class T>
	void Raster<T>::writeRaster(const std::string& file, const std::string& driver, const T navalue) const {
		UniqueGdalDataset wgd = gdalCreateWrapper(driver, file, ncol(), nrow(), 1, GDT());
		if (!wgd) {
			throw IOError("Unable to create " + file + ": " + lastGdalErrorMessage());
		}
		GeoTransform gt = _gt;
		wgd->SetGeoTransform(gt.data());
		if (!_crs.isEmpty()) {
			wgd->SetProjection(_crs.getCompleteWKT().c_str());
		}

		std::vector<T> out = _data.value();
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (!_data[cell].has_value()) {
				out[cell] = navalue;
			}
		}
		GDALRasterBand* band = wgd->GetRasterBand(1);
		band->SetNoDataValue((double)navalue);
		if (band->RasterIO(GF_Write, 0, 0, _ncol, _nrow, out.data(), _ncol, _nrow, GDT(), 0, 0) != CE_None) {
			throw IOError("Unable to write " + file + ": " + lastGdalErrorMessage());
		}
	}
}

#endif
