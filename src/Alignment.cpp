#include"Alignment.hpp"
#include"MaskFillExceptions.hpp"

namespace maskfill {
	Alignment::Alignment(const GeoTransform& gt, rowcol_t nrow, rowcol_t ncol, const CoordRef& crs)
		: _gt(gt), _nrow(nrow), _ncol(ncol), _crs(crs)
	{
		checkValidAlignment();
	}
	Alignment::Alignment(coord_t xmin, coord_t ymax, rowcol_t nrow, rowcol_t ncol, coord_t xres, coord_t yres, const CoordRef& crs)
		: Alignment(GeoTransform{ xmin, xres, 0, ymax, 0, -yres }, nrow, ncol, crs)
	{
	}
	rowcol_t Alignment::nrow() const
	{
		return _nrow;
	}
	rowcol_t Alignment::ncol() const
	{
		return _ncol;
	}
	cell_t Alignment::ncell() const
	{
		return (cell_t)_nrow * (cell_t)_ncol;
	}
	const GeoTransform& Alignment::geoTransform() const
	{
		return _gt;
	}
	const CoordRef& Alignment::crs() const
	{
		return _crs;
	}
	coord_t Alignment::xFromRC(rowcol_t row, rowcol_t col) const
	{
		return _gt[0] + (col + 0.5) * _gt[1] + (row + 0.5) * _gt[2];
	}
	coord_t Alignment::yFromRC(rowcol_t row, rowcol_t col) const
	{
		return _gt[3] + (col + 0.5) * _gt[4] + (row + 0.5) * _gt[5];
	}
	CoordXY Alignment::xyFromCell(cell_t cell) const
	{
		_checkCell(cell);
		rowcol_t row = rowFromCell(cell);
		rowcol_t col = colFromCell(cell);
		return { xFromRC(row, col), yFromRC(row, col) };
	}
	CoordXY Alignment::pixelFromXY(coord_t x, coord_t y) const
	{
		if (!_invertible) {
			throw FormatError("The raster's affine transform is not invertible");
		}
		return { _inv[0] + x * _inv[1] + y * _inv[2], _inv[3] + x * _inv[4] + y * _inv[5] };
	}
	bool Alignment::isInvertible() const
	{
		return _invertible;
	}
	cell_t Alignment::cellFromRowCol(rowcol_t row, rowcol_t col) const
	{
		if (row < 0 || col < 0 || row >= _nrow || col >= _ncol) {
			throw OutsideGridException("Row/col pair outside of grid");
		}
		return cellFromRowColUnsafe(row, col);
	}
	cell_t Alignment::cellFromRowColUnsafe(rowcol_t row, rowcol_t col) const
	{
		return (cell_t)row * _ncol + col;
	}
	rowcol_t Alignment::rowFromCell(cell_t cell) const
	{
		return (rowcol_t)(cell / _ncol);
	}
	rowcol_t Alignment::colFromCell(cell_t cell) const
	{
		return (rowcol_t)(cell % _ncol);
	}
	bool Alignment::isSameAlignment(const Alignment& other) const
	{
		if (_nrow != other._nrow || _ncol != other._ncol) {
			return false;
		}
		if (!_crs.isConsistentHoriz(other._crs)) {
			return false;
		}
		for (size_t i = 0; i < _gt.size(); ++i) {
			if (std::abs(_gt[i] - other._gt[i]) > MASKFILL_EPSILON) {
				return false;
			}
		}
		return true;
	}
	void Alignment::alignmentInitFromGDALRaster(GDALDataset& ds)
	{
		//a raster without a geotransform is left in pixel space, which is what GDAL reports for it
		if (ds.GetGeoTransform(_gt.data()) != CE_None) {
			_gt = { 0,1,0,0,0,1 };
		}
		_nrow = ds.GetRasterYSize();
		_ncol = ds.GetRasterXSize();
		_crs = CoordRef(ds.GetSpatialRef());
	}
	void Alignment::checkValidAlignment()
	{
		if (_nrow < 0 || _ncol < 0) {
			throw FormatError("Raster dimensions cannot be negative");
		}
		for (double v : _gt) {
			if (!std::isfinite(v)) {
				throw FormatError("Raster geotransform is not finite");
			}
		}
		_computeInverse();
	}
	void Alignment::_checkCell(cell_t cell) const
	{
		if (cell < 0 || cell >= ncell()) {
			throw OutsideGridException("Cell outside of grid");
		}
	}
	void Alignment::_computeInverse()
	{
		GeoTransform gt = _gt;
		_invertible = GDALInvGeoTransform(gt.data(), _inv.data()) != 0;
	}

	bool operator==(const Alignment& lhs, const Alignment& rhs)
	{
		return lhs.isSameAlignment(rhs);
	}
	bool operator!=(const Alignment& lhs, const Alignment& rhs)
	{
		return !(lhs == rhs);
	}
}
