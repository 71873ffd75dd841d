#pragma once
#ifndef mf_alignment_h
#define mf_alignment_h

#include"maskfill_pch.hpp"
#include"CoordRef.hpp"
#include"Coordinate.hpp"
#include"GDALWrappers.hpp"

namespace maskfill {

	using GeoTransform = std::array<double, 6>;

	//The grid part of a raster: its dimensions, its GDAL-style affine transform, and its CRS
	//x = gt[0] + col * gt[1] + row * gt[2]
	//y = gt[3] + col * gt[4] + row * gt[5]
	//where (col, row) are in pixel space, so the center of a cell is at (col + 0.5, row + 0.5)
	class Alignment {
	public:
		Alignment() = default;
		Alignment(const GeoTransform& gt, rowcol_t nrow, rowcol_t ncol, const CoordRef& crs = CoordRef());

		//a north-up grid whose top-left corner is at (xmin, ymax)
		Alignment(coord_t xmin, coord_t ymax, rowcol_t nrow, rowcol_t ncol, coord_t xres, coord_t yres, const CoordRef& crs = CoordRef());

		virtual ~Alignment() = default;

		rowcol_t nrow() const;
		rowcol_t ncol() const;
		cell_t ncell() const;
		const GeoTransform& geoTransform() const;
		const CoordRef& crs() const;

		//coordinates of the center of the cell
		coord_t xFromRC(rowcol_t row, rowcol_t col) const;
		coord_t yFromRC(rowcol_t row, rowcol_t col) const;
		CoordXY xyFromCell(cell_t cell) const;

		//pixel-space coordinates of the given point; x is the fractional column and y the fractional row
		//throws FormatError if the transform is not invertible
		CoordXY pixelFromXY(coord_t x, coord_t y) const;
		bool isInvertible() const;

		cell_t cellFromRowCol(rowcol_t row, rowcol_t col) const;
		cell_t cellFromRowColUnsafe(rowcol_t row, rowcol_t col) const;
		rowcol_t rowFromCell(cell_t cell) const;
		rowcol_t colFromCell(cell_t cell) const;

		bool isSameAlignment(const Alignment& other) const;

	protected:
		GeoTransform _gt = { 0,1,0,0,0,1 };
		GeoTransform _inv = { 0,1,0,0,0,1 };
		bool _invertible = true;
		rowcol_t _nrow = 0, _ncol = 0;
		CoordRef _crs;

		void alignmentInitFromGDALRaster(GDALDataset& ds);
		void checkValidAlignment();
		void _checkCell(cell_t cell) const;

	private:
		void _computeInverse();
	};

	bool operator==(const Alignment& lhs, const Alignment& rhs);
	bool operator!=(const Alignment& lhs, const Alignment& rhs);
}

#endif
