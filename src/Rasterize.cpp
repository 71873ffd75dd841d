#include"Rasterize.hpp"

namespace maskfill {

	namespace {
		std::vector<CoordXYVector> ringsInPixelSpace(const Alignment& a, const Polygon& poly) {
			std::vector<CoordXYVector> out;
			out.reserve(poly.nInnerRings() + 1);
			auto convert = [&](const CoordXYVector& ring) {
				CoordXYVector pixels;
				pixels.reserve(ring.size());
				for (const CoordXY& xy : ring) {
					pixels.push_back(a.pixelFromXY(xy.x, xy.y));
				}
				out.push_back(std::move(pixels));
				};
			convert(poly.getOuterRing());
			for (int i = 0; i < poly.nInnerRings(); ++i) {
				convert(poly.getInnerRing(i));
			}
			return out;
		}

		void burnCellCenters(Raster<mask_t>& mask, const std::vector<CoordXYVector>& rings) {
			coord_t ymin = std::numeric_limits<coord_t>::max();
			coord_t ymax = std::numeric_limits<coord_t>::lowest();
			for (const CoordXY& xy : rings.front()) {
				ymin = std::min(ymin, xy.y);
				ymax = std::max(ymax, xy.y);
			}
			coord_t firstRow = std::max<coord_t>(0, std::ceil(ymin - 0.5));
			coord_t lastRow = std::min<coord_t>(mask.nrow() - 1, std::floor(ymax - 0.5));
			if (firstRow > lastRow) {
				return;
			}

			std::vector<coord_t> crossings;
			for (rowcol_t row = (rowcol_t)firstRow; row <= (rowcol_t)lastRow; ++row) {
				coord_t y = row + 0.5;
				crossings.clear();
				for (const CoordXYVector& ring : rings) {
					for (size_t i = 1; i < ring.size(); ++i) {
						const CoordXY& a = ring[i - 1];
						const CoordXY& b = ring[i];
						//half-open in y, so a vertex on the scanline is counted once
						if ((a.y > y) != (b.y > y)) {
							crossings.push_back((b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x);
						}
					}
				}
				std::sort(crossings.begin(), crossings.end());

				//even-odd: cells whose centers are in [crossings[2k], crossings[2k+1]) are inside
				for (size_t k = 0; k + 1 < crossings.size(); k += 2) {
					coord_t firstCol = std::max<coord_t>(0, std::ceil(crossings[k] - 0.5));
					coord_t lastCol = std::min<coord_t>(mask.ncol() - 1, std::ceil(crossings[k + 1] - 0.5) - 1);
					if (firstCol > lastCol) {
						continue;
					}
					for (rowcol_t col = (rowcol_t)firstCol; col <= (rowcol_t)lastCol; ++col) {
						mask.atRCUnsafe(row, col).value() = 1;
					}
				}
			}
		}

		//marks every cell whose closed square shares a point with the segment
		void burnSegment(Raster<mask_t>& mask, CoordXY begin, CoordXY end) {
			coord_t xlo = std::min(begin.x, end.x);
			coord_t xhi = std::max(begin.x, end.x);
			if (xhi < -1 || xlo > mask.ncol() + 1) {
				return;
			}
			coord_t dx = end.x - begin.x;
			coord_t dy = end.y - begin.y;

			rowcol_t firstCol = (rowcol_t)std::max<coord_t>(0, std::ceil(xlo - MASKFILL_EPSILON) - 1);
			rowcol_t lastCol = (rowcol_t)std::min<coord_t>(mask.ncol() - 1, std::floor(xhi + MASKFILL_EPSILON));
			for (rowcol_t col = firstCol; col <= lastCol; ++col) {
				coord_t ylo, yhi;
				if (std::abs(dx) < MASKFILL_EPSILON) {
					ylo = std::min(begin.y, end.y);
					yhi = std::max(begin.y, end.y);
				}
				else {
					//the part of the segment that lies within this column
					coord_t x0 = std::clamp<coord_t>(col, xlo, xhi);
					coord_t x1 = std::clamp<coord_t>(col + 1, xlo, xhi);
					coord_t y0 = begin.y + (x0 - begin.x) / dx * dy;
					coord_t y1 = begin.y + (x1 - begin.x) / dx * dy;
					ylo = std::min(y0, y1);
					yhi = std::max(y0, y1);
				}
				if (yhi < -1 || ylo > mask.nrow() + 1) {
					continue;
				}
				rowcol_t firstRow = (rowcol_t)std::max<coord_t>(0, std::ceil(ylo - MASKFILL_EPSILON) - 1);
				rowcol_t lastRow = (rowcol_t)std::min<coord_t>(mask.nrow() - 1, std::floor(yhi + MASKFILL_EPSILON));
				for (rowcol_t row = firstRow; row <= lastRow; ++row) {
					mask.atRCUnsafe(row, col).value() = 1;
				}
			}
		}
	}

	RasterizePolicy parseRasterizePolicy(const std::string& s)
	{
		if (EQUAL(s.c_str(), "center")) {
			return RasterizePolicy::cellCenter;
		}
		if (EQUAL(s.c_str(), "all_touched")) {
			return RasterizePolicy::allTouched;
		}
		throw ParameterError("Unknown boundary policy: " + s + ". Expected center or all_touched");
	}
	std::string rasterizePolicyName(RasterizePolicy policy)
	{
		switch (policy) {
		case RasterizePolicy::allTouched:
			return "all_touched";
		default:
			return "center";
		}
	}

	Raster<mask_t> rasterizeRegion(const Alignment& a, const MultiPolygon& region, RasterizePolicy policy)
	{
		if (!region.crs().isConsistentHoriz(a.crs())) {
			throw ReprojectionError("The region's CRS (" + region.crs().getShortName() + ") does not match the raster's CRS (" + a.crs().getShortName() + ")");
		}
		if (!a.isInvertible()) {
			throw FormatError("The raster's affine transform is not invertible");
		}

		Raster<mask_t> mask{ a };
		for (cell_t cell = 0; cell < mask.ncell(); ++cell) {
			mask[cell].has_value() = true;
			mask[cell].value() = 0;
		}
		if (mask.ncell() == 0) {
			return mask;
		}

		for (const Polygon& poly : region) {
			std::vector<CoordXYVector> rings = ringsInPixelSpace(a, poly);
			burnCellCenters(mask, rings);
			if (policy == RasterizePolicy::allTouched) {
				for (const CoordXYVector& ring : rings) {
					for (size_t i = 1; i < ring.size(); ++i) {
						burnSegment(mask, ring[i - 1], ring[i]);
					}
				}
			}
		}
		return mask;
	}
}
