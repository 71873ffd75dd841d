#include"test_pch.hpp"
#include"../Alignment.hpp"
#include"../CoordTransform.hpp"
#include"../MaskFillExceptions.hpp"

namespace maskfill {
	TEST(AlignmentTest, NorthUp) {
		Alignment a{ 100, 50, 4, 5, 2, 3, CoordRef("32611") };
		EXPECT_EQ(a.nrow(), 4);
		EXPECT_EQ(a.ncol(), 5);
		EXPECT_EQ(a.ncell(), 20);

		EXPECT_EQ(a.xFromRC(0, 0), 101);
		EXPECT_EQ(a.yFromRC(0, 0), 48.5);
		EXPECT_EQ(a.xFromRC(3, 4), 109);
		EXPECT_EQ(a.yFromRC(3, 4), 39.5);

		CoordXY pixel = a.pixelFromXY(101, 48.5);
		EXPECT_NEAR(pixel.x, 0.5, MASKFILL_EPSILON);
		EXPECT_NEAR(pixel.y, 0.5, MASKFILL_EPSILON);
	}

	TEST(AlignmentTest, CellIndexing) {
		Alignment a{ 0, 0, 3, 4, 1, 1 };
		EXPECT_EQ(a.cellFromRowCol(1, 2), 6);
		EXPECT_EQ(a.rowFromCell(6), 1);
		EXPECT_EQ(a.colFromCell(6), 2);
		EXPECT_THROW(a.cellFromRowCol(3, 0), OutsideGridException);
		EXPECT_THROW(a.cellFromRowCol(0, -1), OutsideGridException);
	}

	TEST(AlignmentTest, RotatedTransform) {
		GeoTransform gt = { 10, 1, 1, 20, -1, 1 };
		Alignment a{ gt, 2, 2 };
		EXPECT_TRUE(a.isInvertible());
		CoordXY xy = a.xyFromCell(3);
		CoordXY pixel = a.pixelFromXY(xy.x, xy.y);
		EXPECT_NEAR(pixel.x, 1.5, MASKFILL_EPSILON);
		EXPECT_NEAR(pixel.y, 1.5, MASKFILL_EPSILON);

		GeoTransform singular = { 0, 1, 1, 0, 1, 1 };
		Alignment s{ singular, 2, 2 };
		EXPECT_FALSE(s.isInvertible());
		EXPECT_THROW(s.pixelFromXY(0, 0), FormatError);
	}

	TEST(AlignmentTest, SameAlignment) {
		Alignment a{ 0, 10, 10, 10, 1, 1, CoordRef("32611") };
		Alignment b{ 0, 10, 10, 10, 1, 1, CoordRef("32611") };
		Alignment shifted{ 0.5, 10, 10, 10, 1, 1, CoordRef("32611") };
		Alignment otherCrs{ 0, 10, 10, 10, 1, 1, CoordRef("2285") };
		EXPECT_TRUE(a.isSameAlignment(b));
		EXPECT_EQ(a, b);
		EXPECT_FALSE(a.isSameAlignment(shifted));
		EXPECT_FALSE(a.isSameAlignment(otherCrs));
		EXPECT_NE(a, otherCrs);
	}

	TEST(CoordRefTest, Parsing) {
		CoordRef empty;
		EXPECT_TRUE(empty.isEmpty());
		EXPECT_TRUE(CoordRef("").isEmpty());

		CoordRef utm{ "32611" };
		EXPECT_FALSE(utm.isEmpty());
		EXPECT_TRUE(utm.isConsistentHoriz(CoordRef("EPSG:32611")));
		EXPECT_FALSE(utm.isConsistentHoriz(CoordRef("EPSG:32610")));
		EXPECT_TRUE(utm.isConsistentHoriz(empty));

		CoordRef fromProj{ "+proj=utm +zone=11 +datum=WGS84 +units=m +no_defs" };
		EXPECT_FALSE(fromProj.isEmpty());
		EXPECT_NE(fromProj.getProj4().find("+proj=utm"), std::string::npos);

		EXPECT_THROW(CoordRef("not a coordinate system"), ReprojectionError);
	}

	TEST(CoordRefTest, CompoundCrsIsConsistentWithItsHorizontalPart) {
		CoordRef compound{ "EPSG:32611+5703" };
		EXPECT_TRUE(compound.isConsistentHoriz(CoordRef("32611")));
	}

	TEST(CoordTransformTest, TransformPoints) {
		CoordTransform noop{ CoordRef("32611"), CoordRef("EPSG:32611") };
		EXPECT_TRUE(noop.isNoOp());

		CoordTransform tr{ CoordRef("4326"), CoordRef("32611") };
		EXPECT_FALSE(tr.isNoOp());
		CoordXYVector points = { {-117, 0}, {-117, 10} };
		tr.transformXY(points);
		EXPECT_NEAR(points[0].x, 500000, 0.01);
		EXPECT_NEAR(points[0].y, 0, 0.01);
		EXPECT_NEAR(points[1].x, 500000, 0.01);
		EXPECT_GT(points[1].y, 1000000);
	}

}
