#include"test_pch.hpp"
#include"../Geometry.hpp"
#include"../MaskFillExceptions.hpp"

namespace maskfill {
	TEST(GeometryTest, PolygonRings) {
		Polygon triangle({ {0,0},{1,0},{0,1},{0,0} });
		EXPECT_EQ(triangle.getOuterRing().size(), 4);
		EXPECT_EQ(triangle.nInnerRings(), 0);
		EXPECT_TRUE(triangle.containsPoint(0.25, 0.25));
		EXPECT_FALSE(triangle.containsPoint(0.75, 0.75));

		Polygon withHole({ {0,0},{0,4},{4,4},{4,0},{0,0} });
		withHole.addInnerRing({ {1,1},{1,2},{2,2},{2,1},{1,1} });
		EXPECT_EQ(withHole.nInnerRings(), 1);
		EXPECT_EQ(withHole.getInnerRing(0)[2], CoordXY(2, 2));
		EXPECT_THROW(withHole.getInnerRing(1), std::out_of_range);
	}

	TEST(GeometryTest, MalformedRings) {
		//unclosed
		EXPECT_THROW(Polygon({ {0,0},{0,1},{1,1},{1,0} }), GeometryError);
		//too few vertices
		EXPECT_THROW(Polygon({ {0,0},{1,1},{0,0} }), GeometryError);
		//no area
		EXPECT_THROW(Polygon({ {0,0},{1,1},{2,2},{0,0} }), GeometryError);
		EXPECT_THROW(Polygon({ {0,0},{0,std::numeric_limits<double>::quiet_NaN()},{1,1},{1,0},{0,0} }), GeometryError);

		Polygon p({ {0,0},{0,4},{4,4},{4,0},{0,0} });
		EXPECT_THROW(p.addInnerRing({ {1,1},{1,2},{2,2} }), GeometryError);
	}

	TEST(GeometryTest, PolygonFromOgr) {
		OGRGeometry* raw = nullptr;
		ASSERT_EQ(OGRGeometryFactory::createFromWkt("POLYGON((0 0,10 0,10 10,0 10,0 0),(2 2,4 2,4 4,2 4,2 2))", nullptr, &raw), OGRERR_NONE);
		std::unique_ptr<OGRGeometry> geom{ raw };
		Polygon p{ *geom };
		EXPECT_EQ(p.getOuterRing().size(), 5);
		EXPECT_EQ(p.nInnerRings(), 1);
		EXPECT_TRUE(p.containsPoint(1, 1));
		EXPECT_FALSE(p.containsPoint(3, 3));

		//OGR doesn't close rings read from WKT
		raw = nullptr;
		ASSERT_EQ(OGRGeometryFactory::createFromWkt("POLYGON((0 0,10 0,10 10,0 10))", nullptr, &raw), OGRERR_NONE);
		std::unique_ptr<OGRGeometry> unclosed{ raw };
		EXPECT_THROW(Polygon{ *unclosed }, GeometryError);
	}

	TEST(GeometryTest, ContainsPoint) {
		Polygon p({ {0,0},{0,4},{4,4},{4,0},{0,0} });
		p.addInnerRing({ {1,1},{1,2},{2,2},{2,1},{1,1} });

		EXPECT_TRUE(p.containsPoint(0.5, 0.5));
		EXPECT_TRUE(p.containsPoint(3.5, 3.5));
		EXPECT_FALSE(p.containsPoint(1.5, 1.5));
		EXPECT_FALSE(p.containsPoint(-0.5, 0.5));
		EXPECT_FALSE(p.containsPoint(4.5, 0.5));

		//left and lower edges are inside, right and upper edges are not
		EXPECT_TRUE(p.containsPoint(0, 0.5));
		EXPECT_TRUE(p.containsPoint(0.5, 0));
		EXPECT_FALSE(p.containsPoint(4, 0.5));
		EXPECT_FALSE(p.containsPoint(0.5, 4));
	}

	TEST(GeometryTest, MultiPolygon) {
		MultiPolygon mp;
		EXPECT_TRUE(mp.isEmpty());
		mp.addPolygon(Polygon({ {0,0},{0,1},{1,1},{1,0},{0,0} }));
		mp.addPolygon(Polygon({ {2,2},{2,3},{3,3},{3,2},{2,2} }));
		EXPECT_EQ(mp.nPolygon(), 2);
		EXPECT_TRUE(mp.containsPoint(0.5, 0.5));
		EXPECT_TRUE(mp.containsPoint(2.5, 2.5));
		EXPECT_FALSE(mp.containsPoint(1.5, 1.5));
	}

	TEST(GeometryTest, MultiPolygonCrsMismatch) {
		MultiPolygon mp{ CoordRef("32611") };
		EXPECT_THROW(mp.addPolygon(Polygon({ {0,0},{0,1},{1,1},{1,0},{0,0} }, CoordRef("2285"))), ReprojectionError);

		//a polygon with no CRS is consistent with anything
		mp.addPolygon(Polygon({ {0,0},{0,1},{1,1},{1,0},{0,0} }));
		EXPECT_EQ(mp.nPolygon(), 1);
	}

	TEST(GeometryTest, ProjectInPlace) {
		Polygon p({ {500000,0},{500000,1000},{501000,1000},{501000,0},{500000,0} }, CoordRef("32611"));
		p.projectInPlace(CoordRef("4326"));
		EXPECT_TRUE(p.crs().isConsistentHoriz(CoordRef("4326")));
		//the central meridian of UTM zone 11 is -117, and x is always longitude
		EXPECT_NEAR(p.getOuterRing()[0].x, -117, 0.0001);
		EXPECT_NEAR(p.getOuterRing()[0].y, 0, 0.0001);
		EXPECT_GT(p.getOuterRing()[2].x, -117);
		EXPECT_GT(p.getOuterRing()[2].y, 0);
	}
}
