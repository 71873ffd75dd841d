#include"test_pch.hpp"
#include"testfixtures.hpp"
#include"../Region.hpp"
#include"../MaskFillExceptions.hpp"

namespace maskfill {
	class RegionTest : public ::testing::Test {
	protected:
		TempDir dir;
	};

	TEST_F(RegionTest, ReadsEveryPolygon) {
		std::string file = dir.file("region.geojson");
		writeGeoJson(file, { rectangleRing(0, 10, 0, 10), rectangleRing(20, 30, 20, 30) });

		Region r{ file };
		EXPECT_EQ(r.nPolygon(), 2);
		EXPECT_TRUE(r.crs().isConsistentHoriz(CoordRef(TEST_EPSG)));
		EXPECT_FALSE(r.crs().isEmpty());
		EXPECT_TRUE(r.containsPoint(25, 25));
		EXPECT_FALSE(r.containsPoint(15, 15));
	}

	TEST_F(RegionTest, MultiPolygonsHolesAndCollections) {
		std::string file = dir.file("region.geojson");
		writeText(file, R"({"type":"FeatureCollection",
"crs":{"type":"name","properties":{"name":"urn:ogc:def:crs:EPSG::32611"}},
"features":[
{"type":"Feature","properties":{},"geometry":{"type":"MultiPolygon","coordinates":[
	[[[0,0],[10,0],[10,10],[0,10],[0,0]],[[2,2],[4,2],[4,4],[2,4],[2,2]]],
	[[[20,0],[30,0],[30,10],[20,10],[20,0]]]
]}},
{"type":"Feature","properties":{},"geometry":null},
{"type":"Feature","properties":{},"geometry":{"type":"GeometryCollection","geometries":[
	{"type":"Polygon","coordinates":[[[40,0],[50,0],[50,10],[40,10],[40,0]]]}
]}}
]})");

		Region r{ file };
		EXPECT_EQ(r.nPolygon(), 3);
		EXPECT_FALSE(r.containsPoint(3, 3));
		EXPECT_TRUE(r.containsPoint(1, 1));
		EXPECT_TRUE(r.containsPoint(45, 5));
	}

	TEST_F(RegionTest, EmptyGeometriesAreSkipped) {
		std::string file = dir.file("region.geojson");
		writeText(file, R"({"type":"FeatureCollection",
"crs":{"type":"name","properties":{"name":"urn:ogc:def:crs:EPSG::32611"}},
"features":[
{"type":"Feature","properties":{},"geometry":{"type":"Polygon","coordinates":[]}},
{"type":"Feature","properties":{},"geometry":{"type":"MultiPolygon","coordinates":[]}},
{"type":"Feature","properties":{},"geometry":{"type":"Polygon","coordinates":[[[0,0],[10,0],[10,10],[0,10],[0,0]]]}}
]})");

		Region r{ file };
		EXPECT_EQ(r.nPolygon(), 1);
		EXPECT_TRUE(r.containsPoint(5, 5));

		std::string onlyEmpty = dir.file("empty.geojson");
		writeText(onlyEmpty, R"({"type":"FeatureCollection","features":[
{"type":"Feature","properties":{},"geometry":{"type":"Polygon","coordinates":[]}}]})");
		EXPECT_TRUE(Region{ onlyEmpty }.isEmpty());
	}

	TEST_F(RegionTest, GeographicDefault) {
		std::string file = dir.file("region.json");
		writeGeoJson(file, { rectangleRing(-117.5, -116.5, 44.5, 45.5) }, "");
		Region r{ file };
		EXPECT_TRUE(r.crs().isConsistentHoriz(CoordRef("4326")));
		EXPECT_TRUE(r.containsPoint(-117, 45));
	}

	TEST_F(RegionTest, Malformed) {
		std::string degenerate = dir.file("degenerate.geojson");
		writeGeoJson(degenerate, { { {0,0},{5,5},{10,10},{0,0} } });
		EXPECT_THROW(Region{ degenerate }, GeometryError);

		std::string unclosed = dir.file("unclosed.geojson");
		writeGeoJson(unclosed, { { {0,0},{10,0},{10,10},{0,10} } });
		EXPECT_THROW(Region{ unclosed }, GeometryError);

		std::string tooShort = dir.file("short.geojson");
		writeGeoJson(tooShort, { { {0,0},{5,5},{0,0} } });
		EXPECT_THROW(Region{ tooShort }, GeometryError);

		std::string points = dir.file("points.geojson");
		writeText(points, R"({"type":"FeatureCollection","features":[
{"type":"Feature","properties":{},"geometry":{"type":"Point","coordinates":[1,1]}}]})");
		EXPECT_THROW(Region{ points }, GeometryError);

		std::string garbage = dir.file("garbage.geojson");
		writeText(garbage, "this is not json");
		EXPECT_THROW(Region{ garbage }, FormatError);

		EXPECT_THROW(Region{ dir.file("missing.shp") }, FormatError);
	}
}
