#include"test_pch.hpp"
#include"testfixtures.hpp"
#include"../MaskFillRun.hpp"
#include"../AgentResponse.hpp"
#include<boost/property_tree/ptree.hpp>
#include<boost/property_tree/xml_parser.hpp>

namespace maskfill {
	class MaskFillRunTest : public ::testing::Test {
	protected:
		TempDir dir;
		Alignment grid{ 500000, 4001000, 10, 10, 100, 100, CoordRef(TEST_EPSG) };

		MaskFillConfig config() const {
			std::string region = dir.file("region.geojson");
			writeGeoJson(region, { rectangleRing(499000, 500200, 3999000, 4002000) });

			MaskFillConfig out;
			out.shapeFile = region;
			out.options.outputDir = dir.path();
			return out;
		}

		std::string writeScene(const std::string& name) const {
			std::string file = dir.file(name);
			std::vector<int16_t> values(grid.ncell(), 7);
			writeTestGeotiff<int16_t>(file, grid, { values });
			return file;
		}

		//one property tree per XML document in the output
		static std::vector<boost::property_tree::ptree> documents(const std::string& output) {
			std::vector<boost::property_tree::ptree> out;
			const std::string declaration = "<?xml";
			size_t start = output.find(declaration);
			while (start != std::string::npos) {
				size_t next = output.find(declaration, start + 1);
				std::istringstream in{ output.substr(start, next == std::string::npos ? std::string::npos : next - start) };
				boost::property_tree::ptree tree;
				boost::property_tree::read_xml(in, tree);
				out.push_back(tree);
				start = next;
			}
			return out;
		}
	};

	TEST_F(MaskFillRunTest, FailedFileDoesNotStopTheRest) {
		MaskFillConfig c = config();
		std::string missing = dir.file("missing.tif");
		std::string scene = writeScene("scene.tif");
		c.inputFiles = { missing, scene };

		std::ostringstream out;
		EXPECT_EQ(runMaskFill(c, out), MASKFILL_STATUS_MISSING_PARAMETER);

		std::vector<boost::property_tree::ptree> docs = documents(out.str());
		ASSERT_EQ(docs.size(), 2);
		EXPECT_EQ(docs[0].get<std::string>("iesi:Exception.Code"), "MissingParameterValue");
		EXPECT_EQ(docs[1].get<std::string>("ns2:agentResponse.downloadUrls"), dir.file("scene_mf.tif"));
		EXPECT_TRUE(std::filesystem::exists(dir.file("scene_mf.tif")));
		EXPECT_FALSE(std::filesystem::exists(dir.file("missing_mf.tif")));
	}

	TEST_F(MaskFillRunTest, FirstFailureSetsTheStatus) {
		MaskFillConfig c = config();
		std::string wrongType = dir.file("scene.png");
		writeText(wrongType, "");
		c.inputFiles = { writeScene("first.tif"), wrongType, dir.file("missing.h5") };

		std::ostringstream out;
		EXPECT_EQ(runMaskFill(c, out), MASKFILL_STATUS_INVALID_PARAMETER);

		std::vector<boost::property_tree::ptree> docs = documents(out.str());
		ASSERT_EQ(docs.size(), 3);
		EXPECT_EQ(docs[0].count("ns2:agentResponse"), 1);
		EXPECT_EQ(docs[1].get<std::string>("iesi:Exception.Code"), "InvalidParameterValue");
		EXPECT_EQ(docs[2].get<std::string>("iesi:Exception.Code"), "MissingParameterValue");
	}

	TEST_F(MaskFillRunTest, InternalFailuresExitWithOne) {
		MaskFillConfig c = config();
		//a .tif that isn't a raster is a FormatError, which has no status of its own
		std::string corrupt = dir.file("corrupt.tif");
		writeText(corrupt, "not a tiff");
		c.inputFiles = { corrupt };

		std::ostringstream out;
		EXPECT_EQ(runMaskFill(c, out), 1);
		std::vector<boost::property_tree::ptree> docs = documents(out.str());
		ASSERT_EQ(docs.size(), 1);
		EXPECT_EQ(docs[0].get<std::string>("iesi:Exception.Code"), "InternalError");
	}

	TEST_F(MaskFillRunTest, InvalidConfigProcessesNothing) {
		MaskFillConfig c = config();
		c.inputFiles = { writeScene("scene.tif") };
		c.shapeFile.clear();

		std::ostringstream out;
		EXPECT_EQ(runMaskFill(c, out), MASKFILL_STATUS_MISSING_PARAMETER);
		EXPECT_EQ(documents(out.str()).size(), 1);
		EXPECT_FALSE(std::filesystem::exists(dir.file("scene_mf.tif")));
	}

	TEST_F(MaskFillRunTest, AllSucceed) {
		MaskFillConfig c = config();
		c.inputFiles = { writeScene("a.tif"), writeScene("b.tif") };

		std::ostringstream out;
		EXPECT_EQ(runMaskFill(c, out), MASKFILL_STATUS_SUCCESS);
		EXPECT_EQ(documents(out.str()).size(), 2);
		EXPECT_TRUE(std::filesystem::exists(dir.file("a_mf.tif")));
		EXPECT_TRUE(std::filesystem::exists(dir.file("b_mf.tif")));
	}
}
