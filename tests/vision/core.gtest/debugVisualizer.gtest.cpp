#include "vision/core/debugVisualizer.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <filesystem>

namespace kibitz::vision::core {
namespace gtest {

namespace fs = std::filesystem;

static void collectTwoStages(DebugVisualizer& debugger) {
	debugger.beginStage("First");
	debugger.add("Gray", cv::Mat(40, 60, CV_8UC1, cv::Scalar(128)));
	debugger.add("Color", cv::Mat(40, 60, CV_8UC3, cv::Scalar(0, 0, 255)));
	debugger.beginStage("Second");
	debugger.add("Mask", cv::Mat(30, 30, CV_32FC1, cv::Scalar(0.5)));
	debugger.endStage();
}

TEST(DebugVisualizer, Stages_Build_Mosaic) {
	DebugVisualizer debugger;
	collectTwoStages(debugger);
	EXPECT_EQ(debugger.stageCount(), 2u);

	const cv::Mat mosaic = debugger.buildMosaic();
	ASSERT_FALSE(mosaic.empty());
	EXPECT_EQ(mosaic.type(), CV_8UC3);

	debugger.clear();
	EXPECT_EQ(debugger.stageCount(), 0u);
	EXPECT_TRUE(debugger.buildMosaic().empty());
}

TEST(DebugVisualizer, Save_Mosaic_Png) {
	const fs::path path = fs::temp_directory_path() / "kibitz_debug_mosaic.png";
	fs::remove(path);

	DebugVisualizer debugger;
	collectTwoStages(debugger);
	ASSERT_TRUE(debugger.saveMosaic(path));
	EXPECT_TRUE(fs::exists(path));

	fs::remove(path);
}

TEST(DebugVisualizer, Save_Mosaic_Nothing_Collected) {
	DebugVisualizer debugger;
	EXPECT_FALSE(debugger.saveMosaic(fs::temp_directory_path() / "kibitz_debug_empty.png"));
}

TEST(DebugVisualizer, Save_Mosaic_Unknown_Extension) {
	const fs::path path = fs::temp_directory_path() / "kibitz_debug_mosaic.txt";

	DebugVisualizer debugger;
	collectTwoStages(debugger);
	bool saved = true;
	EXPECT_NO_THROW(saved = debugger.saveMosaic(path));
	EXPECT_FALSE(saved);
	EXPECT_FALSE(fs::exists(path));
}

} // namespace gtest
} // namespace kibitz::vision::core
