#pragma once

#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace kibitz::vision::core {

//! Verbose pipeline diagnostics on stdout. Enabled with the environment variable KIBITZ_VISION_DEBUG=1.
bool debugLoggingEnabled();

//! Each step in the algorithm.
struct DebugStep {
	std::string name; //!< Step label shown above the image.
	cv::Mat image;    //!< Image produced by the step.
};

//! The recognition pipeline has multiple stages (locate, segment, classify). We collect the images per stage.
struct DebugStage {
	std::string name;
	std::vector<DebugStep> steps{};
};

//! Can be passed to pipeline functions to collect intermediate images for inspection.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< New stage starts. Ends an active stage.
	void add(std::string name, const cv::Mat& img); //!< Add an image to the active stage. Ignored without an active stage.
	void endStage();

	//! One row per stage, one tile per step. Ends the currently active stage.
	//! \returns Empty image if nothing was collected.
	cv::Mat buildMosaic();

	//! Build the mosaic and write it to disk.
	bool saveMosaic(const std::filesystem::path& path);

	std::size_t stageCount() const;
	void clear();

private:
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	DebugStage m_currentStage{};
	bool m_hasActiveStage{false};
	std::vector<DebugStage> m_stages{};
};

} // namespace kibitz::vision::core
