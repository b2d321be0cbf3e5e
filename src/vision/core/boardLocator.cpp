#include "vision/core/boardLocator.hpp"

#include "vision/core/imageConversion.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace kibitz::vision::core {

namespace {

//! Ensure odd kernel sizes for blur/threshold operations.
static int makeOddKernelSize(int value) {
	value = std::max(value, 3);
	return (value % 2 == 0) ? value + 1 : value;
}

//! Board candidate that passed the size and shape filter.
struct BoardCandidate {
	int contourIdx{-1};
	double area{0.0};
	cv::Rect bounds{};
};

//! Binary image whose contours outline the board and its squares.
static cv::Mat buildThresholdMask(const cv::Mat& gray, const LocatorConfig& config, DebugVisualizer* debugger) {
	const int blurSize = makeOddKernelSize(config.blurKernelSize);

	cv::Mat blurred;
	cv::GaussianBlur(gray, blurred, cv::Size(blurSize, blurSize), 0.0);
	if (debugger)
		debugger->add("Gaussian Blur", blurred);

	cv::Mat mask;
	cv::adaptiveThreshold(blurred, mask, 255.0, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, makeOddKernelSize(config.thresholdBlockSize),
	                      config.thresholdOffset);
	if (debugger)
		debugger->add("Adaptive Threshold", mask);

	return mask;
}

//! Check size and aspect constraints of a contour.
static std::optional<BoardCandidate> toCandidate(const std::vector<cv::Point>& contour, int contourIdx, const LocatorConfig& config, bool verbose) {
	const double area    = std::abs(cv::contourArea(contour));
	const double minArea = static_cast<double>(config.minBoardSize) * static_cast<double>(config.minBoardSize);
	const double maxArea = static_cast<double>(config.maxBoardSize) * static_cast<double>(config.maxBoardSize);
	if (area <= minArea || area >= maxArea) {
		return std::nullopt;
	}

	const cv::Rect bounds = cv::boundingRect(contour);
	const double aspect   = bounds.height > 0 ? static_cast<double>(bounds.width) / static_cast<double>(bounds.height) : 0.0;
	if (aspect <= config.minAspectRatio || aspect >= config.maxAspectRatio) {
		if (verbose) {
			std::cout << "[vision-debug] idx=" << contourIdx << " area=" << area << " aspect=" << aspect << " reject=aspect\n";
		}
		return std::nullopt;
	}

	if (verbose) {
		std::cout << "[vision-debug] idx=" << contourIdx << " area=" << area << " aspect=" << aspect << " bounds=" << bounds << '\n';
	}
	return BoardCandidate{contourIdx, area, bounds};
}

} // namespace

std::optional<cv::Rect> locateBoard(const cv::Mat& image, const LocatorConfig& config, DebugVisualizer* debugger) {
	const auto fail = [&](const std::string& message) -> std::optional<cv::Rect> {
		std::cerr << "[Warning] " << message << '\n';
		if (debugger) {
			debugger->endStage();
		}
		return std::nullopt;
	};

	if (debugger) {
		debugger->beginStage("Locate Board");
		debugger->add("Input", image);
	}

	cv::Mat gray;
	if (!convertToGray(image, gray)) {
		return fail("Unsupported or empty input image");
	}
	if (debugger)
		debugger->add("Grayscale", gray);

	const cv::Mat mask = buildThresholdMask(gray, config, debugger);

	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(mask, contours, cv::RETR_TREE, cv::CHAIN_APPROX_SIMPLE);
	if (contours.empty()) {
		return fail("No contours found");
	}

	const bool verbose = debugLoggingEnabled();
	std::vector<BoardCandidate> candidates;
	for (int i = 0; i < static_cast<int>(contours.size()); ++i) {
		if (auto candidate = toCandidate(contours[static_cast<std::size_t>(i)], i, config, verbose)) {
			candidates.push_back(*candidate);
		}
	}
	if (verbose) {
		std::cout << "[vision-debug] contours=" << contours.size() << " candidates=" << candidates.size() << '\n';
	}
	if (candidates.empty()) {
		return fail("No board contour passed the size and aspect filter");
	}

	const auto best =
	        std::max_element(candidates.begin(), candidates.end(), [](const BoardCandidate& left, const BoardCandidate& right) { return left.area < right.area; });

	if (debugger) {
		cv::Mat selected;
		if (convertToBgr(image, selected)) {
			cv::drawContours(selected, contours, best->contourIdx, cv::Scalar(255, 0, 0), 2);
			cv::rectangle(selected, best->bounds, cv::Scalar(0, 255, 0), 3);
			debugger->add("Board Selected", selected);
		}
		debugger->endStage();
	}

	return best->bounds;
}

cv::Mat extractBoard(const cv::Mat& image, const cv::Rect& region) {
	if (image.empty()) {
		return {};
	}

	const cv::Rect clamped = region & cv::Rect(0, 0, image.cols, image.rows);
	if (clamped.empty()) {
		return {};
	}
	return image(clamped).clone();
}

cv::Mat normaliseBoard(const cv::Mat& board, const int size) {
	if (board.empty() || size <= 0) {
		return {};
	}

	cv::Mat resized;
	const int interpolation = (board.cols > size || board.rows > size) ? cv::INTER_AREA : cv::INTER_LINEAR;
	cv::resize(board, resized, cv::Size(size, size), 0.0, 0.0, interpolation);
	return resized;
}

} // namespace kibitz::vision::core
