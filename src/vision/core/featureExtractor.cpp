#include "vision/core/featureExtractor.hpp"

#include "vision/core/imageConversion.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace kibitz::vision::core {

namespace {

//! Scale factors mapping each raw feature into roughly [0, 1].
static constexpr double GRAY_RANGE   = 255.0;
static constexpr double STDDEV_RANGE = 127.5; //!< Largest possible gray standard deviation.

//! Central half of the square (rows and cols in [n/4, 3n/4)).
static cv::Rect centerRegion(const cv::Size size) {
	const int x0 = size.width / 4;
	const int y0 = size.height / 4;
	const int x1 = 3 * size.width / 4;
	const int y1 = 3 * size.height / 4;
	return {x0, y0, std::max(1, x1 - x0), std::max(1, y1 - y0)};
}

static double darkFraction(const cv::Mat& gray, int threshold) {
	if (gray.empty()) {
		return 0.0;
	}
	cv::Mat darkMask = gray < threshold;
	return static_cast<double>(cv::countNonZero(darkMask)) / static_cast<double>(gray.total());
}

} // namespace

std::optional<FeatureVector> extractFeatures(const cv::Mat& square, const FeatureConfig& config) {
	cv::Mat gray;
	if (!convertToGray(square, gray) || gray.depth() != CV_8U) {
		return std::nullopt;
	}

	FeatureVector features{};

	// Brightness statistics.
	cv::Scalar grayMean;
	cv::Scalar grayStddev;
	cv::meanStdDev(gray, grayMean, grayStddev);
	features.avgBrightness      = grayMean[0];
	features.brightnessVariance = grayStddev[0] * grayStddev[0];

	// Edge density. Pieces have outlines, empty squares mostly do not.
	cv::Mat edges;
	cv::Canny(gray, edges, config.cannyLow, config.cannyHigh);
	features.edgeDensity = static_cast<double>(cv::countNonZero(edges)) / static_cast<double>(edges.total());

	features.darkPixelRatio = darkFraction(gray, config.darkThreshold);

	// Saturation (only meaningful for color input).
	if (square.channels() >= 3) {
		cv::Mat bgr;
		cv::Mat hsv;
		convertToBgr(square, bgr);
		cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
		features.avgSaturation = cv::mean(hsv)[1];
	}

	// Center region, where a piece usually stands.
	const cv::Mat center      = gray(centerRegion(gray.size()));
	features.centerDarkness   = darkFraction(center, config.darkThreshold);
	features.centerBrightness = cv::mean(center)[0];

	return features;
}

Descriptor toDescriptor(const FeatureVector& features) {
	return {
	        features.avgBrightness / GRAY_RANGE,
	        std::sqrt(std::max(0.0, features.brightnessVariance)) / STDDEV_RANGE,
	        features.edgeDensity,
	        features.darkPixelRatio,
	        features.avgSaturation / GRAY_RANGE,
	        features.centerDarkness,
	        features.centerBrightness / GRAY_RANGE,
	};
}

FeatureVector fromDescriptor(const Descriptor& descriptor) {
	FeatureVector features{};
	features.avgBrightness      = descriptor[0] * GRAY_RANGE;
	features.brightnessVariance = (descriptor[1] * STDDEV_RANGE) * (descriptor[1] * STDDEV_RANGE);
	features.edgeDensity        = descriptor[2];
	features.darkPixelRatio     = descriptor[3];
	features.avgSaturation      = descriptor[4] * GRAY_RANGE;
	features.centerDarkness     = descriptor[5];
	features.centerBrightness   = descriptor[6] * GRAY_RANGE;
	return features;
}

double descriptorDistance(const Descriptor& left, const Descriptor& right) {
	double sum = 0.0;
	for (std::size_t i = 0u; i < FEATURE_COUNT; ++i) {
		const double d = left[i] - right[i];
		sum += d * d;
	}
	return std::sqrt(sum);
}

} // namespace kibitz::vision::core
