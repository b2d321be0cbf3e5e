#include "vision/core/featureExtractor.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

namespace kibitz::vision::core {
namespace gtest {

TEST(FeatureExtractor, Uniform_Square) {
	const cv::Mat square(100, 100, CV_8UC3, cv::Scalar::all(200));
	const auto features = extractFeatures(square);
	ASSERT_TRUE(features.has_value());

	EXPECT_NEAR(features->avgBrightness, 200.0, 1e-9);
	EXPECT_NEAR(features->brightnessVariance, 0.0, 1e-9);
	EXPECT_DOUBLE_EQ(features->edgeDensity, 0.0);
	EXPECT_DOUBLE_EQ(features->darkPixelRatio, 0.0);
	EXPECT_NEAR(features->avgSaturation, 0.0, 1e-9);
	EXPECT_DOUBLE_EQ(features->centerDarkness, 0.0);
	EXPECT_NEAR(features->centerBrightness, 200.0, 1e-9);
}

TEST(FeatureExtractor, Half_Dark_Square) {
	cv::Mat square(100, 100, CV_8UC1, cv::Scalar(255));
	square(cv::Rect(0, 0, 50, 100)).setTo(cv::Scalar(0));

	const auto features = extractFeatures(square);
	ASSERT_TRUE(features.has_value());

	EXPECT_NEAR(features->avgBrightness, 127.5, 1e-9);
	EXPECT_NEAR(features->brightnessVariance, 127.5 * 127.5, 1e-6);
	EXPECT_GT(features->edgeDensity, 0.0);
	EXPECT_LT(features->edgeDensity, 0.05);
	EXPECT_DOUBLE_EQ(features->darkPixelRatio, 0.5);
	EXPECT_DOUBLE_EQ(features->centerDarkness, 0.5);
	EXPECT_NEAR(features->centerBrightness, 127.5, 1e-9);
}

TEST(FeatureExtractor, Dark_Piece_In_Center) {
	cv::Mat square(100, 100, CV_8UC3, cv::Scalar::all(210));
	cv::circle(square, cv::Point(50, 50), 30, cv::Scalar::all(20), cv::FILLED);

	const auto features = extractFeatures(square);
	ASSERT_TRUE(features.has_value());

	EXPECT_GT(features->centerDarkness, 0.8);
	EXPECT_LT(features->centerBrightness, 60.0);
	EXPECT_GT(features->brightnessVariance, 500.0);
	EXPECT_GT(features->darkPixelRatio, 0.2);
	EXPECT_LT(features->darkPixelRatio, 0.35);
}

TEST(FeatureExtractor, Saturation_Only_For_Color_Input) {
	const cv::Mat blue(20, 20, CV_8UC3, cv::Scalar(255, 0, 0));
	const auto color = extractFeatures(blue);
	ASSERT_TRUE(color.has_value());
	EXPECT_NEAR(color->avgSaturation, 255.0, 1e-9);

	cv::Mat gray;
	cv::cvtColor(blue, gray, cv::COLOR_BGR2GRAY);
	const auto grayFeatures = extractFeatures(gray);
	ASSERT_TRUE(grayFeatures.has_value());
	EXPECT_DOUBLE_EQ(grayFeatures->avgSaturation, 0.0);
	EXPECT_NEAR(grayFeatures->avgBrightness, color->avgBrightness, 1e-9);
}

TEST(FeatureExtractor, Deterministic) {
	cv::Mat square(64, 64, CV_8UC3);
	cv::randu(square, cv::Scalar::all(0), cv::Scalar::all(255));

	const auto first  = extractFeatures(square);
	const auto second = extractFeatures(square.clone());
	ASSERT_TRUE(first.has_value());
	ASSERT_TRUE(second.has_value());
	EXPECT_EQ(toDescriptor(*first), toDescriptor(*second));
}

TEST(FeatureExtractor, Invalid_Input) {
	EXPECT_FALSE(extractFeatures(cv::Mat{}).has_value());
	EXPECT_FALSE(extractFeatures(cv::Mat(10, 10, CV_32FC1, cv::Scalar(0.5))).has_value());
	EXPECT_FALSE(extractFeatures(cv::Mat(10, 10, CV_8UC2, cv::Scalar(0, 0))).has_value());
}

TEST(FeatureExtractor, Descriptor_Scaling) {
	FeatureVector features{};
	features.avgBrightness      = 255.0;
	features.brightnessVariance = 127.5 * 127.5;
	features.edgeDensity        = 0.25;
	features.centerBrightness   = 51.0;

	const Descriptor descriptor = toDescriptor(features);
	EXPECT_DOUBLE_EQ(descriptor[0], 1.0);
	EXPECT_DOUBLE_EQ(descriptor[1], 1.0);
	EXPECT_DOUBLE_EQ(descriptor[2], 0.25);
	EXPECT_DOUBLE_EQ(descriptor[6], 0.2);

	const FeatureVector restored = fromDescriptor(descriptor);
	EXPECT_NEAR(restored.brightnessVariance, features.brightnessVariance, 1e-6);

	Descriptor shifted = descriptor;
	shifted[0] -= 0.3;
	shifted[2] += 0.4;
	EXPECT_NEAR(descriptorDistance(descriptor, shifted), 0.5, 1e-12);
	EXPECT_DOUBLE_EQ(descriptorDistance(descriptor, descriptor), 0.0);
}

} // namespace gtest
} // namespace kibitz::vision::core
