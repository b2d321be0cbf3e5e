#pragma once

#include <opencv2/core/mat.hpp>

#include <array>
#include <optional>

namespace kibitz::vision::core {

//! Descriptor of a single square image. All values are deterministic functions of the image.
struct FeatureVector {
	double avgBrightness{0.0};      //!< Mean gray level [0, 255].
	double brightnessVariance{0.0}; //!< Population variance of the gray level.
	double edgeDensity{0.0};        //!< Fraction of Canny edge pixels [0, 1].
	double darkPixelRatio{0.0};     //!< Fraction of pixels below the dark threshold [0, 1].
	double avgSaturation{0.0};      //!< Mean HSV saturation [0, 255]. 0 for grayscale input.
	double centerDarkness{0.0};     //!< Fraction of dark pixels in the central half of the square [0, 1].
	double centerBrightness{0.0};   //!< Mean gray level of the central half of the square [0, 255].
};

static constexpr std::size_t FEATURE_COUNT = 7u;
using Descriptor                           = std::array<double, FEATURE_COUNT>;

//! Feature extraction parameters.
struct FeatureConfig {
	double cannyLow{50.0};
	double cannyHigh{150.0};
	int darkThreshold{100}; //!< Gray level below which a pixel counts as dark.
};

//! Compute the feature vector of one square image.
//! \returns Null for an empty image or an unsupported channel count.
std::optional<FeatureVector> extractFeatures(const cv::Mat& square, const FeatureConfig& config = {});

//! Features scaled to comparable ranges (roughly [0, 1] each) for distance computations.
Descriptor toDescriptor(const FeatureVector& features);
FeatureVector fromDescriptor(const Descriptor& descriptor); //!< Inverse of toDescriptor().

//! Euclidean distance between two scaled descriptors.
double descriptorDistance(const Descriptor& left, const Descriptor& right);

} // namespace kibitz::vision::core
