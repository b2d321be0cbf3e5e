#pragma once

#include "vision/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <optional>

namespace kibitz::vision::core {

//! Board candidate filtering and preprocessing parameters.
struct LocatorConfig {
	int minBoardSize{200};         //!< Candidate contour area must exceed minBoardSize^2.
	int maxBoardSize{2000};        //!< Candidate contour area must stay below maxBoardSize^2.
	double minAspectRatio{0.8};    //!< Bounding box width/height, exclusive.
	double maxAspectRatio{1.2};    //!< Bounding box width/height, exclusive.
	int blurKernelSize{5};         //!< Gaussian blur kernel (odd).
	int thresholdBlockSize{11};    //!< Adaptive threshold neighbourhood (odd).
	double thresholdOffset{2.0};   //!< Constant subtracted from the weighted neighbourhood mean.
	int normalisedBoardSize{800};  //!< Side length of a located board after normalisation.
};

//! Find the chess board in a photograph.
//! Grayscale -> blur -> adaptive threshold -> contours -> area and aspect filter -> largest survivor.
//! \param [in] image Photograph (1, 3 or 4 channels).
//! \returns    Bounding rectangle of the board in image coordinates. Null if no contour qualifies; the caller then supplies a
//!             manual region or gives up on this image.
std::optional<cv::Rect> locateBoard(const cv::Mat& image, const LocatorConfig& config = {}, DebugVisualizer* debugger = nullptr);

//! Crop a region out of an image. The region is clamped to the image bounds.
//! \returns Empty image if the clamped region is empty.
cv::Mat extractBoard(const cv::Mat& image, const cv::Rect& region);

//! Resize a cropped board to a square of the given side length.
cv::Mat normaliseBoard(const cv::Mat& board, int size);

} // namespace kibitz::vision::core
