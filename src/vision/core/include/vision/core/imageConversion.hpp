#pragma once

#include <opencv2/core/mat.hpp>

namespace kibitz::vision::core {

//! Convert image to single channel grayscale independent of channel format (1, 3 or 4 channels).
//! \returns False for unsupported channel counts or an empty input.
bool convertToGray(const cv::Mat& image, cv::Mat& outGray);

//! Convert image to 3 channel BGR independent of channel format (1, 3 or 4 channels).
bool convertToBgr(const cv::Mat& image, cv::Mat& outBgr);

} // namespace kibitz::vision::core
