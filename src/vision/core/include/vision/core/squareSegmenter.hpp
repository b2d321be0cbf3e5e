#pragma once

#include "vision/core/board.hpp"
#include "vision/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

namespace kibitz::vision::core {

//! Split a board image into 8x8 equally sized squares.
//! Square size is rows/8 by cols/8 (integer division); leftover pixels at the right and bottom edge are ignored.
//! \note The squares are views into the board image, not copies.
//! \returns Grid indexed [row][col] with row 0 at the top edge of the image as captured.
SquareGrid segmentBoard(const cv::Mat& board, DebugVisualizer* debugger = nullptr);

//! All 64 squares hold pixels. False for boards smaller than 8x8 pixels.
bool isValidGrid(const SquareGrid& squares);

} // namespace kibitz::vision::core
