#pragma once

#include "vision/core/pieceType.hpp"

#include <opencv2/core/mat.hpp>

namespace kibitz::vision::training {

//! Square image with the label a human assigned to it.
struct TrainingSample {
	cv::Mat image;
	core::PieceType label{core::PieceType::Empty};
};

} // namespace kibitz::vision::training
