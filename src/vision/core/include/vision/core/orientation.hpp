#pragma once

#include "vision/core/board.hpp"
#include "vision/core/pieceType.hpp"

#include <opencv2/core/mat.hpp>

#include <algorithm>
#include <optional>
#include <string_view>

namespace kibitz::vision::core {

//! Caller choice of board orientation. Auto runs the detection heuristics.
enum class OrientationMode { White, Black, Auto };

std::optional<OrientationMode> orientationModeFromName(std::string_view name); //!< "white", "black" or "auto".

struct OrientationConfig {
	double brightnessMargin{10.0};           //!< Corner brightness difference required by the corner color heuristic.
	int whitePieceMargin{2};                 //!< White piece count difference required by the piece identity heuristic.
	Orientation fallback{Orientation::White}; //!< Used when every heuristic is inconclusive.
};

//! Which rule decided the orientation.
enum class OrientationSource { Manual, CornerColor, PieceIdentity, Default };

std::string_view orientationSourceName(OrientationSource source);

struct OrientationDecision {
	Orientation orientation{Orientation::White};
	OrientationSource source{OrientationSource::Default};
};

//! Mean gray level of a square image. 0 for an empty image.
double squareBrightness(const cv::Mat& square);

//! Compare the bottom-left and the top-right square. Darker bottom-left -> white at the bottom, darker top-right -> black at the bottom.
//! \returns Null if the corners differ by no more than the margin.
std::optional<Orientation> orientationFromCornerColors(const SquareGrid& squares, const OrientationConfig& config = {});

//! Side whose home row (bottom or top row of the image) holds clearly more white pieces.
//! \returns Null if neither row leads by the margin.
std::optional<Orientation> orientationFromPieces(const Grid<RecognitionResult>& results, const OrientationConfig& config = {});

//! Decide which side is at the bottom of the image.
//! Manual modes bypass detection. Auto tries the corner colors, then the piece identities (if results are given), then the fallback.
OrientationDecision resolveOrientation(const SquareGrid& squares, const Grid<RecognitionResult>* results, OrientationMode mode,
                                       const OrientationConfig& config = {});

//! Rotate a grid by 180 degrees. flip(flip(g)) == g.
template <typename T>
Grid<T> flip(Grid<T> grid) {
	std::reverse(grid.begin(), grid.end());
	for (auto& row: grid) {
		std::reverse(row.begin(), row.end());
	}
	return grid;
}

} // namespace kibitz::vision::core
