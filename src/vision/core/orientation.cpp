#include "vision/core/orientation.hpp"

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/imageConversion.hpp"

#include <opencv2/core.hpp>

#include <iostream>

namespace kibitz::vision::core {

std::optional<OrientationMode> orientationModeFromName(std::string_view name) {
	if (name == "white")
		return OrientationMode::White;
	if (name == "black")
		return OrientationMode::Black;
	if (name == "auto")
		return OrientationMode::Auto;
	return std::nullopt;
}

std::string_view orientationSourceName(const OrientationSource source) {
	switch (source) {
	case OrientationSource::Manual: return "manual";
	case OrientationSource::CornerColor: return "corner-color";
	case OrientationSource::PieceIdentity: return "piece-identity";
	case OrientationSource::Default: return "default";
	}
	return "default";
}

double squareBrightness(const cv::Mat& square) {
	cv::Mat gray;
	if (!convertToGray(square, gray)) {
		return 0.0;
	}
	return cv::mean(gray)[0];
}

std::optional<Orientation> orientationFromCornerColors(const SquareGrid& squares, const OrientationConfig& config) {
	const double bottomLeft = squareBrightness(squares[BOARD_DIM - 1][0]);
	const double topRight   = squareBrightness(squares[0][BOARD_DIM - 1]);

	if (debugLoggingEnabled()) {
		std::cout << "[vision-debug] corner brightness bottomLeft=" << bottomLeft << " topRight=" << topRight << '\n';
	}

	if (bottomLeft < topRight - config.brightnessMargin) {
		return Orientation::White;
	}
	if (topRight < bottomLeft - config.brightnessMargin) {
		return Orientation::Black;
	}
	return std::nullopt;
}

std::optional<Orientation> orientationFromPieces(const Grid<RecognitionResult>& results, const OrientationConfig& config) {
	const auto countWhite = [](const std::array<RecognitionResult, BOARD_DIM>& row) {
		int count = 0;
		for (const auto& result: row) {
			if (pieceColor(result.type) == PieceColor::White) {
				++count;
			}
		}
		return count;
	};

	const int bottomWhite = countWhite(results[BOARD_DIM - 1]);
	const int topWhite    = countWhite(results[0]);

	if (bottomWhite >= topWhite + config.whitePieceMargin) {
		return Orientation::White;
	}
	if (topWhite >= bottomWhite + config.whitePieceMargin) {
		return Orientation::Black;
	}
	return std::nullopt;
}

OrientationDecision resolveOrientation(const SquareGrid& squares, const Grid<RecognitionResult>* results, const OrientationMode mode,
                                       const OrientationConfig& config) {
	switch (mode) {
	case OrientationMode::White: return {Orientation::White, OrientationSource::Manual};
	case OrientationMode::Black: return {Orientation::Black, OrientationSource::Manual};
	case OrientationMode::Auto: break;
	}

	if (const auto corner = orientationFromCornerColors(squares, config)) {
		return {*corner, OrientationSource::CornerColor};
	}
	if (results) {
		if (const auto pieces = orientationFromPieces(*results, config)) {
			return {*pieces, OrientationSource::PieceIdentity};
		}
	}
	return {config.fallback, OrientationSource::Default};
}

} // namespace kibitz::vision::core
