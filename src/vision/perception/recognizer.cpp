#include "vision/recognizer.hpp"

#include "vision/core/imageConversion.hpp"
#include "vision/core/placementEncoder.hpp"
#include "vision/core/squareSegmenter.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>

namespace kibitz::vision {

namespace {

//! Placement character of every square drawn onto the board as captured.
static void drawResults(const cv::Mat& board, const core::Grid<core::RecognitionResult>& results, core::DebugVisualizer& debugger) {
	cv::Mat drawn;
	if (!core::convertToBgr(board, drawn)) {
		return;
	}

	const int squareW = board.cols / core::BOARD_DIM;
	const int squareH = board.rows / core::BOARD_DIM;
	for (int row = 0; row < core::BOARD_DIM; ++row) {
		for (int col = 0; col < core::BOARD_DIM; ++col) {
			const auto& result = results[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)];
			const char symbol  = result.type == core::PieceType::Unknown ? '?' : core::placementChar(result.type);
			const cv::Point anchor(col * squareW + squareW / 3, row * squareH + 2 * squareH / 3);
			cv::putText(drawn, std::string(1, symbol), anchor, cv::FONT_HERSHEY_SIMPLEX, squareH / 60.0 + 0.3, cv::Scalar(0, 0, 255), 2, cv::LINE_AA);
		}
	}
	debugger.add("Recognized Pieces", drawn);
}

} // namespace

BoardRecognizer::BoardRecognizer(RecognizerConfig config)
    : m_config(config), m_engine(m_models, m_config.classifier.features), m_classifier(m_config.classifier, &m_models) {
}

BoardReading BoardRecognizer::recognize(const cv::Mat& image, const core::OrientationMode mode, std::optional<cv::Rect> manualRegion,
                                        core::DebugVisualizer* debugger) const {
	BoardReading reading{};
	if (image.empty()) {
		std::cerr << "[Error] Empty input image\n";
		return reading;
	}

	// Board region
	if (manualRegion) {
		reading.region = *manualRegion & cv::Rect(0, 0, image.cols, image.rows);
		reading.board  = core::extractBoard(image, reading.region);
	} else {
		const auto located = core::locateBoard(image, m_config.locator, debugger);
		if (!located) {
			std::cerr << "[Error] Board not found. Supply the board region manually.\n";
			return reading;
		}
		reading.region = *located;
		reading.board  = core::normaliseBoard(core::extractBoard(image, *located), m_config.locator.normalisedBoardSize);
	}

	// Squares
	core::SquareGrid squares = core::segmentBoard(reading.board, debugger);
	if (!core::isValidGrid(squares)) {
		std::cerr << "[Error] Board region " << reading.region << " is too small to split into squares\n";
		return reading;
	}

	// Pieces and orientation
	core::Grid<core::RecognitionResult> results = m_classifier.classifyBoard(squares);
	if (debugger) {
		debugger->beginStage("Classify Squares");
		drawResults(reading.board, results, *debugger);
		debugger->endStage();
	}

	reading.orientation = core::resolveOrientation(squares, &results, mode, m_config.orientation);
	if (core::debugLoggingEnabled()) {
		std::cout << "[vision-debug] orientation=" << core::orientationName(reading.orientation.orientation)
		          << " source=" << core::orientationSourceName(reading.orientation.source) << '\n';
	}

	if (reading.orientation.orientation == core::Orientation::Black) {
		squares = core::flip(squares);
		results = core::flip(results);
	}

	reading.squares   = std::move(squares);
	reading.results   = std::move(results);
	reading.placement = core::encodePlacement(reading.results);
	reading.success   = true;
	return reading;
}

training::RetrainReport BoardRecognizer::retrain(const training::FeedbackStore& feedback) {
	return m_engine.retrain(feedback.trainingData(true));
}

} // namespace kibitz::vision
