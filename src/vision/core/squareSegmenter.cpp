#include "vision/core/squareSegmenter.hpp"

#include "vision/core/imageConversion.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace kibitz::vision::core {

SquareGrid segmentBoard(const cv::Mat& board, DebugVisualizer* debugger) {
	SquareGrid squares{};

	const int squareH = board.rows / BOARD_DIM;
	const int squareW = board.cols / BOARD_DIM;
	if (board.empty() || squareH == 0 || squareW == 0) {
		return squares;
	}

	for (int row = 0; row < BOARD_DIM; ++row) {
		for (int col = 0; col < BOARD_DIM; ++col) {
			const cv::Rect cell(col * squareW, row * squareH, squareW, squareH);
			squares[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)] = board(cell);
		}
	}

	cv::Mat drawn;
	if (debugger && convertToBgr(board, drawn)) {
		debugger->beginStage("Segment Squares");
		for (int i = 1; i < BOARD_DIM; ++i) {
			cv::line(drawn, cv::Point(i * squareW, 0), cv::Point(i * squareW, BOARD_DIM * squareH - 1), cv::Scalar(0, 0, 255), 2);
			cv::line(drawn, cv::Point(0, i * squareH), cv::Point(BOARD_DIM * squareW - 1, i * squareH), cv::Scalar(0, 0, 255), 2);
		}
		debugger->add("Square Grid", drawn);
		debugger->endStage();
	}

	return squares;
}

bool isValidGrid(const SquareGrid& squares) {
	return std::all_of(squares.begin(), squares.end(), [](const auto& row) {
		return std::all_of(row.begin(), row.end(), [](const cv::Mat& square) { return !square.empty(); });
	});
}

} // namespace kibitz::vision::core
