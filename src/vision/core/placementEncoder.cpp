#include "vision/core/placementEncoder.hpp"

namespace kibitz::vision::core {

std::string encodeRanks(const Grid<PieceType>& pieces) {
	std::string placement;
	placement.reserve(72u);

	for (int row = 0; row < BOARD_DIM; ++row) {
		int emptyRun = 0;
		for (const PieceType type: pieces[static_cast<std::size_t>(row)]) {
			const char symbol = placementChar(type);
			if (symbol == '.') {
				++emptyRun;
				continue;
			}
			if (emptyRun > 0) {
				placement += static_cast<char>('0' + emptyRun);
				emptyRun = 0;
			}
			placement += symbol;
		}
		if (emptyRun > 0) {
			placement += static_cast<char>('0' + emptyRun);
		}
		if (row + 1 < BOARD_DIM) {
			placement += '/';
		}
	}
	return placement;
}

std::string encodePlacement(const Grid<RecognitionResult>& results) {
	Grid<PieceType> pieces{};
	for (std::size_t row = 0; row < results.size(); ++row) {
		for (std::size_t col = 0; col < results[row].size(); ++col) {
			pieces[row][col] = results[row][col].type;
		}
	}
	return encodeRanks(pieces) + std::string(PLACEHOLDER_SUFFIX);
}

} // namespace kibitz::vision::core
