#include "vision/core/board.hpp"

namespace kibitz::vision::core {

std::string_view orientationName(const Orientation orientation) {
	switch (orientation) {
	case Orientation::White:
		return "white";
	case Orientation::Black:
		return "black";
	}
	return "white";
}

std::optional<Orientation> orientationFromName(std::string_view name) {
	if (name == "white") {
		return Orientation::White;
	}
	if (name == "black") {
		return Orientation::Black;
	}
	return std::nullopt;
}

std::string squareName(const int row, const int col, const Orientation orientation) {
	const int file = (orientation == Orientation::White) ? col : BOARD_DIM - 1 - col;
	const int rank = (orientation == Orientation::White) ? BOARD_DIM - row : row + 1;

	std::string name;
	name += static_cast<char>('a' + file);
	name += static_cast<char>('0' + rank);
	return name;
}

std::optional<std::pair<int, int>> squarePosition(std::string_view name, const Orientation orientation) {
	if (name.size() != 2u || name[0] < 'a' || name[0] > 'h' || name[1] < '1' || name[1] > '8') {
		return std::nullopt;
	}

	const int file = name[0] - 'a';
	const int rank = name[1] - '0';
	if (orientation == Orientation::White) {
		return std::make_pair(BOARD_DIM - rank, file);
	}
	return std::make_pair(rank - 1, BOARD_DIM - 1 - file);
}

} // namespace kibitz::vision::core
