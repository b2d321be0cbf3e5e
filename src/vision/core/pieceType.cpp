#include "vision/core/pieceType.hpp"

#include <algorithm>

namespace kibitz::vision::core {

namespace {

struct PieceInfo {
	PieceType type;
	std::string_view name;
	char symbol;
};

static constexpr std::array<PieceInfo, 14> PIECE_TABLE = {{
        {PieceType::WhitePawn, "WHITE_PAWN", 'P'},
        {PieceType::WhiteKnight, "WHITE_KNIGHT", 'N'},
        {PieceType::WhiteBishop, "WHITE_BISHOP", 'B'},
        {PieceType::WhiteRook, "WHITE_ROOK", 'R'},
        {PieceType::WhiteQueen, "WHITE_QUEEN", 'Q'},
        {PieceType::WhiteKing, "WHITE_KING", 'K'},
        {PieceType::BlackPawn, "BLACK_PAWN", 'p'},
        {PieceType::BlackKnight, "BLACK_KNIGHT", 'n'},
        {PieceType::BlackBishop, "BLACK_BISHOP", 'b'},
        {PieceType::BlackRook, "BLACK_ROOK", 'r'},
        {PieceType::BlackQueen, "BLACK_QUEEN", 'q'},
        {PieceType::BlackKing, "BLACK_KING", 'k'},
        {PieceType::Empty, "EMPTY", '.'},
        {PieceType::Unknown, "UNKNOWN", '.'},
}};

static const PieceInfo& infoFor(const PieceType type) {
	return PIECE_TABLE[static_cast<std::size_t>(type)];
}

} // namespace

PieceType makePiece(const PieceColor color, const PieceKind kind) {
	const int offset = (color == PieceColor::White) ? 0 : 6;
	return static_cast<PieceType>(offset + static_cast<int>(kind));
}

std::optional<PieceColor> pieceColor(const PieceType type) {
	if (!isPiece(type)) {
		return std::nullopt;
	}
	return static_cast<int>(type) < 6 ? PieceColor::White : PieceColor::Black;
}

bool isPiece(const PieceType type) {
	return type != PieceType::Empty && type != PieceType::Unknown;
}

std::string_view pieceName(const PieceType type) {
	return infoFor(type).name;
}

std::optional<PieceType> pieceFromName(std::string_view name) {
	const auto it = std::find_if(PIECE_TABLE.begin(), PIECE_TABLE.end(), [name](const PieceInfo& info) { return info.name == name; });
	if (it == PIECE_TABLE.end() || it->type == PieceType::Unknown) {
		return std::nullopt;
	}
	return it->type;
}

char placementChar(const PieceType type) {
	return infoFor(type).symbol;
}

} // namespace kibitz::vision::core
