#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace kibitz::vision::core {

enum class PieceColor { White, Black };
enum class PieceKind { Pawn, Knight, Bishop, Rook, Queen, King };

//! Content of a single square. Unknown is a recognition outcome only, never a label.
enum class PieceType {
	WhitePawn,
	WhiteKnight,
	WhiteBishop,
	WhiteRook,
	WhiteQueen,
	WhiteKing,
	BlackPawn,
	BlackKnight,
	BlackBishop,
	BlackRook,
	BlackQueen,
	BlackKing,
	Empty,
	Unknown,
};

//! All labels a human may assign to a square.
static constexpr std::array<PieceType, 13> LABELS = {
        PieceType::WhitePawn, PieceType::WhiteKnight, PieceType::WhiteBishop, PieceType::WhiteRook, PieceType::WhiteQueen,
        PieceType::WhiteKing, PieceType::BlackPawn,   PieceType::BlackKnight, PieceType::BlackBishop, PieceType::BlackRook,
        PieceType::BlackQueen, PieceType::BlackKing,  PieceType::Empty,
};

PieceType makePiece(PieceColor color, PieceKind kind);
std::optional<PieceColor> pieceColor(PieceType type); //!< Null for Empty and Unknown.
bool isPiece(PieceType type);                         //!< One of the 12 colored pieces.

std::string_view pieceName(PieceType type);                       //!< Persisted name, e.g. "WHITE_KNIGHT", "EMPTY".
std::optional<PieceType> pieceFromName(std::string_view name);    //!< Inverse of pieceName(). Unknown is not parsed.
char placementChar(PieceType type);                               //!< 'N' for white knight, 'n' for black. '.' for empty or unknown.

//! Result of classifying a single square.
struct RecognitionResult {
	PieceType type{PieceType::Unknown};                      //!< Best guess.
	float confidence{0.0f};                                  //!< Confidence in [0, 1].
	std::vector<std::pair<PieceType, float>> alternatives{}; //!< Other candidates, best first.
};

} // namespace kibitz::vision::core
