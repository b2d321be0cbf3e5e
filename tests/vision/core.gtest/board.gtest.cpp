#include "vision/core/board.hpp"
#include "vision/core/pieceType.hpp"

#include <gtest/gtest.h>

#include <utility>

namespace kibitz::vision::core {
namespace gtest {

TEST(Board, SquareName_WhiteAtBottom) {
	EXPECT_EQ(squareName(0, 0, Orientation::White), "a8");
	EXPECT_EQ(squareName(0, 7, Orientation::White), "h8");
	EXPECT_EQ(squareName(7, 0, Orientation::White), "a1");
	EXPECT_EQ(squareName(7, 4, Orientation::White), "e1");
	EXPECT_EQ(squareName(4, 4, Orientation::White), "e4");
}

TEST(Board, SquareName_BlackAtBottom) {
	EXPECT_EQ(squareName(0, 0, Orientation::Black), "h1");
	EXPECT_EQ(squareName(7, 7, Orientation::Black), "a8");
	EXPECT_EQ(squareName(7, 0, Orientation::Black), "h8");
	EXPECT_EQ(squareName(3, 3, Orientation::Black), "e4");
}

TEST(Board, SquarePosition_InverseOfName) {
	for (const auto orientation: {Orientation::White, Orientation::Black}) {
		for (int row = 0; row < BOARD_DIM; ++row) {
			for (int col = 0; col < BOARD_DIM; ++col) {
				const auto position = squarePosition(squareName(row, col, orientation), orientation);
				ASSERT_TRUE(position.has_value());
				EXPECT_EQ(*position, std::make_pair(row, col));
			}
		}
	}
}

TEST(Board, SquarePosition_InvalidNames) {
	EXPECT_FALSE(squarePosition("", Orientation::White).has_value());
	EXPECT_FALSE(squarePosition("e", Orientation::White).has_value());
	EXPECT_FALSE(squarePosition("i1", Orientation::White).has_value());
	EXPECT_FALSE(squarePosition("a9", Orientation::White).has_value());
	EXPECT_FALSE(squarePosition("a0", Orientation::Black).has_value());
	EXPECT_FALSE(squarePosition("e44", Orientation::Black).has_value());
}

TEST(Board, OrientationNames) {
	EXPECT_EQ(orientationName(Orientation::White), "white");
	EXPECT_EQ(orientationName(Orientation::Black), "black");
	EXPECT_EQ(orientationFromName("black"), Orientation::Black);
	EXPECT_FALSE(orientationFromName("auto").has_value());
}

TEST(PieceType, NamesAndSymbols) {
	EXPECT_EQ(pieceName(PieceType::WhiteKnight), "WHITE_KNIGHT");
	EXPECT_EQ(pieceName(PieceType::Empty), "EMPTY");
	EXPECT_EQ(pieceFromName("BLACK_QUEEN"), PieceType::BlackQueen);
	EXPECT_EQ(pieceFromName("EMPTY"), PieceType::Empty);
	EXPECT_FALSE(pieceFromName("UNKNOWN").has_value());
	EXPECT_FALSE(pieceFromName("white_pawn").has_value());

	EXPECT_EQ(placementChar(PieceType::WhiteKnight), 'N');
	EXPECT_EQ(placementChar(PieceType::BlackKnight), 'n');
	EXPECT_EQ(placementChar(PieceType::BlackKing), 'k');
	EXPECT_EQ(placementChar(PieceType::Empty), '.');
	EXPECT_EQ(placementChar(PieceType::Unknown), '.');
}

TEST(PieceType, ColorAndKind) {
	EXPECT_EQ(makePiece(PieceColor::White, PieceKind::Pawn), PieceType::WhitePawn);
	EXPECT_EQ(makePiece(PieceColor::Black, PieceKind::Queen), PieceType::BlackQueen);
	EXPECT_EQ(pieceColor(PieceType::WhiteKing), PieceColor::White);
	EXPECT_EQ(pieceColor(PieceType::BlackPawn), PieceColor::Black);
	EXPECT_FALSE(pieceColor(PieceType::Empty).has_value());
	EXPECT_FALSE(pieceColor(PieceType::Unknown).has_value());
	EXPECT_FALSE(isPiece(PieceType::Empty));
	EXPECT_TRUE(isPiece(PieceType::BlackBishop));

	// Every label can be persisted and parsed back.
	for (const PieceType label: LABELS) {
		EXPECT_EQ(pieceFromName(pieceName(label)), label);
	}
}

} // namespace gtest
} // namespace kibitz::vision::core
