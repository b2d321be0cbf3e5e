#pragma once

#include "vision/core/board.hpp"
#include "vision/core/pieceType.hpp"

#include <string>
#include <string_view>

namespace kibitz::vision::core {

//! Side to move, castling rights, en passant square and move counters. Not inferred from the image.
static constexpr std::string_view PLACEHOLDER_SUFFIX = " w KQkq - 0 1";

//! Encode the piece placement of a canonical grid (row 0 is rank 8, col 0 is file a).
//! Runs of empty squares are written as a digit; Unknown squares count as empty.
//! \returns Placement field followed by PLACEHOLDER_SUFFIX, e.g. "8/8/8/8/8/8/8/8 w KQkq - 0 1".
std::string encodePlacement(const Grid<RecognitionResult>& results);

//! Placement field only, without the suffix.
std::string encodeRanks(const Grid<PieceType>& pieces);

} // namespace kibitz::vision::core
