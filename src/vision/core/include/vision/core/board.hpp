#pragma once

#include <opencv2/core/mat.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kibitz::vision::core {

static constexpr int BOARD_DIM = 8; //!< Squares per rank and per file.

//! Row-major 8x8 grid. grid[row][col], row 0 is the top edge of the image.
template <typename T>
using Grid = std::array<std::array<T, BOARD_DIM>, BOARD_DIM>;

using SquareGrid = Grid<cv::Mat>; //!< Square images cut out of a board image.

//! Which side of the board faces the camera (is at the bottom of the image).
enum class Orientation { White, Black };

std::string_view orientationName(Orientation orientation); //!< "white" or "black".
std::optional<Orientation> orientationFromName(std::string_view name);

//! Chess square name of a grid cell given the side at the bottom of the image.
//! \note White at bottom: (0,0) -> a8, (7,7) -> h1. Black at bottom: (0,0) -> h1, (7,7) -> a8.
std::string squareName(int row, int col, Orientation orientation);

//! Grid cell of a square name. Inverse of squareName().
//! \returns Null for names outside a1..h8.
std::optional<std::pair<int, int>> squarePosition(std::string_view name, Orientation orientation);

} // namespace kibitz::vision::core
