#pragma once
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "solcross/move.hpp"
#include "solcross/types.hpp"

namespace solcross {

class Board;

struct LayoutError : std::runtime_error { using std::runtime_error::runtime_error; };

// Rows separated by '/', '.' = off the board, '0' = hole, '1' = peg.
inline constexpr char CROSS_LAYOUT[] =
  "..111../..111../1111111/1110111/1111111/..111../..111..";

// Fixed board shape shared by every board of one search tree.
struct Layout {
  int size = 0;
  std::vector<CellState> initial;      // size*size, row-major
  std::vector<Location> positions;     // every cell, row-major
  std::vector<Move> allowable;         // moves with both ends on the board

  std::size_t index(Location v) const {
    return static_cast<std::size_t>(v.row * size + v.column);
  }
  bool in_bounds(Location v) const {
    return v.row >= 0 && v.column >= 0 && v.row < size && v.column < size;
  }
  bool is_legal_location(Location v) const {
    return in_bounds(v) && initial[index(v)] != CellState::Off;
  }
};

// Throws LayoutError on malformed text.
std::shared_ptr<const Layout> parse_layout(std::string_view text);

// The canonical 33-hole cross, parsed once.
const std::shared_ptr<const Layout>& cross_layout();

// Current cells of a board in parse_layout() format.
std::string to_layout(const Board& b);

} // namespace solcross
