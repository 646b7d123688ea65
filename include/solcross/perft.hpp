#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "solcross/board.hpp"
#include "solcross/move.hpp"

namespace solcross {

// Boards reached at exactly `depth` plies through Board::possible_moves(),
// so symmetric duplicates and the depth cap are already pruned.
std::uint64_t perft(const Board& b, int depth);

// (root move, subtree count) for each root move; out is cleared first.
void perft_divide(const Board& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out);

} // namespace solcross
