#pragma once

#include <vector>

#include "solcross/board.hpp"
#include "solcross/move.hpp"

namespace solcross {

// start followed by the board after each move, in order
// (moves.size() + 1 boards). Throws std::invalid_argument if a move is not
// possible on the board it is applied to.
std::vector<Board> play_moves(const Board& start, const std::vector<Move>& moves);

} // namespace solcross
