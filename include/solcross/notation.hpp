// include/solcross/notation.hpp
#pragma once
#include <string>
#include <vector>

namespace solcross {

struct Move;
class Board;

// "(r,c)->(r,c)"
std::string move_to_string(const Move& m);

// "[(r,c)->(r,c), ...]"
std::string moves_to_string(const std::vector<Move>& moves);

// Parse "r,c-r,c" or "(r,c)->(r,c)" into a move allowable on b's layout.
// Throws std::invalid_argument if malformed or not allowable.
Move string_to_move(const Board& b, const std::string& text);

// Move history line followed by the grid: ' ' off, '0' hole, '1' peg,
// '-' / '+' for the source / destination of the last move.
std::string to_string(const Board& b);

} // namespace solcross
