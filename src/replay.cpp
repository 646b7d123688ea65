#include "solcross/replay.hpp"

#include "solcross/notation.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace solcross {
namespace {

static bool is_playable(const Board& b, const Move& m) {
  const Layout& layout = b.layout();
  if (!layout.is_legal_location(m.from) || !layout.is_legal_location(m.to)) return false;
  const Location d{ m.to.row - m.from.row, m.to.column - m.from.column };
  for (Direction dir : DIRECTIONS)
    if (d == displacement(dir)) return b.is_move_possible(m);
  return false;
}

} // namespace

std::vector<Board> play_moves(const Board& start, const std::vector<Move>& moves) {
  std::vector<Board> out;
  out.reserve(moves.size() + 1);
  out.push_back(start);

  for (const auto& m : moves) {
    const Board& cur = out.back();
    if (!is_playable(cur, m))
      throw std::invalid_argument("move " + move_to_string(m) + " is not possible on this board");
    out.push_back(cur.apply_move(m));
  }
  return out;
}

} // namespace solcross
