#pragma once

#include <cstdint>
#include <iosfwd>
#include <vector>

#include "solcross/board.hpp"
#include "solcross/move.hpp"

namespace solcross {

struct SearchResult {
  std::vector<Move> moves;   // longest line found, from the initial layout
  std::uint64_t nodes{0};    // move applications performed by this search
};

struct SearchLimits {
  // Skip remaining siblings once a line reaches the depth cap. The chosen
  // line is the same as without it; only nodes shrinks.
  bool cutoff = false;
  std::uint64_t report_every = 10'000'000;  // 0 => never
  std::ostream* log = nullptr;              // progress sink, null => silent
};

SearchResult search(const Board& root);
SearchResult search(const Board& root, const SearchLimits& lim);

// Longest move list reachable from b (b's own history when nothing is).
std::vector<Move> best_move_list(const Board& b);

} // namespace solcross
