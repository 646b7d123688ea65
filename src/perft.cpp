#include "solcross/perft.hpp"
#include <vector>

namespace solcross {

std::uint64_t perft(const Board& b, int depth) {
  if (depth <= 0) return 1ULL;

  std::uint64_t nodes = 0ULL;
  for (const auto& m : b.possible_moves())
    nodes += perft(b.apply_move(m), depth - 1);
  return nodes;
}

void perft_divide(const Board& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0) return;

  for (const auto& m : b.possible_moves()) {
    std::uint64_t n = perft(b.apply_move(m), depth - 1);
    out.emplace_back(m, n);
  }
}

} // namespace solcross
