#include "solcross/search.hpp"

#include <cstdint>
#include <ostream>
#include <utility>
#include <vector>

namespace solcross {
namespace {

// Per-search move application counter with periodic progress output.
struct Counter {
  std::uint64_t applied = 0;
  std::uint64_t report_every = 0;
  std::ostream* log = nullptr;

  void bump() {
    ++applied;
    if (log && report_every && applied % report_every == 0)
      *log << "moves applied " << applied << std::endl;
  }
};

// Replace only when strictly longer: ties keep the line found first.
inline void choose_better(std::vector<Move>& best, std::vector<Move>&& candidate) {
  if (candidate.size() > best.size()) best = std::move(candidate);
}

std::vector<Move> best_line(const Board& b, Counter& counter, bool cutoff) {
  std::vector<Move> best = b.moves_so_far();
  const std::size_t cap = static_cast<std::size_t>(b.max_depth());

  for (const Move& m : b.possible_moves()) {
    const Board child = b.apply_move(m);
    counter.bump();
    choose_better(best, best_line(child, counter, cutoff));
    // Nothing can be strictly longer than the cap.
    if (cutoff && best.size() >= cap) break;
  }
  return best;
}

} // namespace

SearchResult search(const Board& root) {
  return search(root, SearchLimits{});
}

SearchResult search(const Board& root, const SearchLimits& lim) {
  Counter counter;
  counter.report_every = lim.report_every;
  counter.log = lim.log;

  SearchResult res{};
  res.moves = best_line(root, counter, lim.cutoff);
  res.nodes = counter.applied;
  return res;
}

std::vector<Move> best_move_list(const Board& b) {
  return search(b).moves;
}

} // namespace solcross
