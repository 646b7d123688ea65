#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "solcross/board.hpp"
#include "solcross/layout.hpp"
#include "solcross/notation.hpp"
#include "solcross/perft.hpp"
#include "solcross/replay.hpp"
#include "solcross/search.hpp"

using namespace solcross;

static void usage() {
  std::cout <<
    "Solcross CLI\n"
    "Usage:\n"
    "  solcross_cli [solve] [depth <N>] [cutoff] [quiet] [layout <TEXT>]\n"
    "  solcross_cli perft <depth> [layout <TEXT>]\n"
    "  solcross_cli divide <depth> [layout <TEXT>]\n"
    "  solcross_cli play <MOVE...> [layout <TEXT>]\n"
    "MOVE is r,c-r,c. TEXT uses '/' between rows, '.' off, '0' hole, '1' peg.\n"
    "If layout omitted, uses the cross. Default depth is 5.\n";
}

static int to_int(const std::string& s) {
  return std::stoi(s);
}

// Index of the "layout" keyword, or args.size() when absent.
static std::size_t find_layout(const std::vector<std::string>& a, std::size_t from) {
  for (std::size_t i = from; i < a.size(); ++i)
    if (a[i] == "layout") return i;
  return a.size();
}

static std::shared_ptr<const Layout> layout_from_args(const std::vector<std::string>& a,
                                                      std::size_t layoutAt) {
  if (layoutAt >= a.size()) return cross_layout();
  if (layoutAt + 1 >= a.size()) throw std::invalid_argument("layout needs a value");
  return parse_layout(a[layoutAt + 1]);
}

static void print_boards(const std::vector<Board>& boards) {
  for (const auto& b : boards) std::cout << to_string(b) << "\n";
}

static int run_solve(const std::vector<std::string>& args, std::size_t first) {
  int depth = DEFAULT_MAX_DEPTH;
  SearchLimits lim{};
  lim.log = &std::cout;

  const std::size_t layoutAt = find_layout(args, first);
  for (std::size_t i = first; i < layoutAt; ++i) {
    const std::string& tok = args[i];
    if (tok == "cutoff") { lim.cutoff = true; continue; }
    if (tok == "quiet")  { lim.log = nullptr; continue; }
    if (tok == "depth" && i + 1 < layoutAt) { depth = to_int(args[i + 1]); ++i; continue; }
    usage();
    return 1;
  }

  Board b(layout_from_args(args, layoutAt), depth);
  std::cout << "****\n";
  const auto t0 = std::chrono::steady_clock::now();

  SearchResult r = search(b, lim);
  print_boards(play_moves(b, r.moves));

  const auto t1 = std::chrono::steady_clock::now();
  std::cout << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  try {
    if (args.empty()) return run_solve(args, 0);

    const std::string cmd = args[0];

    if (cmd == "solve") return run_solve(args, 1);
    if (cmd == "depth" || cmd == "cutoff" || cmd == "quiet" || cmd == "layout")
      return run_solve(args, 0);

    // perft <depth> [layout <TEXT>]
    if (cmd == "perft") {
      if (args.size() < 2) { usage(); return 1; }
      const int depth = to_int(args[1]);
      Board b(layout_from_args(args, find_layout(args, 2)), depth);
      std::cout << perft(b, depth) << "\n";
      return 0;
    }

    // divide <depth> [layout <TEXT>]
    if (cmd == "divide") {
      if (args.size() < 2) { usage(); return 1; }
      const int depth = to_int(args[1]);
      Board b(layout_from_args(args, find_layout(args, 2)), depth);
      std::vector<std::pair<Move, std::uint64_t>> parts;
      perft_divide(b, depth, parts);
      std::uint64_t total = 0;
      for (auto& [m, n] : parts) {
        std::cout << move_to_string(m) << " " << n << "\n";
        total += n;
      }
      std::cout << "total " << total << "\n";
      return 0;
    }

    // play <MOVE...> [layout <TEXT>]
    if (cmd == "play") {
      const std::size_t layoutAt = find_layout(args, 1);
      Board b(layout_from_args(args, layoutAt));
      std::vector<Move> moves;
      for (std::size_t i = 1; i < layoutAt; ++i) moves.push_back(string_to_move(b, args[i]));
      print_boards(play_moves(b, moves));
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  usage();
  return 0;
}
