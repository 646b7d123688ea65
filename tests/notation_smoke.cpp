#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "solcross/board.hpp"
#include "solcross/notation.hpp"

using namespace solcross;

static bool parse_fails(const Board& b, const std::string& text) {
  try {
    string_to_move(b, text);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

static std::vector<std::string> lines_of(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream iss(s);
  std::string line;
  while (std::getline(iss, line)) out.push_back(line);
  return out;
}

int main() {
  Board b;
  const Move down(Location{ 1, 3 }, Location{ 3, 3 });

  assert(move_to_string(down) == "(1,3)->(3,3)");
  assert(moves_to_string({}) == "[]");
  assert(moves_to_string({ down, Move(Location{ 2, 1 }, Location{ 2, 3 }) }) ==
         "[(1,3)->(3,3), (2,1)->(2,3)]");

  // Both notations parse; output form round-trips
  assert(string_to_move(b, "1,3-3,3") == down);
  assert(string_to_move(b, "(1,3)->(3,3)") == down);
  assert(string_to_move(b, move_to_string(down)) == down);
  assert(parse_fails(b, "1,3-3"));
  assert(parse_fails(b, "a1b2"));
  assert(parse_fails(b, "0,0-0,2"));   // off the board
  assert(parse_fails(b, "1,3-2,3"));   // not a jump

  // Shape is checked before the move is looked up
  assert(parse_fails(b, "(1,-3)->(3,3)"));
  assert(parse_fails(b, "-1,3-3,3"));
  assert(parse_fails(b, "1 3 3 3"));
  assert(parse_fails(b, "1,3-3,3 "));
  assert(parse_fails(b, "(1,3)-(3,3)"));
  assert(parse_fails(b, "(1,3)->(3,3"));
  assert(parse_fails(b, "1,3->3,3"));
  assert(parse_fails(b, "001,3-3,3"));
  assert(parse_fails(b, ""));

  // Rendering of the initial board
  {
    const auto lines = lines_of(to_string(b));
    assert(lines.size() == 8);
    assert(lines[0] == "[]");
    assert(lines[1] == "    1 1 1     ");
    assert(lines[4] == "1 1 1 0 1 1 1 ");
    assert(lines[7] == "    1 1 1     ");
  }

  // Last move's source and destination are marked
  {
    const auto lines = lines_of(to_string(b.apply_move(down)));
    assert(lines[0] == "[(1,3)->(3,3)]");
    assert(lines[2] == "    1 - 1     ");
    assert(lines[3] == "1 1 1 0 1 1 1 ");
    assert(lines[4] == "1 1 1 + 1 1 1 ");
  }

  return 0;
}
