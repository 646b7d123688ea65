#include "solcross/notation.hpp"
#include "solcross/board.hpp"
#include "solcross/move.hpp"
#include "solcross/types.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace solcross {

static std::string location_to_string(Location v) {
  return "(" + std::to_string(v.row) + "," + std::to_string(v.column) + ")";
}

static inline char cell_char(CellState s) {
  switch (s) {
    case CellState::Off:      return ' ';
    case CellState::Empty:    return '0';
    case CellState::Occupied: return '1';
  }
  return '?';
}

namespace {

// Strict reader over one move token.
struct Cursor {
  const std::string& text;
  std::size_t pos = 0;

  bool eat(const char* lit) {
    std::size_t k = 0;
    while (lit[k]) {
      if (pos + k >= text.size() || text[pos + k] != lit[k]) return false;
      ++k;
    }
    pos += k;
    return true;
  }

  // Unsigned decimal, at most two digits (boards are at most 15 wide).
  bool number(int& out) {
    std::size_t k = 0;
    int v = 0;
    while (pos + k < text.size() && std::isdigit(static_cast<unsigned char>(text[pos + k]))) {
      if (k == 2) return false;
      v = v * 10 + (text[pos + k] - '0');
      ++k;
    }
    if (k == 0) return false;
    pos += k;
    out = v;
    return true;
  }

  bool location(Location& out) {
    return number(out.row) && eat(",") && number(out.column);
  }

  bool done() const { return pos == text.size(); }
};

} // namespace

// "r,c-r,c"
static bool parse_short(const std::string& text, Move& out) {
  Cursor cur{ text };
  return cur.location(out.from) && cur.eat("-") && cur.location(out.to) && cur.done();
}

// "(r,c)->(r,c)"
static bool parse_long(const std::string& text, Move& out) {
  Cursor cur{ text };
  return cur.eat("(") && cur.location(out.from) && cur.eat(")->(") &&
         cur.location(out.to) && cur.eat(")") && cur.done();
}

std::string move_to_string(const Move& m) {
  return location_to_string(m.from) + "->" + location_to_string(m.to);
}

std::string moves_to_string(const std::vector<Move>& moves) {
  std::string s = "[";
  for (std::size_t i = 0; i < moves.size(); ++i) {
    if (i) s += ", ";
    s += move_to_string(moves[i]);
  }
  s += "]";
  return s;
}

Move string_to_move(const Board& b, const std::string& text) {
  Move want;
  if (!parse_short(text, want) && !parse_long(text, want))
    throw std::invalid_argument("bad move: expected r,c-r,c or (r,c)->(r,c)");

  for (const auto& m : b.layout().allowable)
    if (m == want) return m;
  throw std::invalid_argument("move not allowable on this layout");
}

std::string to_string(const Board& b) {
  const auto& hist = b.moves_so_far();
  Location from{ -1, -1 }, to{ -1, -1 };
  if (!hist.empty()) { from = hist.back().from; to = hist.back().to; }

  std::ostringstream oss;
  oss << moves_to_string(hist) << "\n";
  const int n = b.size();
  for (int r = 0; r < n; ++r) {
    for (int c = 0; c < n; ++c) {
      const Location v{ r, c };
      char ch;
      if (v == from) ch = '-';
      else if (v == to) ch = '+';
      else ch = cell_char(b.cell(v));
      oss << ch << ' ';
    }
    oss << "\n";
  }
  return oss.str();
}

} // namespace solcross
