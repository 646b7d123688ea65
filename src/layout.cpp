#include "solcross/layout.hpp"
#include "solcross/board.hpp"
#include <string>

namespace solcross {

static inline bool is_row_break(char c) { return c == '/' || c == '\n'; }

static inline CellState char_to_cell(char c, bool& ok) {
  ok = true;
  switch (c) {
    case '.': return CellState::Off;
    case '0': return CellState::Empty;
    case '1': return CellState::Occupied;
    default:  ok = false; return CellState::Off;
  }
}

static inline char cell_to_char(CellState s) {
  switch (s) {
    case CellState::Off:      return '.';
    case CellState::Empty:    return '0';
    case CellState::Occupied: return '1';
  }
  return '?';
}

static std::vector<std::string> split_rows(std::string_view text) {
  std::vector<std::string> rows;
  std::string cur;
  for (char ch : text) {
    if (ch == '\r') continue;
    if (is_row_break(ch)) { rows.push_back(cur); cur.clear(); continue; }
    cur.push_back(ch);
  }
  rows.push_back(cur);
  // tolerate a trailing separator
  if (rows.size() > 1 && rows.back().empty()) rows.pop_back();
  return rows;
}

std::shared_ptr<const Layout> parse_layout(std::string_view text) {
  const std::vector<std::string> rows = split_rows(text);
  const int n = static_cast<int>(rows.size());
  if (n < MIN_BOARD_SIZE || n > MAX_BOARD_SIZE)
    throw LayoutError("Layout must have between 3 and 15 rows");

  auto layout = std::make_shared<Layout>();
  layout->size = n;
  layout->initial.reserve(static_cast<std::size_t>(n) * static_cast<std::size_t>(n));

  for (const std::string& row : rows) {
    if (static_cast<int>(row.size()) != n)
      throw LayoutError("Layout must be square: row '" + row + "' has wrong width");
    for (char ch : row) {
      bool ok;
      const CellState s = char_to_cell(ch, ok);
      if (!ok) throw LayoutError(std::string("Invalid cell character in layout: '") + ch + "'");
      layout->initial.push_back(s);
    }
  }

  for (int r = 0; r < n; ++r)
    for (int c = 0; c < n; ++c)
      layout->positions.push_back(Location{ r, c });

  for (const Location& pos : layout->positions) {
    for (Direction d : DIRECTIONS) {
      const Move m(pos, d);
      if (layout->is_legal_location(m.from) && layout->is_legal_location(m.to))
        layout->allowable.push_back(m);
    }
  }

  return layout;
}

const std::shared_ptr<const Layout>& cross_layout() {
  static const std::shared_ptr<const Layout> cross = parse_layout(CROSS_LAYOUT);
  return cross;
}

std::string to_layout(const Board& b) {
  std::string out;
  const int n = b.size();
  for (int r = 0; r < n; ++r) {
    for (int c = 0; c < n; ++c) out += cell_to_char(b.cell(Location{ r, c }));
    if (r + 1 < n) out += '/';
  }
  return out;
}

} // namespace solcross
