#include <cassert>
#include <string>
#include "solcross/board.hpp"
#include "solcross/layout.hpp"


static bool throws_layout_error(const char* text) {
  try {
    solcross::parse_layout(text);
  } catch (const solcross::LayoutError&) {
    return true;
  }
  return false;
}


int main() {
using namespace solcross;


// Round-trip the cross
Board b1;
assert(to_layout(b1) == CROSS_LAYOUT);
const Layout& cross = *cross_layout();
assert(cross.size == 7);
assert(cross.positions.size() == 49u);
assert(cross.allowable.size() == 76u);
assert(!cross.is_legal_location(Location{ 0, 0 }));
assert(cross.is_legal_location(Location{ 0, 2 }));
assert(!cross.is_legal_location(Location{ 7, 3 }));
assert(b1.peg_count() == 32);


// Newline separated rows with a trailing break
auto small = parse_layout("110\n100\n000\n");
assert(small->size == 3);
Board b2(small, 3);
assert(to_layout(b2) == "110/100/000");
assert(b2.peg_count() == 3);


// Rejects
assert(throws_layout_error(""));
assert(throws_layout_error("11/11"));
assert(throws_layout_error("111/11/111"));
assert(throws_layout_error("111/1x1/111"));
assert(throws_layout_error("1111/1111/1111"));


return 0;
}
