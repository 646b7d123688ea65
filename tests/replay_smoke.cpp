#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>
#include "solcross/board.hpp"
#include "solcross/layout.hpp"
#include "solcross/replay.hpp"

using namespace solcross;

static bool throws_invalid(const Board& b, const std::vector<Move>& moves) {
  try {
    play_moves(b, moves);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

int main() {
  Board start;

  // Empty list: just the start board
  {
    const auto boards = play_moves(start, {});
    assert(boards.size() == 1);
    assert(to_layout(boards[0]) == to_layout(start));
  }

  // i-th board equals start with the first i moves applied
  {
    const std::vector<Move> moves = {
      Move(Location{ 3, 1 }, Direction::Right),
      Move(Location{ 1, 2 }, Direction::Down),
      Move(Location{ 3, 3 }, Direction::Left),
    };
    const auto boards = play_moves(start, moves);
    assert(boards.size() == moves.size() + 1);

    Board expect = start;
    for (std::size_t i = 0; i < boards.size(); ++i) {
      assert(to_layout(boards[i]) == to_layout(expect));
      assert(boards[i].moves_so_far().size() == i);
      if (i < moves.size()) expect = expect.apply_move(moves[i]);
    }
    assert(boards.back().cell(Location{ 3, 1 }) == CellState::Occupied);
    assert(boards.back().cell(Location{ 3, 3 }) == CellState::Empty);
    assert(to_layout(start) == CROSS_LAYOUT);
  }

  // Replay is not limited to canonical moves
  {
    const auto boards = play_moves(start, { Move(Location{ 5, 3 }, Direction::Up) });
    assert(boards.size() == 2);
  }

  // Impossible moves
  assert(throws_invalid(start, { Move(Location{ 1, 3 }, Direction::Right) }));           // off the board
  assert(throws_invalid(start, { Move(Location{ 2, 3 }, Location{ 3, 3 }) }));            // not a jump
  assert(throws_invalid(start, { Move(Location{ 3, 1 }, Direction::Right),
                                 Move(Location{ 3, 1 }, Direction::Right) }));            // source now empty
  assert(throws_invalid(start, { Move(Location{ 0, 2 }, Direction::Down) }));            // target occupied

  return 0;
}
