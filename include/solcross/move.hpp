#pragma once
#include <array>
#include <cstdint>
#include "solcross/types.hpp"


namespace solcross {


enum class Direction : std::uint8_t { Right = 0, Up = 1, Left = 2, Down = 3 };


inline constexpr std::array<Direction, 4> DIRECTIONS = {
Direction::Right, Direction::Up, Direction::Left, Direction::Down
};


// Jump distance is fixed at two cells.
inline constexpr Location displacement(Direction d) {
switch (d) {
case Direction::Right: return Location{ 0, +2 };
case Direction::Up:    return Location{ -2, 0 };
case Direction::Left:  return Location{ 0, -2 };
case Direction::Down:  return Location{ +2, 0 };
}
return Location{};
}


struct Move {
Location from{};
Location to{};

Move() = default;
constexpr Move(Location f, Location t) : from(f), to(t) {}
constexpr Move(Location f, Direction d) : from(f), to(f + displacement(d)) {}

// The captured peg.
constexpr Location skipped() const {
return Location{ (from.row + to.row) / 2, (from.column + to.column) / 2 };
}
};


inline constexpr bool operator==(const Move& a, const Move& b) {
return a.from == b.from && a.to == b.to;
}


inline constexpr bool operator!=(const Move& a, const Move& b) { return !(a == b); }


} // namespace solcross
