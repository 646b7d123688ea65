#pragma once
#include <cstdint>


namespace solcross {


enum class CellState : std::uint8_t { Off = 0, Empty = 1, Occupied = 2 };


// Board coordinate; also used as a displacement.
struct Location {
int row{0};
int column{0};
};


inline constexpr Location operator+(Location a, Location b) {
return Location{ a.row + b.row, a.column + b.column };
}


inline constexpr bool operator==(Location a, Location b) {
return a.row == b.row && a.column == b.column;
}


inline constexpr bool operator!=(Location a, Location b) { return !(a == b); }


// Row-major order.
inline constexpr bool operator<(Location a, Location b) {
return a.row < b.row || (a.row == b.row && a.column < b.column);
}


inline constexpr Location min_location(Location a, Location b) { return (b < a) ? b : a; }


constexpr int DEFAULT_MAX_DEPTH = 5;
constexpr int MIN_BOARD_SIZE = 3;
constexpr int MAX_BOARD_SIZE = 15;


} // namespace solcross
