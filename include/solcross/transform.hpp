#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include "solcross/types.hpp"


namespace solcross {


// Board symmetries other than the identity. Each is an involution on a
// square board of side `size`.
enum class Transform : std::uint8_t {
HalfRotation = 0,
VerticalReflection = 1,
HorizontalReflection = 2,
};


inline constexpr std::array<Transform, 3> ALL_TRANSFORMS = {
Transform::HalfRotation, Transform::VerticalReflection, Transform::HorizontalReflection
};


inline constexpr Location apply_transform(Transform t, Location v, int size) {
switch (t) {
case Transform::HalfRotation:         return Location{ size - 1 - v.row, size - 1 - v.column };
case Transform::VerticalReflection:   return Location{ v.row, size - 1 - v.column };
case Transform::HorizontalReflection: return Location{ size - 1 - v.row, v.column };
}
return v;
}


// Cycle of v under repeated application of t, starting with v.
std::vector<Location> orbit(Transform t, Location v, int size);


// Smallest location of orbit(t, v); a deterministic pick per orbit.
Location orbit_representative(Transform t, Location v, int size);


inline bool is_orbit_representative(Transform t, Location v, int size) {
return orbit_representative(t, v, size) == v;
}


} // namespace solcross
