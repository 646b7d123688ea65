#include "solcross/transform.hpp"


namespace solcross {


std::vector<Location> orbit(Transform t, Location v, int size) {
std::vector<Location> out;
out.push_back(v);
for (Location cur = apply_transform(t, v, size); cur != v; cur = apply_transform(t, cur, size))
out.push_back(cur);
return out;
}


Location orbit_representative(Transform t, Location v, int size) {
Location best = v;
for (const Location& o : orbit(t, v, size)) best = min_location(best, o);
return best;
}


} // namespace solcross
