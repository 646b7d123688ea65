#include "solcross/board.hpp"
#include <algorithm>
#include <cassert>
#include <utility>


namespace solcross {


Board::Board() : Board(cross_layout(), DEFAULT_MAX_DEPTH) {}


Board::Board(std::shared_ptr<const Layout> layout, int max_depth)
: layout_(std::move(layout)), max_depth_(max_depth) {
assert(layout_ && "board needs a layout");
cells_ = layout_->initial;
}


CellState Board::cell(Location v) const {
assert(layout_->in_bounds(v));
return cells_[layout_->index(v)];
}


int Board::peg_count() const {
return static_cast<int>(std::count(cells_.begin(), cells_.end(), CellState::Occupied));
}


bool Board::is_invariant_under(Transform t) const {
const int n = size();
for (const Location& v : layout_->positions)
if (cell(v) != cell(apply_transform(t, v, n))) return false;
return true;
}


const std::vector<Transform>& Board::symmetries() const {
if (!symmetries_) {
std::vector<Transform> found;
for (Transform t : ALL_TRANSFORMS)
if (is_invariant_under(t)) found.push_back(t);
symmetries_ = std::move(found);
}
return *symmetries_;
}


bool Board::is_cell_orbit_representative_of_all_symmetries(Location v) const {
const int n = size();
for (Transform t : symmetries())
if (!is_orbit_representative(t, v, n)) return false;
return true;
}


bool Board::is_move_possible(const Move& m) const {
return cell(m.from) == CellState::Occupied &&
       cell(m.to) == CellState::Empty &&
       cell(m.skipped()) == CellState::Occupied;
}


std::vector<Move> Board::possible_moves() const {
std::vector<Move> out;
if (static_cast<int>(history_.size()) >= max_depth_) return out;
for (const Move& m : layout_->allowable)
if (is_move_possible(m) && is_cell_orbit_representative_of_all_symmetries(m.from))
out.push_back(m);
return out;
}


Board Board::apply_move(const Move& m) const {
Board child(*this);
child.symmetries_.reset();
child.cells_[layout_->index(m.skipped())] = CellState::Empty;
child.cells_[layout_->index(m.from)] = CellState::Empty;
child.cells_[layout_->index(m.to)] = CellState::Occupied;
child.history_.push_back(m);
return child;
}


} // namespace solcross
