#pragma once
#include <memory>
#include <optional>
#include <vector>
#include "solcross/layout.hpp"
#include "solcross/move.hpp"
#include "solcross/transform.hpp"
#include "solcross/types.hpp"


namespace solcross {


// Immutable position: cell occupancy plus the moves that led here from the
// layout's initial cells. Children are produced by apply_move().
class Board {
public:
// Cross layout, DEFAULT_MAX_DEPTH.
Board();
explicit Board(std::shared_ptr<const Layout> layout, int max_depth = DEFAULT_MAX_DEPTH);


int size() const { return layout_->size; }
const Layout& layout() const { return *layout_; }
int max_depth() const { return max_depth_; }
const std::vector<Move>& moves_so_far() const { return history_; }

// Caller keeps v inside the board.
CellState cell(Location v) const;
int peg_count() const;

bool is_invariant_under(Transform t) const;

// Transforms this position is invariant under; computed on first use.
const std::vector<Transform>& symmetries() const;
bool is_cell_orbit_representative_of_all_symmetries(Location v) const;

bool is_move_possible(const Move& m) const;

// Possible moves whose source is canonical under symmetries(); empty once
// moves_so_far() reaches max_depth().
std::vector<Move> possible_moves() const;

Board apply_move(const Move& m) const;


private:
std::shared_ptr<const Layout> layout_;
std::vector<CellState> cells_;
std::vector<Move> history_;
int max_depth_ = DEFAULT_MAX_DEPTH;
mutable std::optional<std::vector<Transform>> symmetries_;
};


} // namespace solcross
