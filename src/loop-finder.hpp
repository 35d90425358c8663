#ifndef _TRANSPORTATION_LOOP_FINDER_HPP_
#define _TRANSPORTATION_LOOP_FINDER_HPP_

#include "transportation.hpp"
#include "basis-tree.hpp"

namespace transportation {

/*
 * The closed loop formed by adding the non-basic cell `entering` to the
 * basis. Starts at `entering` with sign +1, then moves along its column,
 * then along a row, and so on, alternating signs, until the last cell which
 * shares a row with `entering`.
 *
 * Throws InvariantError if the basis doesn't connect the entering cell's
 * row and column.
 */
std::vector<LoopStep> findLoop(BasisTree& tree, const Cell& entering);

} // namespace transportation

#endif
