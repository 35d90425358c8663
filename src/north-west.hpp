#ifndef _TRANSPORTATION_NORTH_WEST_HPP_
#define _TRANSPORTATION_NORTH_WEST_HPP_

#include "transportation.hpp"
#include "basis-tree.hpp"

namespace transportation {

/*
 * North-west corner rule. Fills allocation (resized to the problem) and adds
 * exactly numSupply+numDemand-1 basic cells, forming a staircase from (0, 0)
 * to (m-1, n-1), to an empty tree.
 *
 * When a supply and a demand run out together, the cursor moves diagonally
 * and the cell below the exhausted one is kept as a zero-valued basic cell.
 *
 * The problem must already be validated.
 */
template <typename T>
void northWestCorner(const Problem<T>& problem, double tolerance,
        Matrix<T>& allocation, BasisTree& tree);

} // namespace transportation

#endif
