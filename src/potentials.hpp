#ifndef _TRANSPORTATION_POTENTIALS_HPP_
#define _TRANSPORTATION_POTENTIALS_HPP_

#include "transportation.hpp"
#include "basis-tree.hpp"

namespace transportation {

/*
 * Row potentials u and column potentials v with u[0] = 0 and
 * u_i + v_j = c_ij on every basic cell, found by walking the tree from row 0.
 * Throws InvariantError if the basic cells don't span every row and column.
 */
template <typename T>
void computePotentials(const Matrix<T>& costs, BasisTree& tree,
        std::vector<T>& u, std::vector<T>& v);

/* Reduced cost c_ij - u_i - v_j of a single cell */
template <typename T>
inline T reducedCost(const Matrix<T>& costs, const std::vector<T>& u,
        const std::vector<T>& v, const Cell& c) {
    return costs[c.row][c.col] - u[c.row] - v[c.col];
}

/*
 * Pick the entering cell among the non-basic cells with reduced cost below
 * -tolerance, according to rule. Returns false if there is none (the basis
 * is optimal).
 */
template <typename T>
bool findEntering(const Matrix<T>& costs, const BasisTree& tree,
        const std::vector<T>& u, const std::vector<T>& v,
        EnteringRule rule, double tolerance,
        Cell& entering, T& enteringCost);

} // namespace transportation

#endif
