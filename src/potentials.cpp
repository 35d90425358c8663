#include "potentials.hpp"
#include "union-find.hpp"

#include <sstream>

#include <glog/logging.h>

namespace transportation {

template <typename T>
void computePotentials(const Matrix<T>& costs, BasisTree& tree,
        std::vector<T>& u, std::vector<T>& v) {
    const int m = tree.numSupply();
    const int n = tree.numDemand();
    std::vector<T> potential(m+n, 0);

    int numReached = tree.traverse(tree.rowNode(0),
        [&](int parent, int child, const Cell& c) {
            potential[child] = costs[c.row][c.col] - potential[parent];
        });
    if (numReached != m+n) {
        std::ostringstream ss;
        ss << "Basis with " << tree.size() << " cells reaches only "
            << numReached << " of " << m+n << " rows and columns";
        throw InvariantError(ss.str());
    }

    u.assign(potential.begin(), potential.begin()+m);
    v.assign(potential.begin()+m, potential.end());
    if (VLOG_IS_ON(2)) {
        std::ostringstream ss;
        for (auto x : u) ss << " " << x;
        ss << " |";
        for (auto x : v) ss << " " << x;
        VLOG(2) << "Potentials u | v:" << ss.str();
    }
}

template <typename T>
bool findEntering(const Matrix<T>& costs, const BasisTree& tree,
        const std::vector<T>& u, const std::vector<T>& v,
        EnteringRule rule, double tolerance,
        Cell& entering, T& enteringCost) {
    bool found = false;
    for (int i = 0; i < tree.numSupply(); ++i) {
        for (int j = 0; j < tree.numDemand(); ++j) {
            Cell c{i, j};
            if (tree.isBasic(c))
                continue;
            T d = reducedCost(costs, u, v, c);
            if (!(static_cast<double>(d) < -tolerance))
                continue;
            // Strict comparison keeps the lowest row, then column, among ties
            if (!found || d < enteringCost) {
                found = true;
                entering = c;
                enteringCost = d;
                if (rule == EnteringRule::FirstNegative)
                    return true;
            }
        }
    }
    return found;
}

template <typename T>
void ComputePotentials(const Matrix<T>& costs,
        const std::vector<Cell>& basicCells,
        std::vector<T>& u, std::vector<T>& v) {
    const int m = costs.shape()[0];
    const int n = costs.shape()[1];
    if (m == 0 || n == 0)
        throw ShapeError("Empty cost matrix");
    if (static_cast<int>(basicCells.size()) != m+n-1) {
        std::ostringstream ss;
        ss << "A " << m << "x" << n << " basis needs " << m+n-1
            << " cells, got " << basicCells.size();
        throw ShapeError(ss.str());
    }

    BasisTree tree{m, n};
    UnionFind components{m+n};
    for (const auto& c : basicCells) {
        if (c.row < 0 || c.row >= m || c.col < 0 || c.col >= n) {
            std::ostringstream ss;
            ss << "Basic cell " << c << " is outside of the cost matrix";
            throw ShapeError(ss.str());
        }
        if (!components.Merge(tree.rowNode(c.row), tree.colNode(c.col))) {
            std::ostringstream ss;
            ss << "Basic cell " << c << " closes a loop";
            throw ShapeError(ss.str());
        }
        tree.addCell(c);
    }
    computePotentials(costs, tree, u, v);
}

template <typename T>
Matrix<T> OpportunityCosts(const Matrix<T>& costs,
        const std::vector<Cell>& basicCells) {
    std::vector<T> u;
    std::vector<T> v;
    ComputePotentials(costs, basicCells, u, v);

    const int m = u.size();
    const int n = v.size();
    Matrix<T> d{boost::extents[m][n]};
    for (int i = 0; i < m; ++i)
        for (int j = 0; j < n; ++j)
            d[i][j] = reducedCost(costs, u, v, Cell{i, j});
    // Exactly zero on the basis, whatever the rounding
    for (const auto& c : basicCells)
        d[c.row][c.col] = 0;
    return d;
}


#define INSTANTIATE_POTENTIALS(T) \
    template void computePotentials<T>(const Matrix<T>& costs, BasisTree& tree, \
            std::vector<T>& u, std::vector<T>& v); \
    template bool findEntering<T>(const Matrix<T>& costs, const BasisTree& tree, \
            const std::vector<T>& u, const std::vector<T>& v, \
            EnteringRule rule, double tolerance, Cell& entering, T& enteringCost); \
    template void ComputePotentials<T>(const Matrix<T>& costs, \
            const std::vector<Cell>& basicCells, std::vector<T>& u, std::vector<T>& v); \
    template Matrix<T> OpportunityCosts<T>(const Matrix<T>& costs, \
            const std::vector<Cell>& basicCells);
INSTANTIATE_POTENTIALS(double)
INSTANTIATE_POTENTIALS(int64_t)
#undef INSTANTIATE_POTENTIALS

} // namespace transportation
