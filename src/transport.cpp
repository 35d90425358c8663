#include "transportation.hpp"
#include "basis-tree.hpp"
#include "modi.hpp"
#include "north-west.hpp"
#include "union-find.hpp"
#include "validate.hpp"

#include <algorithm>
#include <sstream>

#include <glog/logging.h>

namespace transportation {

namespace {

std::string nonConvergenceMessage(int iterations) {
    std::ostringstream ss;
    ss << "Transportation problem not optimal after " << iterations << " iterations";
    return ss.str();
}

} // anonymous namespace

template <typename T>
NonConvergenceError<T>::NonConvergenceError(SolveResult<T> partial)
    : TransportError(nonConvergenceMessage(partial.iterations))
    , _partial(partial)
{ }

int IterationBound(int numSupply, int numDemand, const SolveParams& params) {
    if (params.maxIterations >= 0)
        return params.maxIterations;
    return std::max(params.minIterations, params.iterationFactor*numSupply*numDemand);
}

template <typename T>
SolveResult<T> Solve(const Problem<T>& problem, const SolveParams& params,
        const ProgressCallback<T>& pc) {
    Validate(problem, params);

    const int m = problem.numSupply();
    const int n = problem.numDemand();
    Matrix<T> allocation{boost::extents[m][n]};
    BasisTree tree{m, n};
    northWestCorner(problem, params.tolerance, allocation, tree);

    ModiOptimizer<T> modi{problem, params, allocation, tree, pc};
    return modi.run();
}

template <typename T>
SolveResult<T> Reoptimize(const Problem<T>& problem, const Matrix<T>& allocation,
        const SolveParams& params, const ProgressCallback<T>& pc) {
    Validate(problem, params);
    validateAllocation(problem, allocation, params.tolerance);

    const int m = problem.numSupply();
    const int n = problem.numDemand();
    Matrix<T> working{boost::extents[m][n]};
    BasisTree tree{m, n};
    UnionFind components{m+n};
    for (int i = 0; i < m; ++i) {
        for (int j = 0; j < n; ++j) {
            working[i][j] = allocation[i][j];
            if (working[i][j] == 0)
                continue;
            if (!components.Merge(tree.rowNode(i), tree.colNode(j))) {
                std::ostringstream ss;
                ss << "Positive cells of the allocation form a loop through "
                    << Cell{i, j} << ", not a basic solution";
                throw AllocationError(ss.str());
            }
            tree.addCell(Cell{i, j});
        }
    }

    // Degenerate start: complete the forest to a spanning tree with empty
    // cells, row-major, skipping any that would close a loop
    for (int i = 0; i < m && !tree.isComplete(); ++i) {
        for (int j = 0; j < n && !tree.isComplete(); ++j) {
            if (working[i][j] != 0)
                continue;
            if (components.Merge(tree.rowNode(i), tree.colNode(j))) {
                VLOG(2) << "Zero basic cell at " << Cell{i, j};
                tree.addCell(Cell{i, j});
            }
        }
    }
    TRANSPORT_ASSERT(tree.isComplete());

    ModiOptimizer<T> modi{problem, params, working, tree, pc};
    return modi.run();
}

template <typename T>
T TotalCost(const Matrix<T>& costs, const Matrix<T>& allocation) {
    if (!std::equal(costs.shape(), costs.shape()+2, allocation.shape()))
        throw ShapeError("Cost matrix and allocation differ in shape");
    T total = 0;
    const int m = costs.shape()[0];
    const int n = costs.shape()[1];
    for (int i = 0; i < m; ++i)
        for (int j = 0; j < n; ++j)
            total += costs[i][j]*allocation[i][j];
    return total;
}

template <typename T>
std::vector<Shipment<T>> Shipments(const Matrix<T>& costs, const Matrix<T>& allocation) {
    if (!std::equal(costs.shape(), costs.shape()+2, allocation.shape()))
        throw ShapeError("Cost matrix and allocation differ in shape");
    std::vector<Shipment<T>> result;
    const int m = costs.shape()[0];
    const int n = costs.shape()[1];
    for (int i = 0; i < m; ++i) {
        for (int j = 0; j < n; ++j) {
            T q = allocation[i][j];
            if (q > 0)
                result.push_back(Shipment<T>{Cell{i, j}, q, costs[i][j], q*costs[i][j]});
        }
    }
    return result;
}


#define INSTANTIATE_TRANSPORT(T) \
    template class NonConvergenceError<T>; \
    template SolveResult<T> Solve<T>(const Problem<T>& problem, \
            const SolveParams& params, const ProgressCallback<T>& pc); \
    template SolveResult<T> Reoptimize<T>(const Problem<T>& problem, \
            const Matrix<T>& allocation, const SolveParams& params, \
            const ProgressCallback<T>& pc); \
    template T TotalCost<T>(const Matrix<T>& costs, const Matrix<T>& allocation); \
    template std::vector<Shipment<T>> Shipments<T>(const Matrix<T>& costs, \
            const Matrix<T>& allocation);
INSTANTIATE_TRANSPORT(double)
INSTANTIATE_TRANSPORT(int64_t)
#undef INSTANTIATE_TRANSPORT

} // namespace transportation
