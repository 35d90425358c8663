#include "north-west.hpp"
#include "validate.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <glog/logging.h>

namespace transportation {

template <typename T>
void northWestCorner(const Problem<T>& problem, double tolerance,
        Matrix<T>& allocation, BasisTree& tree) {
    const int m = problem.numSupply();
    const int n = problem.numDemand();
    TRANSPORT_ASSERT(tree.size() == 0);
    TRANSPORT_ASSERT(tree.numSupply() == m && tree.numDemand() == n);

    allocation.resize(boost::extents[m][n]);
    std::fill_n(allocation.data(), allocation.num_elements(), T(0));

    std::vector<T> resSupply = problem.supply;
    std::vector<T> resDemand = problem.demand;
    const double tol = scaledTolerance(tolerance, static_cast<double>(sum(problem.supply)));

    // Residue within the balance tolerance may be stranded on one side
    auto checkResidue = [&](const Cell& c, T left) {
        if (std::fabs(static_cast<double>(left)) > tol) {
            std::ostringstream ss;
            ss << "North-west corner stalled at " << c << " with supply "
                << resSupply[c.row] << " and demand " << resDemand[c.col] << " left";
            throw InvariantError(ss.str());
        }
    };

    int row = 0;
    int col = 0;
    while (row != m-1 || col != n-1) {
        T f = std::min(resSupply[row], resDemand[col]);
        allocation[row][col] = f;
        tree.addCell(Cell{row, col});
        resSupply[row] -= f;
        resDemand[col] -= f;

        bool rowDone = resSupply[row] == 0;
        bool colDone = resDemand[col] == 0;
        if (rowDone && colDone && row < m-1 && col < n-1) {
            VLOG(2) << "North-west corner tie at " << Cell{row, col}
                << ", zero basic cell at " << Cell{row+1, col};
            tree.addCell(Cell{row+1, col});
            ++row;
            ++col;
        } else if (rowDone && row < m-1) {
            ++row;
        } else if (colDone && col < n-1) {
            ++col;
        } else if (row == m-1) {
            // Last supply is used up, the column keeps a tolerable remainder
            checkResidue(Cell{row, col}, resDemand[col]);
            VLOG(2) << "North-west corner leaves " << resDemand[col]
                << " of demand " << col << " unshipped";
            ++col;
        } else {
            checkResidue(Cell{row, col}, resSupply[row]);
            VLOG(2) << "North-west corner leaves " << resSupply[row]
                << " of supply " << row << " unshipped";
            ++row;
        }
    }

    // The last cell takes what is left, which balance makes equal on both sides
    T lastSupply = resSupply[m-1];
    T lastDemand = resDemand[n-1];
    double diff = std::fabs(static_cast<double>(lastSupply - lastDemand));
    if (diff > tol) {
        std::ostringstream ss;
        ss << "North-west corner ends with supply " << lastSupply
            << " but demand " << lastDemand;
        throw InvariantError(ss.str());
    }
    allocation[m-1][n-1] = lastSupply;
    tree.addCell(Cell{m-1, n-1});

    TRANSPORT_ASSERT(tree.isComplete());
}


#define INSTANTIATE_NORTH_WEST(T) \
    template void northWestCorner<T>(const Problem<T>& problem, double tolerance, \
            Matrix<T>& allocation, BasisTree& tree);
INSTANTIATE_NORTH_WEST(double)
INSTANTIATE_NORTH_WEST(int64_t)
#undef INSTANTIATE_NORTH_WEST

} // namespace transportation
