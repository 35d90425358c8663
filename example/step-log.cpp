#include "step-log.hpp"

#include <algorithm>
#include <iomanip>
#include <string>

using transportation::Cell;

template <typename T>
void printAllocation(std::ostream& os, const transportation::Matrix<T>& allocation,
        const std::vector<Cell>& basicCells) {
    const int m = allocation.shape()[0];
    const int n = allocation.shape()[1];
    os << std::setw(14) << "";
    for (int j = 0; j < n; ++j)
        os << std::setw(10) << ("Dest " + std::to_string(j+1));
    os << "\n";
    for (int i = 0; i < m; ++i) {
        os << std::setw(14) << ("Warehouse " + std::to_string(i+1));
        for (int j = 0; j < n; ++j) {
            bool basic = std::find(basicCells.begin(), basicCells.end(), Cell{i, j})
                != basicCells.end();
            if (basic)
                os << std::setw(10) << allocation[i][j];
            else
                os << std::setw(10) << ".";
        }
        os << "\n";
    }
}

template <typename T>
void printRecord(std::ostream& os, const transportation::IterationRecord<T>& record) {
    if (record.isInitial()) {
        os << "Initial basic feasible solution\n";
    } else {
        os << "--- Iteration " << record.iteration << " ---\n";
        os << "Cell " << record.entering << " enters, opportunity cost "
            << record.enteringCost << "\n";
        os << "Loop:";
        for (const auto& s : record.loop)
            os << " " << (s.sign > 0 ? "+" : "-") << s.cell;
        os << "\n";
        os << "Shifting " << record.theta << " units, " << record.leaving
            << " leaves the basis\n";
    }
    printAllocation(os, record.allocation, record.basicCells);
    os << "Total cost: " << record.totalCost << "\n\n";
}

template <typename T>
void printShipments(std::ostream& os, const transportation::Problem<T>& problem,
        const transportation::SolveResult<T>& result) {
    os << "Minimum total cost: " << result.totalCost << "\n";
    os << std::setw(14) << "From" << std::setw(10) << "To"
        << std::setw(12) << "Quantity" << std::setw(12) << "Unit cost"
        << std::setw(12) << "Subtotal" << "\n";
    for (const auto& s : transportation::Shipments(problem.costs, result.allocation)) {
        os << std::setw(14) << ("Warehouse " + std::to_string(s.cell.row+1))
            << std::setw(10) << ("Dest " + std::to_string(s.cell.col+1))
            << std::setw(12) << s.quantity
            << std::setw(12) << s.unitCost
            << std::setw(12) << s.subtotal << "\n";
    }
}


#define INSTANTIATE_STEP_LOG(T) \
    template void printAllocation<T>(std::ostream& os, \
            const transportation::Matrix<T>& allocation, \
            const std::vector<Cell>& basicCells); \
    template void printRecord<T>(std::ostream& os, \
            const transportation::IterationRecord<T>& record); \
    template void printShipments<T>(std::ostream& os, \
            const transportation::Problem<T>& problem, \
            const transportation::SolveResult<T>& result);
INSTANTIATE_STEP_LOG(double)
INSTANTIATE_STEP_LOG(int64_t)
#undef INSTANTIATE_STEP_LOG
