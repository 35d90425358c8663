#include "validate.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace transportation {

namespace {

std::string balanceMessage(double totalSupply, double totalDemand) {
    std::ostringstream ss;
    ss << "Total supply (" << totalSupply << ") must equal total demand ("
        << totalDemand << "), difference " << totalSupply - totalDemand;
    return ss.str();
}

template <typename T>
bool isNegative(T x) {
    // Also rejects NaN
    return !(x >= 0);
}

template <typename T>
bool isFinite(T x) {
    return std::isfinite(static_cast<double>(x));
}

template <typename T>
void checkNonNegative(const std::vector<T>& values, const char* name) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (isNegative(values[i]) || !isFinite(values[i])) {
            std::ostringstream ss;
            ss << name << "[" << i << "] = " << values[i] << " is negative or not finite";
            throw ShapeError(ss.str());
        }
    }
}

} // anonymous namespace

BalanceError::BalanceError(double totalSupply, double totalDemand)
    : TransportError(balanceMessage(totalSupply, totalDemand))
    , _totalSupply(totalSupply)
    , _totalDemand(totalDemand)
{ }

double scaledTolerance(double tolerance, double total) {
    return tolerance*std::max(1.0, std::fabs(total));
}

template <typename T>
T sum(const std::vector<T>& values) {
    T total = 0;
    for (auto x : values)
        total += x;
    return total;
}

template <typename T>
void Validate(const Problem<T>& problem, const SolveParams& params) {
    const int m = problem.numSupply();
    const int n = problem.numDemand();
    if (m == 0)
        throw ShapeError("Problem has no supply points");
    if (n == 0)
        throw ShapeError("Problem has no demand points");

    const auto* shape = problem.costs.shape();
    if (static_cast<int>(shape[0]) != m || static_cast<int>(shape[1]) != n) {
        std::ostringstream ss;
        ss << "Cost matrix is " << shape[0] << "x" << shape[1]
            << " but there are " << m << " supplies and " << n << " demands";
        throw ShapeError(ss.str());
    }
    checkNonNegative(problem.supply, "supply");
    checkNonNegative(problem.demand, "demand");
    for (int i = 0; i < m; ++i) {
        for (int j = 0; j < n; ++j) {
            if (isNegative(problem.costs[i][j]) || !isFinite(problem.costs[i][j])) {
                std::ostringstream ss;
                ss << "cost" << Cell{i, j} << " = " << problem.costs[i][j]
                    << " is negative or not finite";
                throw ShapeError(ss.str());
            }
        }
    }

    double totalSupply = static_cast<double>(sum(problem.supply));
    double totalDemand = static_cast<double>(sum(problem.demand));
    double tol = scaledTolerance(params.tolerance, std::max(totalSupply, totalDemand));
    if (!(std::fabs(totalSupply - totalDemand) <= tol))
        throw BalanceError(totalSupply, totalDemand);
}

template <typename T>
void validateAllocation(const Problem<T>& problem, const Matrix<T>& allocation,
        double tolerance) {
    const int m = problem.numSupply();
    const int n = problem.numDemand();
    const auto* shape = allocation.shape();
    if (static_cast<int>(shape[0]) != m || static_cast<int>(shape[1]) != n) {
        std::ostringstream ss;
        ss << "Allocation is " << shape[0] << "x" << shape[1]
            << " but the problem is " << m << "x" << n;
        throw AllocationError(ss.str());
    }

    std::vector<T> rowSums(m, 0);
    std::vector<T> colSums(n, 0);
    for (int i = 0; i < m; ++i) {
        for (int j = 0; j < n; ++j) {
            T x = allocation[i][j];
            if (isNegative(x) || !isFinite(x)) {
                std::ostringstream ss;
                ss << "Allocation" << Cell{i, j} << " = " << x << " is negative or not finite";
                throw AllocationError(ss.str());
            }
            rowSums[i] += x;
            colSums[j] += x;
        }
    }
    for (int i = 0; i < m; ++i) {
        double s = static_cast<double>(problem.supply[i]);
        if (std::fabs(static_cast<double>(rowSums[i]) - s) > scaledTolerance(tolerance, s)) {
            std::ostringstream ss;
            ss << "Allocation ships " << rowSums[i] << " from supply " << i
                << " which has " << problem.supply[i];
            throw AllocationError(ss.str());
        }
    }
    for (int j = 0; j < n; ++j) {
        double d = static_cast<double>(problem.demand[j]);
        if (std::fabs(static_cast<double>(colSums[j]) - d) > scaledTolerance(tolerance, d)) {
            std::ostringstream ss;
            ss << "Allocation ships " << colSums[j] << " to demand " << j
                << " which needs " << problem.demand[j];
            throw AllocationError(ss.str());
        }
    }
}


#define INSTANTIATE_VALIDATE(T) \
    template T sum<T>(const std::vector<T>& values); \
    template void Validate<T>(const Problem<T>& problem, const SolveParams& params); \
    template void validateAllocation<T>(const Problem<T>& problem, \
            const Matrix<T>& allocation, double tolerance);
INSTANTIATE_VALIDATE(double)
INSTANTIATE_VALIDATE(int64_t)
#undef INSTANTIATE_VALIDATE

} // namespace transportation
