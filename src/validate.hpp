#ifndef _TRANSPORTATION_VALIDATE_HPP_
#define _TRANSPORTATION_VALIDATE_HPP_

#include "transportation.hpp"

namespace transportation {

/* Tolerance for comparing sums of the magnitude of total */
double scaledTolerance(double tolerance, double total);

template <typename T>
T sum(const std::vector<T>& values);

/* Throws AllocationError unless allocation is a non-negative matrix that
 * meets every supply and demand of the (validated) problem. */
template <typename T>
void validateAllocation(const Problem<T>& problem, const Matrix<T>& allocation,
        double tolerance);

} // namespace transportation

#endif
