#ifndef _STEP_LOG_HPP_
#define _STEP_LOG_HPP_

#include <ostream>
#include "transportation.hpp"

template <typename T>
void printAllocation(std::ostream& os, const transportation::Matrix<T>& allocation,
        const std::vector<transportation::Cell>& basicCells);

template <typename T>
void printRecord(std::ostream& os, const transportation::IterationRecord<T>& record);

template <typename T>
void printShipments(std::ostream& os, const transportation::Problem<T>& problem,
        const transportation::SolveResult<T>& result);

#endif
