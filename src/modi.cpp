#include "modi.hpp"
#include "loop-finder.hpp"
#include "potentials.hpp"

#include <utility>

#include <glog/logging.h>

namespace transportation {

template <typename T>
ModiOptimizer<T>::ModiOptimizer(const Problem<T>& problem, const SolveParams& params,
        Matrix<T>& allocation, BasisTree& tree, const ProgressCallback<T>& pc)
    : _problem(problem)
    , _params(params)
    , _allocation(allocation)
    , _tree(tree)
    , _pc(pc)
    , _bound(IterationBound(problem.numSupply(), problem.numDemand(), params))
{
    TRANSPORT_ASSERT(tree.isComplete());
}

template <typename T>
SolveResult<T> ModiOptimizer<T>::run() {
    {
        IterationRecord<T> initial;
        _commit(initial);
        VLOG(1) << "Initial cost " << initial.totalCost;
    }

    while (true) {
        switch (_state) {
            case State::Evaluating:
                _state = _evaluate();
                break;
            case State::Shifting:
                _state = _shift();
                break;
            case State::Optimal:
                LOG(INFO) << "Optimal after " << _iteration << " iterations, cost "
                    << _records.back().totalCost;
                return _result();
            case State::Failed:
                LOG(WARNING) << "No optimum within " << _bound << " iterations, cost "
                    << _records.back().totalCost;
                throw NonConvergenceError<T>(_result());
        }
    }
}

template <typename T>
typename ModiOptimizer<T>::State ModiOptimizer<T>::_evaluate() {
    computePotentials(_problem.costs, _tree, _u, _v);
    bool improving = findEntering(_problem.costs, _tree, _u, _v,
            _params.enteringRule, _params.tolerance, _entering, _enteringCost);
    if (!improving)
        return State::Optimal;
    if (_iteration >= _bound)
        return State::Failed;
    return State::Shifting;
}

template <typename T>
void ModiOptimizer<T>::_chooseLeaving(const std::vector<LoopStep>& loop,
        T& theta, Cell& leaving) const {
    bool found = false;
    for (const auto& s : loop) {
        if (s.sign > 0)
            continue;
        T x = _allocation[s.cell.row][s.cell.col];
        bool better = !found || x < theta;
        if (found && x == theta && _params.leavingRule == LeavingRule::LowestIndex)
            better = s.cell < leaving;
        if (better) {
            found = true;
            theta = x;
            leaving = s.cell;
        }
    }
    TRANSPORT_ASSERT(found);
}

template <typename T>
typename ModiOptimizer<T>::State ModiOptimizer<T>::_shift() {
    std::vector<LoopStep> loop = findLoop(_tree, _entering);

    T theta = 0;
    Cell leaving = NoCell;
    _chooseLeaving(loop, theta, leaving);

    for (const auto& s : loop) {
        T& x = _allocation[s.cell.row][s.cell.col];
        if (s.sign > 0)
            x += theta;
        else
            x -= theta;
    }
    TRANSPORT_ASSERT(_allocation[leaving.row][leaving.col] == 0);
    _tree.replaceCell(leaving, _entering);
    _iteration++;

    IterationRecord<T> record;
    record.entering = _entering;
    record.enteringCost = _enteringCost;
    record.loop = std::move(loop);
    record.theta = theta;
    record.leaving = leaving;
    _commit(record);

    VLOG(1) << "Iteration " << _iteration << ": " << _entering
        << " enters (reduced cost " << _enteringCost << "), " << leaving
        << " leaves, theta " << theta << ", cost " << record.totalCost;
    return State::Evaluating;
}

template <typename T>
void ModiOptimizer<T>::_commit(IterationRecord<T>& record) {
    const int m = _problem.numSupply();
    const int n = _problem.numDemand();
    record.iteration = _iteration;
    record.totalCost = TotalCost(_problem.costs, _allocation);
    record.allocation.resize(boost::extents[m][n]);
    record.allocation = _allocation;
    record.basicCells = _tree.cells();
    _records.push_back(record);
    if (_pc)
        _pc(_records.back());
}

template <typename T>
SolveResult<T> ModiOptimizer<T>::_result() const {
    const int m = _problem.numSupply();
    const int n = _problem.numDemand();
    SolveResult<T> result;
    result.allocation.resize(boost::extents[m][n]);
    result.allocation = _allocation;
    result.basicCells = _tree.cells();
    result.u = _u;
    result.v = _v;
    result.totalCost = _records.back().totalCost;
    result.iterations = _iteration;
    result.records = _records;
    return result;
}


template class ModiOptimizer<double>;
template class ModiOptimizer<int64_t>;

} // namespace transportation
