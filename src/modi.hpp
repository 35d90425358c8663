#ifndef _TRANSPORTATION_MODI_HPP_
#define _TRANSPORTATION_MODI_HPP_

#include "transportation.hpp"
#include "basis-tree.hpp"

namespace transportation {

/*
 * Modified distribution method, run as a state machine:
 *
 *   Evaluating -> Optimal     no reduced cost below -tolerance
 *   Evaluating -> Failed      an improving cell exists but the pivot bound is used up
 *   Evaluating -> Shifting    entering cell chosen
 *   Shifting   -> Evaluating  theta moved around the loop, basis updated
 *
 * Works in place on a feasible allocation and its complete basis.
 */
template <typename T>
class ModiOptimizer {
    public:
        enum class State { Evaluating, Shifting, Optimal, Failed };

        ModiOptimizer(const Problem<T>& problem, const SolveParams& params,
                Matrix<T>& allocation, BasisTree& tree,
                const ProgressCallback<T>& pc);

        /* Records the current allocation as iteration 0, then pivots until
         * optimal. Throws NonConvergenceError when the bound is reached. */
        SolveResult<T> run();

        State state() const { return _state; }
        int iteration() const { return _iteration; }

    private:
        State _evaluate();
        State _shift();
        void _chooseLeaving(const std::vector<LoopStep>& loop, T& theta, Cell& leaving) const;
        void _commit(IterationRecord<T>& record);
        SolveResult<T> _result() const;

        const Problem<T>& _problem;
        const SolveParams& _params;
        Matrix<T>& _allocation;
        BasisTree& _tree;
        const ProgressCallback<T>& _pc;

        State _state = State::Evaluating;
        int _iteration = 0;
        int _bound;
        std::vector<T> _u;
        std::vector<T> _v;
        Cell _entering = NoCell;
        T _enteringCost = 0;
        std::vector<IterationRecord<T>> _records;
};

} // namespace transportation

#endif
