#ifndef _TRANSPORTATION_HPP_
#define _TRANSPORTATION_HPP_

#include <cstdint>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#ifdef NDEBUG
#define BOOST_DISABLE_ASSERTS
#endif
#include <boost/multi_array.hpp>


namespace transportation {

/* Raised when an internal invariant of the solver is broken (disconnected
 * basis, missing loop, north-west corner mismatch). Always a defect.
 */
class InvariantError : public std::logic_error {
    public:
        InvariantError(const std::string& what) : logic_error(what) { }
};

#ifndef NDEBUG_TRANSPORT
#define TRANSPORT_ASSERT_S1(x) #x
#define TRANSPORT_ASSERT_S2(x) TRANSPORT_ASSERT_S1(x)
#define TRANSPORT_ASSERT_LINE TRANSPORT_ASSERT_S2( __LINE__ )
#define TRANSPORT_ASSERT(x) ((void)(!(x) && (throw ::transportation::InvariantError( "Assertion Failed: " #x " at " __FILE__ ":" TRANSPORT_ASSERT_LINE), 1)))
#else
#define TRANSPORT_ASSERT(x) ((void)sizeof(x))
#endif

/* Base of all errors caused by the caller's input */
class TransportError : public std::runtime_error {
    public:
        TransportError(const std::string& what) : runtime_error(what) { }
};

class ShapeError : public TransportError {
    public:
        ShapeError(const std::string& what) : TransportError(what) { }
};

class BalanceError : public TransportError {
    public:
        BalanceError(double totalSupply, double totalDemand);

        double totalSupply() const { return _totalSupply; }
        double totalDemand() const { return _totalDemand; }
        double difference() const { return _totalSupply - _totalDemand; }

    private:
        double _totalSupply;
        double _totalDemand;
};

/* A caller supplied starting allocation that is not a basic feasible
 * solution of the problem */
class AllocationError : public TransportError {
    public:
        AllocationError(const std::string& what) : TransportError(what) { }
};

template <typename T>
using Matrix = boost::multi_array<T, 2>;

struct Cell {
    int row;
    int col;
};

inline bool operator==(const Cell& a, const Cell& b) {
    return a.row == b.row && a.col == b.col;
}
inline bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }
inline bool operator<(const Cell& a, const Cell& b) {
    return a.row < b.row || (a.row == b.row && a.col < b.col);
}
inline std::ostream& operator<<(std::ostream& os, const Cell& c) {
    return os << "(" << c.row << ", " << c.col << ")";
}

const Cell NoCell = { -1, -1 };

/*
 * A balanced transportation problem
 *
 * min \sum_{i,j} c_{i,j} x_{i,j}
 * s.t. \sum_j x_{i,j} = s_i
 *      \sum_i x_{i,j} = d_j
 *      x_{i,j} >= 0
 *
 * costs has extents [supply.size()][demand.size()], row i is warehouse i and
 * column j is destination j.
 */
template <typename T>
struct Problem {
    Matrix<T> costs;
    std::vector<T> supply;
    std::vector<T> demand;

    int numSupply() const { return static_cast<int>(supply.size()); }
    int numDemand() const { return static_cast<int>(demand.size()); }
};

enum class EnteringRule {
    MostNegative,   // most negative opportunity cost, lowest row then column
    FirstNegative   // first improving cell in row-major order
};

enum class LeavingRule {
    LowestIndex,    // lowest row then column among the minimal minus cells
    LoopOrder       // first minimal minus cell walking the loop from the entering cell
};

struct SolveParams {
    double tolerance { 1.0e-9 };
    int iterationFactor { 4 };
    int minIterations { 16 };
    // Hard cap on the number of pivots, overrides the derived bound if >= 0
    int maxIterations { -1 };
    EnteringRule enteringRule { EnteringRule::MostNegative };
    LeavingRule leavingRule { LeavingRule::LowestIndex };
};

/* Number of pivots allowed before the solve is declared non-convergent */
int IterationBound(int numSupply, int numDemand, const SolveParams& params);

struct LoopStep {
    Cell cell;
    int sign; // +1 or -1
};

/*
 * One committed step of a solve. Iteration 0 is the north-west corner
 * starting point (or the repaired warm start): it has no entering or
 * leaving cell and an empty loop.
 */
template <typename T>
struct IterationRecord {
    int iteration = 0;
    Cell entering = NoCell;
    T enteringCost = 0;
    std::vector<LoopStep> loop;
    T theta = 0;
    Cell leaving = NoCell;
    T totalCost = 0;
    Matrix<T> allocation;
    std::vector<Cell> basicCells;

    bool isInitial() const { return iteration == 0; }
};

template <typename T>
struct SolveResult {
    Matrix<T> allocation;
    std::vector<Cell> basicCells;
    std::vector<T> u;
    std::vector<T> v;
    T totalCost = 0;
    int iterations = 0;
    std::vector<IterationRecord<T>> records;
};

/* Raised when the pivot bound is reached before optimality. Carries the
 * last committed allocation. */
template <typename T>
class NonConvergenceError : public TransportError {
    public:
        NonConvergenceError(SolveResult<T> partial);

        const SolveResult<T>& partial() const { return _partial; }
        const Matrix<T>& allocation() const { return _partial.allocation; }
        T totalCost() const { return _partial.totalCost; }
        int iterations() const { return _partial.iterations; }

    private:
        SolveResult<T> _partial;
};

template <typename T>
using ProgressCallback = std::function<void(const IterationRecord<T>& record)>;

template <typename T>
struct Shipment {
    Cell cell;
    T quantity;
    T unitCost;
    T subtotal;
};

/* Throws ShapeError or BalanceError if the problem can't be solved */
template <typename T>
void Validate(const Problem<T>& problem, const SolveParams& params = SolveParams{});

/*
 * Solve the problem starting from the north-west corner allocation and
 * pivoting with the MODI method until no opportunity cost is negative.
 */
template <typename T>
SolveResult<T> Solve(const Problem<T>& problem,
        const SolveParams& params = SolveParams{},
        const ProgressCallback<T>& pc = ProgressCallback<T>{});

/*
 * Same as Solve, but start from a given feasible allocation. The positive
 * cells must not contain a loop; missing basic cells are filled in with
 * zero-valued cells.
 */
template <typename T>
SolveResult<T> Reoptimize(const Problem<T>& problem, const Matrix<T>& allocation,
        const SolveParams& params = SolveParams{},
        const ProgressCallback<T>& pc = ProgressCallback<T>{});

template <typename T>
T TotalCost(const Matrix<T>& costs, const Matrix<T>& allocation);

/* Potentials u, v with u[0] = 0 and u_i + v_j = c_ij on the basic cells */
template <typename T>
void ComputePotentials(const Matrix<T>& costs,
        const std::vector<Cell>& basicCells,
        std::vector<T>& u, std::vector<T>& v);

/* c_ij - u_i - v_j for every cell, zero on the basic cells */
template <typename T>
Matrix<T> OpportunityCosts(const Matrix<T>& costs,
        const std::vector<Cell>& basicCells);

/* Cells of the allocation with a positive quantity, row-major */
template <typename T>
std::vector<Shipment<T>> Shipments(const Matrix<T>& costs, const Matrix<T>& allocation);

} // namespace transportation



#endif
