#ifndef _TRANSPORTATION_TEST_UTIL_HPP_
#define _TRANSPORTATION_TEST_UTIL_HPP_

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <functional>
#include <limits>
#include <random>
#include <vector>

#include "transportation.hpp"

namespace transportation {

template <typename T>
Matrix<T> makeMatrix(const std::vector<std::vector<T>>& rows) {
    const int m = rows.size();
    const int n = m > 0 ? rows[0].size() : 0;
    Matrix<T> a{boost::extents[m][n]};
    for (int i = 0; i < m; ++i)
        for (int j = 0; j < n; ++j)
            a[i][j] = rows[i][j];
    return a;
}

template <typename T>
Problem<T> makeProblem(const std::vector<std::vector<T>>& costs,
        const std::vector<T>& supply, const std::vector<T>& demand) {
    Problem<T> p;
    p.costs.resize(boost::extents[costs.size()][costs.empty() ? 0 : costs[0].size()]);
    p.costs = makeMatrix(costs);
    p.supply = supply;
    p.demand = demand;
    return p;
}

template <typename T>
void checkMatrix(const Matrix<T>& a, const std::vector<std::vector<T>>& expected) {
    BOOST_REQUIRE_EQUAL(a.shape()[0], expected.size());
    for (int i = 0; i < static_cast<int>(expected.size()); ++i) {
        BOOST_REQUIRE_EQUAL(a.shape()[1], expected[i].size());
        for (int j = 0; j < static_cast<int>(expected[i].size()); ++j)
            BOOST_CHECK_EQUAL(a[i][j], expected[i][j]);
    }
}

inline void checkCells(std::vector<Cell> cells, std::vector<Cell> expected) {
    std::sort(cells.begin(), cells.end());
    std::sort(expected.begin(), expected.end());
    BOOST_CHECK_EQUAL_COLLECTIONS(cells.begin(), cells.end(),
            expected.begin(), expected.end());
}

/* Every row ships its supply and every column receives its demand */
template <typename T>
void checkFeasible(const Problem<T>& p, const Matrix<T>& allocation) {
    for (int i = 0; i < p.numSupply(); ++i) {
        T s = 0;
        for (int j = 0; j < p.numDemand(); ++j) {
            BOOST_CHECK(allocation[i][j] >= 0);
            s += allocation[i][j];
        }
        BOOST_CHECK_EQUAL(s, p.supply[i]);
    }
    for (int j = 0; j < p.numDemand(); ++j) {
        T d = 0;
        for (int i = 0; i < p.numSupply(); ++i)
            d += allocation[i][j];
        BOOST_CHECK_EQUAL(d, p.demand[j]);
    }
}

/* Random split of total into k non-negative integer parts */
inline std::vector<int64_t> randomSplit(std::mt19937& gen, int64_t total, int k) {
    std::uniform_int_distribution<int64_t> cutDist{0, total};
    std::vector<int64_t> cuts;
    for (int i = 0; i < k-1; ++i)
        cuts.push_back(cutDist(gen));
    cuts.push_back(0);
    cuts.push_back(total);
    std::sort(cuts.begin(), cuts.end());
    std::vector<int64_t> parts;
    for (int i = 0; i < k; ++i)
        parts.push_back(cuts[i+1] - cuts[i]);
    return parts;
}

/* Balanced integer instance, small totals so ties and zero rows are common */
inline Problem<int64_t> randomProblem(std::mt19937& gen, int m, int n,
        int64_t total, int64_t maxCost) {
    std::uniform_int_distribution<int64_t> costDist{0, maxCost};
    Problem<int64_t> p;
    p.costs.resize(boost::extents[m][n]);
    for (int i = 0; i < m; ++i)
        for (int j = 0; j < n; ++j)
            p.costs[i][j] = costDist(gen);
    p.supply = randomSplit(gen, total, m);
    p.demand = randomSplit(gen, total, n);
    return p;
}

namespace detail {

inline void enumerateRows(const Problem<int64_t>& p, int row,
        std::vector<int64_t>& resDemand, int64_t cost, int64_t& best) {
    const int n = p.numDemand();
    if (row == p.numSupply()) {
        if (std::all_of(resDemand.begin(), resDemand.end(),
                    [](int64_t d) { return d == 0; }))
            best = std::min(best, cost);
        return;
    }
    // Distribute supply[row] over the columns, column by column
    std::function<void(int, int64_t, int64_t)> place =
        [&](int col, int64_t remaining, int64_t rowCost) {
            if (col == n-1) {
                if (remaining > resDemand[col])
                    return;
                resDemand[col] -= remaining;
                enumerateRows(p, row+1, resDemand,
                        rowCost + remaining*p.costs[row][col], best);
                resDemand[col] += remaining;
                return;
            }
            for (int64_t q = 0; q <= std::min(remaining, resDemand[col]); ++q) {
                resDemand[col] -= q;
                place(col+1, remaining-q, rowCost + q*p.costs[row][col]);
                resDemand[col] += q;
            }
        };
    place(0, p.supply[row], cost);
}

} // namespace detail

/* Minimum cost over every integer allocation, only for tiny instances */
inline int64_t bruteForceOptimum(const Problem<int64_t>& p) {
    std::vector<int64_t> resDemand = p.demand;
    int64_t best = std::numeric_limits<int64_t>::max();
    detail::enumerateRows(p, 0, resDemand, 0, best);
    return best;
}

} // namespace transportation

#endif
