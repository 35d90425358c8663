#ifndef _PROBLEM_IO_HPP_
#define _PROBLEM_IO_HPP_

#include <istream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "transportation.hpp"

class ParseError : public std::runtime_error {
    public:
        ParseError(const std::string& what) : runtime_error(what) { }
};

/*
 * Read a problem in the plain text format
 *
 *   m n
 *   c_00 ... c_0(n-1)
 *   ...
 *   c_(m-1)0 ... c_(m-1)(n-1)
 *   s_0 ... s_(m-1)
 *   d_0 ... d_(n-1)
 *
 * Whitespace separated, anything after '#' on a line is ignored.
 */
template <typename T>
transportation::Problem<T> readProblem(std::istream& is) {
    std::string text;
    std::string line;
    while (std::getline(is, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos)
            line.erase(hash);
        text += line;
        text += '\n';
    }
    std::istringstream tokens{text};

    auto next = [&](const char* what) -> T {
        T x;
        if (!(tokens >> x))
            throw ParseError(std::string("Expected a number for ") + what);
        return x;
    };

    int m = 0;
    int n = 0;
    if (!(tokens >> m >> n) || m <= 0 || n <= 0)
        throw ParseError("Expected positive dimensions 'm n' first");

    transportation::Problem<T> p;
    p.costs.resize(boost::extents[m][n]);
    for (int i = 0; i < m; ++i)
        for (int j = 0; j < n; ++j)
            p.costs[i][j] = next("a cost");
    for (int i = 0; i < m; ++i)
        p.supply.push_back(next("a supply"));
    for (int j = 0; j < n; ++j)
        p.demand.push_back(next("a demand"));

    std::string rest;
    if (tokens >> rest)
        throw ParseError("Unexpected trailing input '" + rest + "'");
    return p;
}

#endif
