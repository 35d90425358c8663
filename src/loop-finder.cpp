#include "loop-finder.hpp"

#include <sstream>

#include <glog/logging.h>

namespace transportation {

std::vector<LoopStep> findLoop(BasisTree& tree, const Cell& entering) {
    TRANSPORT_ASSERT(!tree.isBasic(entering));

    // Adding entering to the tree closes exactly one cycle: entering plus
    // the tree path between its column and its row.
    std::vector<Cell> path = tree.path(tree.colNode(entering.col),
            tree.rowNode(entering.row));
    if (path.empty()) {
        std::ostringstream ss;
        ss << "No loop through " << entering << ": row and column are not "
            << "connected by the basis";
        throw InvariantError(ss.str());
    }
    // Bipartite path from a column to a row has odd length, at least 3
    // since entering itself is not basic
    TRANSPORT_ASSERT(path.size() % 2 == 1);
    TRANSPORT_ASSERT(path.size() >= 3);

    std::vector<LoopStep> loop;
    loop.reserve(path.size()+1);
    loop.push_back(LoopStep{entering, +1});
    int sign = -1;
    for (const auto& c : path) {
        const Cell& prev = loop.back().cell;
        // Odd positions move vertically, even positions horizontally
        if (loop.size() % 2 == 1)
            TRANSPORT_ASSERT(c.col == prev.col && c.row != prev.row);
        else
            TRANSPORT_ASSERT(c.row == prev.row && c.col != prev.col);
        loop.push_back(LoopStep{c, sign});
        sign = -sign;
    }
    TRANSPORT_ASSERT(loop.back().cell.row == entering.row);

    if (VLOG_IS_ON(2)) {
        std::ostringstream ss;
        for (const auto& s : loop)
            ss << " " << (s.sign > 0 ? "+" : "-") << s.cell;
        VLOG(2) << "Loop:" << ss.str();
    }
    return loop;
}

} // namespace transportation
