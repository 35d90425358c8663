#ifndef _TRANSPORTATION_BASIS_TREE_HPP_
#define _TRANSPORTATION_BASIS_TREE_HPP_

#include "transportation.hpp"

#include <algorithm>
#include <vector>

#include <boost/intrusive/list.hpp>
#include <boost/intrusive/slist.hpp>

namespace transportation {

/*
 * The set of basic cells, stored as the bipartite graph on row nodes
 * [0, numSupply) and column nodes [numSupply, numSupply+numDemand). Every
 * basic cell (i, j) is a pair of directed edges between row node i and
 * column node j. Edges live in a fixed arena with room for
 * numSupply+numDemand-1 cells; a pivot reuses the slot of the leaving cell.
 */
class BasisTree {
    public:
        BasisTree(int numSupply, int numDemand)
            : _numSupply(numSupply)
            , _numDemand(numDemand)
            , _nodes(numSupply+numDemand)
            , _edges(2*(numSupply+numDemand-1))
            , _slotOfCell(numSupply*numDemand, -1)
        {
            for (int i = 0; i < numSupply+numDemand; ++i)
                _nodes[i].id = i;
        }

        typedef boost::intrusive::list_base_hook<
            boost::intrusive::link_mode<boost::intrusive::normal_link>
            > ListHook;
        struct Edge : public ListHook {
            int target;
            int cellIdx;
            Edge* reverse;
        };

        typedef boost::intrusive::list<Edge,
                boost::intrusive::base_hook<ListHook>> EdgeList;

        typedef boost::intrusive::slist_member_hook<
            boost::intrusive::link_mode<boost::intrusive::normal_link>
            > StackHook;

        struct Node {
            int id = 0;
            EdgeList outEdges;
            EdgeList::iterator dfsOutEdge;
            StackHook stackHook;
            bool inDfsStack = false;
        };
        typedef boost::intrusive::slist<Node,
                boost::intrusive::member_hook<Node,
                                              StackHook,
                                              &Node::stackHook>
                > NodeStack;

        int numSupply() const { return _numSupply; }
        int numDemand() const { return _numDemand; }
        int numNodes() const { return _numSupply+_numDemand; }
        int size() const { return _numCells; }
        int capacity() const { return numNodes()-1; }
        bool isComplete() const { return _numCells == capacity(); }

        int rowNode(int row) const { return row; }
        int colNode(int col) const { return _numSupply+col; }
        bool isRowNode(int node) const { return node < _numSupply; }

        int cellIdx(const Cell& c) const { return c.row*_numDemand+c.col; }
        Cell cellAt(int idx) const { return Cell{idx / _numDemand, idx % _numDemand}; }

        bool isBasic(const Cell& c) const {
            return _slotOfCell[cellIdx(c)] >= 0;
        }

        void addCell(const Cell& c) {
            TRANSPORT_ASSERT(_numCells < capacity());
            TRANSPORT_ASSERT(!isBasic(c));
            int slot = _numCells++;
            _link(slot, c);
        }

        // Pivot: the entering cell takes over the edge slot of the leaving cell
        void replaceCell(const Cell& leaving, const Cell& entering) {
            TRANSPORT_ASSERT(isBasic(leaving));
            TRANSPORT_ASSERT(!isBasic(entering));
            int slot = _slotOfCell[cellIdx(leaving)];
            Edge& e1 = _edges[2*slot];
            Edge& e2 = *e1.reverse;
            {
                Node& n1 = _nodes[e2.target];
                Node& n2 = _nodes[e1.target];
                n1.outEdges.erase(n1.outEdges.iterator_to(e1));
                n2.outEdges.erase(n2.outEdges.iterator_to(e2));
            }
            _slotOfCell[cellIdx(leaving)] = -1;
            _link(slot, entering);
        }

        std::vector<Cell> cells() const {
            std::vector<Cell> result;
            for (int idx = 0; idx < _numSupply*_numDemand; ++idx) {
                if (_slotOfCell[idx] >= 0)
                    result.push_back(cellAt(idx));
            }
            return result;
        }

        /*
         * Depth first traversal from root. Calls f(parent, child, cell) for
         * every tree edge the first time child is reached, and returns the
         * number of nodes reached (root included).
         */
        template <typename Fn>
        int traverse(int root, Fn f) {
            _resetSearch();
            NodeStack stack;
            _push(stack, _nodes.at(root));
            int numReached = 1;
            while (!stack.empty()) {
                auto& n = stack.front();
                if (n.dfsOutEdge == n.outEdges.end()) {
                    stack.pop_front();
                    if (!stack.empty()) {
                        auto& nextN = stack.front();
                        TRANSPORT_ASSERT(nextN.dfsOutEdge->target == n.id);
                        nextN.dfsOutEdge++;
                    }
                    continue;
                }
                auto& nextN = _nodes.at(n.dfsOutEdge->target);
                if (nextN.inDfsStack) {
                    n.dfsOutEdge++;
                    continue;
                }
                f(n.id, nextN.id, cellAt(n.dfsOutEdge->cellIdx));
                _push(stack, nextN);
                numReached++;
            }
            return numReached;
        }

        /*
         * Cells on the tree path from node `from` to node `to`, in walking
         * order. Empty if the nodes are not connected.
         */
        std::vector<Cell> path(int from, int to) {
            _resetSearch();
            NodeStack stack;
            _push(stack, _nodes.at(from));
            while (!stack.empty() && stack.front().id != to) {
                auto& n = stack.front();
                if (n.dfsOutEdge == n.outEdges.end()) {
                    stack.pop_front();
                    if (!stack.empty())
                        stack.front().dfsOutEdge++;
                    continue;
                }
                auto& nextN = _nodes.at(n.dfsOutEdge->target);
                if (nextN.inDfsStack) {
                    n.dfsOutEdge++;
                } else {
                    _push(stack, nextN);
                }
            }

            std::vector<Cell> result;
            if (stack.empty())
                return result;
            // The stack holds the path with `to` on top; every node below it
            // points at the edge leading one step closer to `to`.
            stack.pop_front();
            for (auto& n : stack)
                result.push_back(cellAt(n.dfsOutEdge->cellIdx));
            std::reverse(result.begin(), result.end());
            return result;
        }

    private:
        void _link(int slot, const Cell& c) {
            Edge& e1 = _edges[2*slot];
            Edge& e2 = _edges[2*slot+1];
            int idx = cellIdx(c);
            e1.target = colNode(c.col);
            e1.cellIdx = idx;
            e1.reverse = &e2;
            e2.target = rowNode(c.row);
            e2.cellIdx = idx;
            e2.reverse = &e1;
            _nodes[rowNode(c.row)].outEdges.push_back(e1);
            _nodes[colNode(c.col)].outEdges.push_back(e2);
            _slotOfCell[idx] = slot;
        }

        void _resetSearch() {
            for (auto& n : _nodes)
                n.inDfsStack = false;
        }

        void _push(NodeStack& stack, Node& n) {
            stack.push_front(n);
            n.dfsOutEdge = n.outEdges.begin();
            n.inDfsStack = true;
        }

        int _numSupply;
        int _numDemand;
        int _numCells = 0;
        std::vector<Node> _nodes;
        std::vector<Edge> _edges;
        std::vector<int> _slotOfCell;
};

} // namespace transportation

#endif
