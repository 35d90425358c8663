#include <boost/test/unit_test.hpp>

#include "basis-tree.hpp"
#include "union-find.hpp"
#include "test-util.hpp"

using namespace transportation;

BOOST_AUTO_TEST_SUITE(BasisTreeTests)

    BOOST_AUTO_TEST_CASE(AddAndReplace) {
        BasisTree tree{2, 3};
        BOOST_CHECK_EQUAL(tree.capacity(), 4);
        tree.addCell(Cell{0, 0});
        tree.addCell(Cell{0, 1});
        tree.addCell(Cell{1, 1});
        BOOST_CHECK(!tree.isComplete());
        tree.addCell(Cell{1, 2});
        BOOST_CHECK(tree.isComplete());
        BOOST_CHECK(tree.isBasic(Cell{0, 1}));
        BOOST_CHECK(!tree.isBasic(Cell{0, 2}));

        tree.replaceCell(Cell{0, 1}, Cell{0, 2});
        BOOST_CHECK_EQUAL(tree.size(), 4);
        BOOST_CHECK(!tree.isBasic(Cell{0, 1}));
        BOOST_CHECK(tree.isBasic(Cell{0, 2}));
        checkCells(tree.cells(), {{0, 0}, {0, 2}, {1, 1}, {1, 2}});

        // Still spanning after the pivot
        int reached = tree.traverse(tree.rowNode(0), [](int, int, const Cell&) { });
        BOOST_CHECK_EQUAL(reached, 5);
    }

    BOOST_AUTO_TEST_CASE(Misuse) {
        BasisTree tree{2, 2};
        tree.addCell(Cell{0, 0});
        BOOST_CHECK_THROW(tree.addCell(Cell{0, 0}), InvariantError);
        BOOST_CHECK_THROW(tree.replaceCell(Cell{1, 1}, Cell{0, 1}), InvariantError);
        tree.addCell(Cell{0, 1});
        tree.addCell(Cell{1, 1});
        BOOST_CHECK_THROW(tree.addCell(Cell{1, 0}), InvariantError);
    }

    BOOST_AUTO_TEST_CASE(Path) {
        // Staircase (0,0) (1,0) (1,1) (2,1) (2,2)
        BasisTree tree{3, 3};
        for (auto c : std::vector<Cell>{{0, 0}, {1, 0}, {1, 1}, {2, 1}, {2, 2}})
            tree.addCell(c);

        auto path = tree.path(tree.colNode(2), tree.rowNode(0));
        std::vector<Cell> expected = {{2, 2}, {2, 1}, {1, 1}, {1, 0}, {0, 0}};
        BOOST_CHECK_EQUAL_COLLECTIONS(path.begin(), path.end(),
                expected.begin(), expected.end());

        auto back = tree.path(tree.rowNode(0), tree.colNode(2));
        std::reverse(expected.begin(), expected.end());
        BOOST_CHECK_EQUAL_COLLECTIONS(back.begin(), back.end(),
                expected.begin(), expected.end());

        BOOST_CHECK(tree.path(tree.rowNode(1), tree.rowNode(1)).empty());
    }

    BOOST_AUTO_TEST_CASE(DisconnectedPath) {
        BasisTree tree{2, 2};
        tree.addCell(Cell{0, 0});
        tree.addCell(Cell{1, 1});
        BOOST_CHECK(tree.path(tree.colNode(1), tree.rowNode(0)).empty());
        int reached = tree.traverse(tree.rowNode(0), [](int, int, const Cell&) { });
        BOOST_CHECK_EQUAL(reached, 2);
    }

    BOOST_AUTO_TEST_CASE(TraverseVisitsEachEdgeOnce) {
        BasisTree tree{2, 3};
        for (auto c : std::vector<Cell>{{0, 0}, {0, 1}, {1, 1}, {1, 2}})
            tree.addCell(c);
        std::vector<Cell> seen;
        std::vector<int> children;
        int reached = tree.traverse(tree.rowNode(0),
            [&](int parent, int child, const Cell& c) {
                seen.push_back(c);
                children.push_back(child);
                // Every edge joins a row node and a column node
                BOOST_CHECK(tree.isRowNode(parent) != tree.isRowNode(child));
            });
        BOOST_CHECK_EQUAL(reached, 5);
        checkCells(seen, {{0, 0}, {0, 1}, {1, 1}, {1, 2}});
        std::sort(children.begin(), children.end());
        std::vector<int> expected = {1, 2, 3, 4};
        BOOST_CHECK_EQUAL_COLLECTIONS(children.begin(), children.end(),
                expected.begin(), expected.end());
    }

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(UnionFindTests)

    BOOST_AUTO_TEST_CASE(Merge) {
        UnionFind uf{5};
        BOOST_CHECK_EQUAL(uf.numComponents, 5);
        BOOST_CHECK(uf.Merge(0, 3));
        BOOST_CHECK(uf.Merge(3, 4));
        BOOST_CHECK(!uf.Merge(0, 4));
        BOOST_CHECK(uf.Connected(0, 4));
        BOOST_CHECK(!uf.Connected(0, 1));
        BOOST_CHECK_EQUAL(uf.ComponentSize(4), 3);
        BOOST_CHECK_EQUAL(uf.numComponents, 3);
        BOOST_CHECK(uf.Merge(1, 2));
        BOOST_CHECK(uf.Merge(2, 0));
        BOOST_CHECK_EQUAL(uf.numComponents, 1);
        BOOST_CHECK_EQUAL(uf.ComponentSize(1), 5);
    }

BOOST_AUTO_TEST_SUITE_END()
