#ifndef _TRANSPORTATION_UNION_FIND_HPP_
#define _TRANSPORTATION_UNION_FIND_HPP_

#include <utility>
#include <boost/shared_array.hpp>

namespace transportation {

/* Disjoint sets over the row and column nodes of a basis, used to tell
 * whether a candidate cell would close a loop. */
struct UnionFind {

    struct Entry {
        int parent;
        int rank;
        int size;
    };

    int N;
    int numComponents;
    boost::shared_array<Entry> partitions;

    UnionFind(int N = 0);

    int Find(int elem);
    bool Connected(int e1, int e2) { return Find(e1) == Find(e2); }
    int ComponentSize(int elem) { return partitions[Find(elem)].size; }
    // Returns false if e1 and e2 were already in the same set
    bool Merge(int e1, int e2);
    int Size() const { return N; }
};

inline UnionFind::UnionFind(int N)
    : N(N)
    , numComponents(N)
{
    partitions = boost::shared_array<Entry>(new Entry[N]);
    for (int i = 0; i < N; ++i) {
        partitions[i].parent = i;
        partitions[i].rank = 0;
        partitions[i].size = 1;
    }
}

inline int UnionFind::Find(int elem) {
    while (partitions[elem].parent != elem) {
        // path halving
        partitions[elem].parent = partitions[partitions[elem].parent].parent;
        elem = partitions[elem].parent;
    }
    return elem;
}

inline bool UnionFind::Merge(int e1, int e2) {
    int p1 = Find(e1);
    int p2 = Find(e2);
    if (p1 == p2)
        return false;
    if (partitions[p1].rank < partitions[p2].rank)
        std::swap(p1, p2);
    partitions[p2].parent = p1;
    partitions[p1].size += partitions[p2].size;
    if (partitions[p1].rank == partitions[p2].rank)
        partitions[p1].rank++;
    numComponents--;
    return true;
}

} // namespace transportation

#endif
