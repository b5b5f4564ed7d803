/**
 * Useful type definitions and such.
 */
#ifndef MLL_TYPEDEFS_HPP
#define MLL_TYPEDEFS_HPP

#include <utility>
#include <vector>

#include "tsl/robin_map.h"

template <typename T>
using MapVector = tsl::robin_map<long, T>;

/// A (neighbor, weight) pair.
typedef std::pair<long, double> WeightedEdge;

typedef std::vector<std::vector<WeightedEdge>> NeighborList;

/// Maps every vertex to the id of its community.
typedef std::vector<long> Assignment;

/// Per-level partitions, finest level first.
typedef std::vector<Assignment> Dendrogram;

namespace map_vector {

/// Returns the value stored under `key`, or 0 if the key is not present.
template <typename T>
inline T get(const MapVector<T> &map, long key) {
    auto iterator = map.find(key);
    if (iterator == map.end())
        return 0;
    return iterator->second;
}

}  // namespace map_vector

#endif // MLL_TYPEDEFS_HPP
