#pragma once
#include "hash.hpp"
#include <vector>
#include <cstdint>

// Sibling hashes from leaf level to just below the root. Whether a sibling
// sits on the left or the right follows from the leaf index; levels where
// the node had no sibling contribute nothing.
using MerklePath = std::vector<Hash>;

struct MerkleTree {
    Hash root{};
    std::vector<MerklePath> paths;  // one per leaf
};

// An odd last node is carried up unchanged. An empty leaf set has a zero root.
MerkleTree merklize(const std::vector<Hash>& leaves);

Hash merkle_root(const std::vector<Hash>& leaves);

// Checks that `leaf` sits at `index` of a tree with exactly `leaf_count`
// leaves. The path length must match the tree shape.
bool verify_path(const Hash& leaf, uint64_t index, uint64_t leaf_count, const MerklePath& path, const Hash& root);
