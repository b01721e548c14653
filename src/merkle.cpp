#include "merkle.hpp"
#include <utility>

namespace {

// One level up; an odd last node moves up unchanged
std::vector<Hash> next_level(const std::vector<Hash>& level) {
    std::vector<Hash> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i + 1 < level.size(); i += 2) next.push_back(hash_pair(level[i], level[i + 1]));
    if (level.size() % 2 == 1) next.push_back(level.back());
    return next;
}

}  // namespace

MerkleTree merklize(const std::vector<Hash>& leaves) {
    MerkleTree tree;
    tree.paths.resize(leaves.size());
    if (leaves.empty()) return tree;

    // positions[i] = index of leaf i's ancestor on the current level
    std::vector<uint64_t> positions(leaves.size());
    for (size_t i = 0; i < leaves.size(); ++i) positions[i] = i;

    std::vector<Hash> level = leaves;
    while (level.size() > 1) {
        for (size_t i = 0; i < leaves.size(); ++i) {
            uint64_t pos = positions[i];
            uint64_t sibling = (pos % 2 == 0) ? pos + 1 : pos - 1;
            if (sibling < level.size()) tree.paths[i].push_back(level[sibling]);
            positions[i] = pos / 2;
        }
        level = next_level(level);
    }

    tree.root = level[0];
    return tree;
}

Hash merkle_root(const std::vector<Hash>& leaves) {
    if (leaves.empty()) return Hash{};

    std::vector<Hash> level = leaves;
    while (level.size() > 1) level = next_level(level);
    return level[0];
}

bool verify_path(const Hash& leaf, uint64_t index, uint64_t leaf_count, const MerklePath& path, const Hash& root) {
    if (index >= leaf_count) return false;

    Hash current = leaf;
    size_t used = 0;
    uint64_t pos = index;
    uint64_t width = leaf_count;
    while (width > 1) {
        if (pos % 2 == 1) {
            if (used == path.size()) return false;
            current = hash_pair(path[used++], current);
        } else if (pos + 1 < width) {
            if (used == path.size()) return false;
            current = hash_pair(current, path[used++]);
        }
        pos /= 2;
        width = (width + 1) / 2;
    }
    return used == path.size() && current == root;
}
