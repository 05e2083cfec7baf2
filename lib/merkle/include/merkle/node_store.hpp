#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <system_error>
#include <vector>

#include "merkle/common.hpp"
#include "merkle/hash_strategy.hpp"
#include "merkle/proof.hpp"

namespace Hashwood::Merkle {

inline constexpr size_t npos = static_cast<size_t>(-1);

// Relationships are indices into the neighbouring levels, never pointers:
// left/right point one level down, parent one level up.
struct Node {
    Digest digest;
    size_t left = npos;
    size_t right = npos;
    size_t parent = npos;
    size_t content = npos; // 叶子: 对应内容下标; 填充节点和内部节点为 npos
    bool is_duplicate = false;

    [[nodiscard]] bool is_leaf() const noexcept { return left == npos && right == npos; }
};

using Level = std::vector<Node>;

struct DisplayOptions {
    bool elide_duplicates = false;
    size_t digest_prefix = 0; // hex chars to print, 0 = whole digest
};

// Level-indexed storage of a binary hash tree. levels()[0] are the leaves,
// levels().back() holds the single root. Every level except the root level
// has an even node count; an odd level gets one duplicate of its last node.
class NodeStore {
public:
    NodeStore() = default;

    // 叶子摘要由调用方计算 (Tree<C> 负责内容哈希)
    [[nodiscard]]
    static std::expected<NodeStore, std::error_code> build(std::vector<Digest> leaf_digests,
        const HashStrategy& strategy);

    [[nodiscard]] const Digest& root() const { return levels_.back().front().digest; }
    [[nodiscard]] const Node& root_node() const { return levels_.back().front(); }
    [[nodiscard]] const std::vector<Level>& levels() const noexcept { return levels_; }
    [[nodiscard]] const Level& leaves() const { return levels_.front(); }

    // Real leaves only, the padding duplicate is not counted
    [[nodiscard]] size_t leaf_count() const noexcept { return leaf_count_; }
    [[nodiscard]] size_t height() const noexcept { return levels_.size(); }
    [[nodiscard]] bool empty() const noexcept { return levels_.empty(); }

    // Recompute every level from the stored leaf digests and compare each
    // node (duplicates included) with what is stored.
    [[nodiscard]]
    std::expected<bool, std::error_code> verify(const HashStrategy& strategy) const;

    // Walk parent links from leaf_index, replacing the stored leaf digest
    // with leaf_digest, and return the resulting root.
    [[nodiscard]]
    std::expected<Digest, std::error_code> fold_to_root(size_t leaf_index, BytesSpan leaf_digest,
        const HashStrategy& strategy) const;

    [[nodiscard]]
    std::expected<Proof, std::error_code> path(size_t leaf_index) const;

    [[nodiscard]] std::string to_string(const DisplayOptions& options = {}) const;

private:
    friend struct NodeStoreTestAccess;

    std::vector<Level> levels_;
    size_t leaf_count_ = 0;
};

} // namespace Hashwood::Merkle
