#include "merkle/node_store.hpp"
#include "merkle/error.hpp"
#include "merkle/log.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace Hashwood::Merkle {

namespace {
    // Append a flagged clone of the last node so the level pairs exactly
    void pad_odd_level(Level& level)
    {
        if (level.size() % 2 == 0) {
            return;
        }
        Node clone = level.back();
        clone.is_duplicate = true;
        clone.content = npos;
        level.push_back(std::move(clone));
    }
} // namespace

auto NodeStore::build(std::vector<Digest> leaf_digests, const HashStrategy& strategy)
    -> std::expected<NodeStore, std::error_code>
{
    if (leaf_digests.empty()) {
        return std::unexpected(make_error_code(Error::EmptyInput));
    }

    NodeStore store;
    store.leaf_count_ = leaf_digests.size();

    Level leaves;
    leaves.reserve(leaf_digests.size() + 1);
    for (size_t i = 0; i < leaf_digests.size(); ++i) {
        Node leaf;
        leaf.digest = std::move(leaf_digests[i]);
        leaf.content = i;
        leaves.push_back(std::move(leaf));
    }
    store.levels_.push_back(std::move(leaves));

    // 单叶子: 根就是该叶子, 不做任何哈希
    while (store.levels_.back().size() > 1) {
        Level& current = store.levels_.back();
        pad_odd_level(current);

        Level next;
        next.reserve(current.size() / 2);
        for (size_t i = 0; i < current.size(); i += 2) {
            auto h = strategy.digest(current[i].digest, current[i + 1].digest);
            if (!h) {
                detail::log(LogLevel::Warn, "hashing failed while building level " + std::to_string(store.levels_.size()) + ": " + h.error().message());
                return std::unexpected(make_error_code(Error::HashFailure));
            }

            Node parent;
            parent.digest = std::move(*h);
            parent.left = i;
            parent.right = i + 1;
            parent.is_duplicate = current[i].is_duplicate && current[i + 1].is_duplicate;

            current[i].parent = next.size();
            current[i + 1].parent = next.size();
            next.push_back(std::move(parent));
        }
        store.levels_.push_back(std::move(next));
    }

    detail::log(LogLevel::Debug, "built tree with " + std::to_string(store.leaf_count_) + " leaves, height " + std::to_string(store.levels_.size()));
    return store;
}

std::expected<bool, std::error_code> NodeStore::verify(const HashStrategy& strategy) const
{
    if (levels_.empty()) {
        return false;
    }

    std::vector<Digest> current;
    current.reserve(leaf_count_ + 1);
    for (size_t i = 0; i < leaf_count_; ++i) {
        current.push_back(levels_[0][i].digest);
    }

    for (size_t l = 0; l < levels_.size(); ++l) {
        const Level& stored = levels_[l];

        if (l + 1 < levels_.size() && current.size() % 2 == 1) {
            current.push_back(current.back());
        }

        if (current.size() != stored.size()) {
            detail::log(LogLevel::Warn, "level " + std::to_string(l) + " has an unexpected node count");
            return false;
        }
        for (size_t i = 0; i < stored.size(); ++i) {
            if (current[i] != stored[i].digest) {
                detail::log(LogLevel::Warn, "digest mismatch at level " + std::to_string(l) + ", node " + std::to_string(i));
                return false;
            }
        }

        if (l + 1 == levels_.size()) {
            break;
        }

        std::vector<Digest> next;
        next.reserve(current.size() / 2);
        for (size_t i = 0; i < current.size(); i += 2) {
            auto h = strategy.digest(current[i], current[i + 1]);
            if (!h) {
                return std::unexpected(make_error_code(Error::HashFailure));
            }
            next.push_back(std::move(*h));
        }
        current = std::move(next);
    }

    return true;
}

std::expected<Digest, std::error_code> NodeStore::fold_to_root(size_t leaf_index, BytesSpan leaf_digest,
    const HashStrategy& strategy) const
{
    auto proof = path(leaf_index);
    if (!proof) {
        return std::unexpected(proof.error());
    }

    auto root = compute_root(strategy, leaf_digest, proof->steps);
    if (!root) {
        return std::unexpected(make_error_code(Error::HashFailure));
    }
    return root;
}

std::expected<Proof, std::error_code> NodeStore::path(size_t leaf_index) const
{
    if (leaf_index >= leaf_count_) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    std::vector<ProofStep> steps;
    steps.reserve(levels_.size());

    size_t idx = leaf_index;
    for (size_t l = 0; l + 1 < levels_.size(); ++l) {
        const Level& level = levels_[l];
        // idx^1 是兄弟节点 (偶数+1, 奇数-1)
        const Node& sibling = level[idx ^ 1];
        steps.push_back(ProofStep {
            .sibling = sibling.digest,
            .side = (idx & 1) ? Side::Left : Side::Right });
        idx = level[idx].parent;
    }

    return Proof {
        .leaf_index = leaf_index,
        .leaf_count = leaf_count_,
        .steps = std::move(steps)
    };
}

std::string NodeStore::to_string(const DisplayOptions& options) const
{
    std::ostringstream out;

    auto hex = [&](const Digest& d) {
        std::string s = Merkle::to_hex(d);
        if (options.digest_prefix != 0 && options.digest_prefix < s.size()) {
            s.resize(options.digest_prefix);
        }
        return s;
    };

    for (size_t l = 0; l < levels_.size(); ++l) {
        const Level& level = levels_[l];
        out << "level " << l;
        if (l == 0)
            out << " (leaves)";
        if (l + 1 == levels_.size())
            out << " (root)";
        out << ":\n";

        for (size_t i = 0; i < level.size(); ++i) {
            const Node& node = level[i];
            if (node.is_duplicate && options.elide_duplicates) {
                continue;
            }
            out << "  [" << i << "] " << hex(node.digest);
            if (node.is_duplicate)
                out << " (dup)";
            out << '\n';
        }
    }
    return out.str();
}

} // namespace Hashwood::Merkle
