#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "merkle/common.hpp"
#include "merkle/content.hpp"
#include "merkle/error.hpp"
#include "merkle/hash_strategy.hpp"
#include "merkle/log.hpp"
#include "merkle/node_store.hpp"
#include "merkle/proof.hpp"

namespace Hashwood::Merkle {

// Binary hash tree over an ordered list of contents.
//
// Leaf order is input order. Every odd level is padded with one duplicate of
// its last node before pairing, internal digests are Hash(left ++ right) in
// that fixed order. A one-item tree's root is the item's own digest.
//
// Threading: const members may run concurrently. rebuild(), rebuild_with()
// and mutable_content() need exclusive access; callers sharing a tree must
// serialize them against readers (e.g. std::shared_mutex). Nothing here locks.
template <Content C>
class Tree {
public:
    [[nodiscard]]
    static std::expected<Tree, std::error_code> build(std::vector<C> contents,
        std::shared_ptr<const HashStrategy> strategy = default_strategy())
    {
        if (!strategy) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }

        auto store = build_store(contents, *strategy);
        if (!store) {
            return std::unexpected(store.error());
        }
        return Tree(std::move(contents), std::move(strategy), std::move(*store));
    }

    [[nodiscard]]
    static std::expected<Tree, std::error_code> build(std::vector<C> contents, HashKind kind)
    {
        auto strategy = make_strategy(kind);
        if (!strategy) {
            return std::unexpected(strategy.error());
        }
        return build(std::move(contents), std::move(*strategy));
    }

    // Stored root, never recomputed
    [[nodiscard]] const Digest& root() const { return store_.root(); }

    // Internal consistency only: leaves are not re-hashed from content.
    // false = tampering detected, error = could not hash.
    [[nodiscard]] std::expected<bool, std::error_code> verify_tree() const
    {
        return store_.verify(*strategy_);
    }

    // Re-hash the matching leaf from its stored content and fold it up to
    // the root. Not found and mismatch are false, not errors.
    [[nodiscard]] std::expected<bool, std::error_code> verify_content(const C& content) const
    {
        auto found = find(content);
        if (!found) {
            return std::unexpected(found.error());
        }
        if (!found->has_value()) {
            detail::log(LogLevel::Debug, "verify_content: content not found");
            return false;
        }

        size_t index = **found;
        auto fresh = contents_[index].digest(*strategy_);
        if (!fresh) {
            return std::unexpected(make_error_code(Error::HashFailure));
        }
        if (*fresh != store_.leaves()[index].digest) {
            detail::log(LogLevel::Debug, "verify_content: leaf " + std::to_string(index) + " no longer matches its content");
            return false;
        }

        auto recomputed = store_.fold_to_root(index, *fresh, *strategy_);
        if (!recomputed) {
            return std::unexpected(recomputed.error());
        }
        return *recomputed == store_.root();
    }

    // Audit path for the first leaf equal to content
    [[nodiscard]] std::expected<Proof, std::error_code> merkle_path(const C& content) const
    {
        auto found = find(content);
        if (!found) {
            return std::unexpected(found.error());
        }
        if (!found->has_value()) {
            return std::unexpected(make_error_code(Error::ContentNotFound));
        }
        return store_.path(**found);
    }

    // Linear scan, first equal entry wins. Later equal entries are never
    // reachable through lookup.
    [[nodiscard]] std::expected<std::optional<size_t>, std::error_code> find(const C& content) const
    {
        for (size_t i = 0; i < contents_.size(); ++i) {
            auto eq = contents_[i].equals(content);
            if (!eq) {
                return std::unexpected(eq.error());
            }
            if (*eq) {
                return std::optional<size_t>(i);
            }
        }
        return std::optional<size_t>();
    }

    // Re-hash the current contents. Atomic: on failure the tree is unchanged.
    std::expected<void, std::error_code> rebuild()
    {
        auto store = build_store(contents_, *strategy_);
        if (!store) {
            detail::log(LogLevel::Warn, "rebuild failed, keeping previous tree: " + store.error().message());
            return std::unexpected(store.error());
        }
        store_ = std::move(*store);
        return {};
    }

    // Replace the dataset. Atomic like rebuild().
    std::expected<void, std::error_code> rebuild_with(std::vector<C> contents)
    {
        auto store = build_store(contents, *strategy_);
        if (!store) {
            detail::log(LogLevel::Warn, "rebuild_with failed, keeping previous tree: " + store.error().message());
            return std::unexpected(store.error());
        }
        contents_ = std::move(contents);
        store_ = std::move(*store);
        return {};
    }

    [[nodiscard]] std::string to_string(const DisplayOptions& options = {}) const
    {
        return store_.to_string(options);
    }

    [[nodiscard]] const std::vector<C>& contents() const noexcept { return contents_; }

    // In-place edit; digests are stale until rebuild()
    C& mutable_content(size_t index) { return contents_.at(index); }

    [[nodiscard]] const HashStrategy& strategy() const noexcept { return *strategy_; }
    [[nodiscard]] size_t leaf_count() const noexcept { return store_.leaf_count(); }
    [[nodiscard]] const NodeStore& nodes() const noexcept { return store_; }

private:
    Tree(std::vector<C> contents, std::shared_ptr<const HashStrategy> strategy, NodeStore store)
        : contents_(std::move(contents))
        , strategy_(std::move(strategy))
        , store_(std::move(store))
    {
    }

    static std::expected<NodeStore, std::error_code> build_store(const std::vector<C>& contents,
        const HashStrategy& strategy)
    {
        if (contents.empty()) {
            return std::unexpected(make_error_code(Error::EmptyInput));
        }

        std::vector<Digest> digests;
        digests.reserve(contents.size());
        for (const auto& c : contents) {
            auto d = c.digest(strategy);
            if (!d) {
                // 部分叶子直接丢弃
                detail::log(LogLevel::Warn, "content digest failed: " + d.error().message());
                return std::unexpected(make_error_code(Error::HashFailure));
            }
            digests.push_back(std::move(*d));
        }

        return NodeStore::build(std::move(digests), strategy);
    }

    friend struct TreeTestAccess;

    std::vector<C> contents_;
    std::shared_ptr<const HashStrategy> strategy_;
    NodeStore store_;
};

} // namespace Hashwood::Merkle
