#pragma once
#include "merkle/common.hpp"
#include "merkle/content.hpp"
#include "merkle/error.hpp"
#include "merkle/hash_strategy.hpp"
#include "merkle/node_store.hpp"
#include "merkle/tree.hpp"
#include <gtest/gtest.h>
#include <expected>
#include <initializer_list>
#include <memory>
#include <openssl/sha.h>
#include <string>
#include <string_view>
#include <vector>

namespace Hashwood::Merkle {

// 辅助：String -> vector<Byte>
inline std::vector<Byte> to_bytes(std::string_view s)
{
    return std::vector<Byte>(s.begin(), s.end());
}

inline std::vector<BytesContent> to_contents(std::initializer_list<std::string_view> items)
{
    std::vector<BytesContent> out;
    for (auto s : items)
        out.emplace_back(s);
    return out;
}

// 独立于 EvpHashStrategy 的 SHA-256 参考实现
inline Digest reference_sha256(BytesSpan data)
{
    Digest out(SHA256_DIGEST_LENGTH);
    SHA256(data.data(), data.size(), out.data());
    return out;
}

inline Digest reference_sha256(const Digest& left, const Digest& right)
{
    Digest buf(left);
    buf.insert(buf.end(), right.begin(), right.end());
    return reference_sha256(buf);
}

// Strategy that starts failing after `budget` successful calls
class FailingStrategy final : public HashStrategy {
public:
    explicit FailingStrategy(size_t budget)
        : budget_(budget)
    {
    }

    std::string_view name() const noexcept override { return "failing"; }
    size_t digest_size() const noexcept override { return inner_->digest_size(); }

    std::expected<Digest, std::error_code> digest(BytesSpan data) const override
    {
        if (calls_++ >= budget_)
            return std::unexpected(make_error_code(Error::HashFailure));
        return inner_->digest(data);
    }

    std::expected<Digest, std::error_code> digest(BytesSpan left, BytesSpan right) const override
    {
        if (calls_++ >= budget_)
            return std::unexpected(make_error_code(Error::HashFailure));
        return inner_->digest(left, right);
    }

    void reset(size_t budget) const
    {
        budget_ = budget;
        calls_ = 0;
    }

private:
    std::shared_ptr<const HashStrategy> inner_ = default_strategy();
    mutable size_t budget_;
    mutable size_t calls_ = 0;
};

// Content whose equality only looks at the key, digest covers the payload
struct KeyedContent {
    int key = 0;
    std::string payload;

    std::expected<Digest, std::error_code> digest(const HashStrategy& strategy) const
    {
        return strategy.digest(as_span(payload));
    }

    std::expected<bool, std::error_code> equals(const KeyedContent& other) const
    {
        if (other.key < 0)
            return std::unexpected(make_error_code(Error::TypeMismatch));
        return key == other.key;
    }
};

// 测试专用: 直接篡改存储的摘要
struct NodeStoreTestAccess {
    static std::vector<Level>& levels(NodeStore& store) { return store.levels_; }
};

struct TreeTestAccess {
    template <typename C>
    static NodeStore& store(Tree<C>& tree) { return tree.store_; }
};

} // namespace Hashwood::Merkle
