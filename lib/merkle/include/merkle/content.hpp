#pragma once

#include <concepts>
#include <expected>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "merkle/common.hpp"
#include "merkle/hash_strategy.hpp"

namespace Hashwood::Merkle {

// Capability a value needs to be stored in a Tree: digest its own bytes with
// the tree's strategy, and compare against another value of the same type.
// Two values are the same entry iff equals() says so, regardless of digests.
template <typename C>
concept Content = std::movable<C> && requires(const C& c, const C& other, const HashStrategy& strategy) {
    { c.digest(strategy) } -> std::convertible_to<std::expected<Digest, std::error_code>>;
    { c.equals(other) } -> std::convertible_to<std::expected<bool, std::error_code>>;
};

// Opaque byte string content
class BytesContent {
public:
    BytesContent() = default;

    explicit BytesContent(std::string_view s)
        : bytes_(s.begin(), s.end())
    {
    }

    explicit BytesContent(std::vector<Byte> bytes)
        : bytes_(std::move(bytes))
    {
    }

    [[nodiscard]] std::expected<Digest, std::error_code> digest(const HashStrategy& strategy) const
    {
        return strategy.digest(bytes_);
    }

    [[nodiscard]] std::expected<bool, std::error_code> equals(const BytesContent& other) const
    {
        return bytes_ == other.bytes_;
    }

    [[nodiscard]] const std::vector<Byte>& bytes() const noexcept { return bytes_; }
    [[nodiscard]] std::vector<Byte>& bytes() noexcept { return bytes_; }

private:
    std::vector<Byte> bytes_;
};

static_assert(Content<BytesContent>);

} // namespace Hashwood::Merkle
