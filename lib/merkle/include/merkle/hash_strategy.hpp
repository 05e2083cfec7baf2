#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "merkle/common.hpp"

struct evp_md_st;

namespace Hashwood::Merkle {

// Digest primitive used for leaves and internal nodes alike.
// Implementations must be safe to call concurrently from const methods.
class HashStrategy {
public:
    virtual ~HashStrategy() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual size_t digest_size() const noexcept = 0;

    [[nodiscard]] virtual std::expected<Digest, std::error_code> digest(BytesSpan data) const = 0;

    // Hash(left ++ right) without materializing the concatenation
    [[nodiscard]] virtual std::expected<Digest, std::error_code> digest(BytesSpan left, BytesSpan right) const = 0;
};

enum class HashKind : std::uint8_t {
    Sha256 = 0,
    Keccak256, // 原始 Keccak (以太坊), 需要 OpenSSL >= 3.2
    Sha3_256,
    Sha512_256,
    Blake2s256
};

[[nodiscard]] std::string_view algorithm_name(HashKind kind) noexcept;

// OpenSSL EVP backed strategy. The EVP_MD is fetched once, a fresh
// EVP_MD_CTX is created per digest call.
class EvpHashStrategy final : public HashStrategy {
public:
    [[nodiscard]]
    static std::expected<std::shared_ptr<const EvpHashStrategy>, std::error_code> create(std::string_view algorithm);

    ~EvpHashStrategy() override;

    EvpHashStrategy(const EvpHashStrategy&) = delete;
    EvpHashStrategy& operator=(const EvpHashStrategy&) = delete;

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }
    [[nodiscard]] size_t digest_size() const noexcept override { return size_; }

    [[nodiscard]] std::expected<Digest, std::error_code> digest(BytesSpan data) const override;
    [[nodiscard]] std::expected<Digest, std::error_code> digest(BytesSpan left, BytesSpan right) const override;

private:
    EvpHashStrategy(evp_md_st* md, std::string name, size_t size)
        : md_(md)
        , name_(std::move(name))
        , size_(size)
    {
    }

    evp_md_st* md_ = nullptr;
    std::string name_;
    size_t size_ = 0;
};

[[nodiscard]]
std::expected<std::shared_ptr<const HashStrategy>, std::error_code> make_strategy(HashKind kind);

// Process-wide SHA-256 instance
[[nodiscard]] std::shared_ptr<const HashStrategy> default_strategy();

} // namespace Hashwood::Merkle
