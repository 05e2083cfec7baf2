#include "merkle/hash_strategy.hpp"
#include "merkle/error.hpp"
#include "merkle/log.hpp"
#include <initializer_list>
#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>
#include <string>

namespace Hashwood::Merkle {

namespace {
    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const
        {
            if (ctx)
                EVP_MD_CTX_free(ctx);
        }
    };

    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

    // Init, feed every part, finalize. Any EVP failure is a HashFailure.
    std::expected<Digest, std::error_code> run_digest(const EVP_MD* md, size_t size,
        std::initializer_list<BytesSpan> parts)
    {
        EvpMdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx) {
            return std::unexpected(make_error_code(Error::HashFailure));
        }

        if (1 != EVP_DigestInit_ex(ctx.get(), md, nullptr)) {
            ERR_clear_error();
            return std::unexpected(make_error_code(Error::HashFailure));
        }

        for (auto part : parts) {
            if (1 != EVP_DigestUpdate(ctx.get(), part.data(), part.size())) {
                ERR_clear_error();
                return std::unexpected(make_error_code(Error::HashFailure));
            }
        }

        Digest out(size);
        unsigned int len = 0;
        if (1 != EVP_DigestFinal_ex(ctx.get(), out.data(), &len)) {
            ERR_clear_error();
            return std::unexpected(make_error_code(Error::HashFailure));
        }
        out.resize(len);
        return out;
    }
} // namespace

std::string_view algorithm_name(HashKind kind) noexcept
{
    switch (kind) {
    case HashKind::Sha256:
        return "SHA2-256";
    case HashKind::Keccak256:
        return "KECCAK-256";
    case HashKind::Sha3_256:
        return "SHA3-256";
    case HashKind::Sha512_256:
        return "SHA2-512/256";
    case HashKind::Blake2s256:
        return "BLAKE2S-256";
    }
    return "";
}

auto EvpHashStrategy::create(std::string_view algorithm)
    -> std::expected<std::shared_ptr<const EvpHashStrategy>, std::error_code>
{
    std::string name(algorithm);
    EVP_MD* md = EVP_MD_fetch(nullptr, name.c_str(), nullptr);
    if (md == nullptr) {
        ERR_clear_error();
        detail::log(LogLevel::Warn, "digest algorithm " + name + " is not offered by the OpenSSL provider");
        return std::unexpected(make_error_code(Error::UnsupportedAlgorithm));
    }

    int size = EVP_MD_get_size(md);
    if (size <= 0) {
        EVP_MD_free(md);
        return std::unexpected(make_error_code(Error::UnsupportedAlgorithm));
    }

    // 构造函数私有, 不能用 make_shared
    return std::shared_ptr<const EvpHashStrategy>(
        new EvpHashStrategy(md, std::move(name), static_cast<size_t>(size)));
}

EvpHashStrategy::~EvpHashStrategy()
{
    if (md_ != nullptr)
        EVP_MD_free(md_);
}

std::expected<Digest, std::error_code> EvpHashStrategy::digest(BytesSpan data) const
{
    return run_digest(md_, size_, { data });
}

std::expected<Digest, std::error_code> EvpHashStrategy::digest(BytesSpan left, BytesSpan right) const
{
    return run_digest(md_, size_, { left, right });
}

std::expected<std::shared_ptr<const HashStrategy>, std::error_code> make_strategy(HashKind kind)
{
    auto res = EvpHashStrategy::create(algorithm_name(kind));
    if (!res) {
        return std::unexpected(res.error());
    }
    return std::shared_ptr<const HashStrategy>(std::move(*res));
}

std::shared_ptr<const HashStrategy> default_strategy()
{
    static const std::shared_ptr<const HashStrategy> instance = [] {
        auto res = make_strategy(HashKind::Sha256);
        if (!res) {
            throw std::runtime_error("SHA-256 is not available from the OpenSSL provider");
        }
        return *res;
    }();
    return instance;
}

} // namespace Hashwood::Merkle
