#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Hashwood::Merkle {
enum class Error : std::uint8_t {
    Success = 0,
    EmptyInput, // 构建时内容列表为空
    HashFailure, // 哈希能力报错 (内容或内部节点)
    ContentNotFound, // 查找不到相等的内容
    TypeMismatch, // 内容类型不可比较
    UnsupportedAlgorithm // OpenSSL provider 不提供该摘要算法
};

class MerkleErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "HashwoodMerkle"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::EmptyInput:
            return "Cannot build a Merkle tree from an empty content list";
        case Error::HashFailure:
            return "Hash computation failed";
        case Error::ContentNotFound:
            return "Content is not present in the tree";
        case Error::TypeMismatch:
            return "Content value is not comparable to the tree's content type";
        case Error::UnsupportedAlgorithm:
            return "Digest algorithm is not available from the crypto provider";
        default:
            return "Unknown Merkle error";
        }
    }
};

inline const std::error_category& merkle_category()
{
    static MerkleErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), merkle_category() };
}
} // namespace Hashwood::Merkle

namespace std {
template <>
struct is_error_code_enum<Hashwood::Merkle::Error> : true_type { };
} // namespace std
