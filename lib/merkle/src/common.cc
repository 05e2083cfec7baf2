#include "merkle/common.hpp"

namespace Hashwood::Merkle {

std::string to_hex(BytesSpan data)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (Byte b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

} // namespace Hashwood::Merkle
