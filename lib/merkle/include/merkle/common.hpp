#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Hashwood::Merkle {
using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;

// Digest length depends on the hash strategy (32 bytes for SHA-256 / Keccak-256)
using Digest = std::vector<Byte>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

std::string to_hex(BytesSpan data);

} // namespace Hashwood::Merkle
