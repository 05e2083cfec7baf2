#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <system_error>
#include <vector>

#include "merkle/common.hpp"
#include "merkle/hash_strategy.hpp"

namespace Hashwood::Merkle {

// Which operand of the next hash step the sibling is.
// Left:  next = Hash(sibling ++ current)
// Right: next = Hash(current ++ sibling)
enum class Side : std::uint8_t {
    Left = 0,
    Right = 1
};

struct ProofStep {
    Digest sibling;
    Side side;

    bool operator==(const ProofStep&) const = default;
};

// Audit path from a leaf up to (excluding) the root
struct Proof {
    size_t leaf_index = 0; // 叶子位置, 仅作信息用途
    size_t leaf_count = 0; // 构建时真实叶子数量
    std::vector<ProofStep> steps;

    bool operator==(const Proof&) const = default;
};

// Fold the steps over leaf_digest. An empty path yields leaf_digest itself
// (single-leaf tree).
[[nodiscard]]
std::expected<Digest, std::error_code> compute_root(const HashStrategy& strategy,
    BytesSpan leaf_digest, const std::vector<ProofStep>& steps);

// Independent verifier: needs only the claimed root, never the tree.
// Mismatch is false, only a strategy failure is an error.
[[nodiscard]]
std::expected<bool, std::error_code> verify_proof(const HashStrategy& strategy,
    BytesSpan leaf_digest, const Proof& proof, BytesSpan root);

} // namespace Hashwood::Merkle
