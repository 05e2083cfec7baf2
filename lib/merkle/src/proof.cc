#include "merkle/proof.hpp"
#include "merkle/log.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace Hashwood::Merkle {

std::expected<Digest, std::error_code> compute_root(const HashStrategy& strategy,
    BytesSpan leaf_digest, const std::vector<ProofStep>& steps)
{
    Digest acc(leaf_digest.begin(), leaf_digest.end());

    for (const auto& step : steps) {
        auto next = step.side == Side::Left
            ? strategy.digest(step.sibling, acc)
            : strategy.digest(acc, step.sibling);
        if (!next) {
            return std::unexpected(next.error());
        }
        acc = std::move(*next);
    }

    return acc;
}

std::expected<bool, std::error_code> verify_proof(const HashStrategy& strategy,
    BytesSpan leaf_digest, const Proof& proof, BytesSpan root)
{
    auto computed = compute_root(strategy, leaf_digest, proof.steps);
    if (!computed) {
        return std::unexpected(computed.error());
    }

    bool ok = std::ranges::equal(*computed, root);
    if (!ok) {
        detail::log(LogLevel::Debug, "proof for leaf " + std::to_string(proof.leaf_index) + " does not reach the claimed root");
    }
    return ok;
}

} // namespace Hashwood::Merkle
