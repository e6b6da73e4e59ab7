#pragma once

#include "pfs/core/constants.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace pfs::protocol::configuration {

/**
 * @brief Out-of-order tolerance of a ratchet session.
 *
 * Two bounds apply:
 * - max_skip: the largest forward gap a single incoming message may open within one chain.
 *   A message further ahead is rejected with SkipWindowExceeded and nothing is derived.
 * - max_skipped_keys: how many retained skipped keys a session keeps. When the cap is hit the
 *   oldest retained keys are evicted first, and messages for them become undecryptable.
 *
 * Retained keys additionally expire after skipped_key_ttl (enforced by KeyMaterialStore).
 *
 * ```cpp
 * auto config = RatchetConfig::Default();         // 1000 / 1000 / 7 days
 * auto tight = RatchetConfig(10, 10);             // used by the out-of-order tests
 * ```
 */
class RatchetConfig {
public:
    RatchetConfig(uint32_t max_skip, size_t max_skipped_keys,
                  std::chrono::seconds skipped_key_ttl = kSkippedKeyTtl) noexcept
        : max_skip_(max_skip)
        , max_skipped_keys_(max_skipped_keys)
        , skipped_key_ttl_(skipped_key_ttl) {}

    [[nodiscard]] static RatchetConfig Default() noexcept {
        return RatchetConfig(kDefaultMaxSkip, kDefaultMaxSkippedKeys);
    }

    /// Forward gap of `gap` keys is acceptable.
    [[nodiscard]] bool AllowsGap(uint64_t gap) const noexcept {
        return gap <= max_skip_;
    }

    [[nodiscard]] uint32_t MaxSkip() const noexcept { return max_skip_; }
    [[nodiscard]] size_t MaxSkippedKeys() const noexcept { return max_skipped_keys_; }
    [[nodiscard]] std::chrono::seconds SkippedKeyTtl() const noexcept { return skipped_key_ttl_; }

    [[nodiscard]] bool operator==(const RatchetConfig& other) const noexcept = default;

private:
    uint32_t max_skip_;
    size_t max_skipped_keys_;
    std::chrono::seconds skipped_key_ttl_;
};

}
