#pragma once

#include "pfs/configuration/ratchet_config.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/core/result.hpp"
#include "pfs/interfaces/i_clock.hpp"
#include "pfs/models/ratchet_state.hpp"
#include "wire/envelope.pb.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pfs::protocol {

/// Own Kyber-768 key pair plus the peer's public key; switches a session to the hybrid suite.
struct HybridKeys {
    std::vector<uint8_t> kyber_secret_key;
    std::vector<uint8_t> kyber_public_key;
    std::vector<uint8_t> peer_kyber_public_key;
};

/// Retained-key delta produced by one Decrypt. `added` keys must be persisted, `removed` ids
/// deleted (consumed or evicted).
struct SkippedKeyChanges {
    std::vector<models::SkippedMessageKey> added;
    std::vector<std::string> removed;
};

struct DecryptOutcome {
    std::vector<uint8_t> plaintext;
    SkippedKeyChanges changes;
};

/**
 * @brief Double Ratchet transition function over a RatchetState value.
 *
 * The session owns its state and never touches storage. Encrypt and Decrypt work on a copy
 * and only replace the held state when the whole transition succeeded, so a failed decrypt
 * (bad tag, window exceeded) leaves the session exactly as it was.
 *
 * Bootstrapping from a 32-byte shared secret S:
 * @code
 *   HKDF(S, salt = conversation id, info = "PFS-Ratchet-Init") -> root | seed | responder chain
 *   responder: sends on the responder chain with the X25519 key pair derived from seed
 *   initiator: receives on the responder chain, then takes one sending DH step
 * @endcode
 * The initiator's first envelope therefore carries messageNumber 0 and chainLength 1.
 *
 * Not thread-safe; RatchetEngine serializes access per (conversation, user).
 */
class RatchetSession {
public:
    static Result<models::RatchetState, ProtocolFailure> Bootstrap(
        const std::string& conversation_id,
        const std::string& user_id,
        std::span<const uint8_t> shared_secret,
        bool is_initiator,
        const std::optional<HybridKeys>& hybrid,
        interfaces::TimePoint now);

    RatchetSession(models::RatchetState state, configuration::RatchetConfig config);

    RatchetSession(const RatchetSession&) = delete;
    RatchetSession& operator=(const RatchetSession&) = delete;
    RatchetSession(RatchetSession&&) noexcept = default;
    RatchetSession& operator=(RatchetSession&&) noexcept = default;

    ~RatchetSession();

    [[nodiscard]] Result<proto::wire::RatchetEnvelope, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data,
        interfaces::TimePoint now);

    [[nodiscard]] Result<DecryptOutcome, ProtocolFailure> Decrypt(
        const proto::wire::RatchetEnvelope& envelope,
        std::span<const uint8_t> associated_data,
        interfaces::TimePoint now);

    [[nodiscard]] const models::RatchetState& State() const noexcept { return state_; }

    /// Id under which a skipped key for (ephemeral, message number) is retained.
    static std::string SkippedKeyId(std::span<const uint8_t> ephemeral_public_key, uint32_t message_number);

private:
    models::RatchetState state_;
    configuration::RatchetConfig config_;
};

}
