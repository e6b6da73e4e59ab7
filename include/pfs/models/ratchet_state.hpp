#pragma once

#include "pfs/interfaces/i_clock.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pfs::protocol::models {

using interfaces::TimePoint;

enum class CipherSuite {
    Classical,
    Hybrid
};

/// A message key derived ahead of time for a message that has not arrived yet.
struct SkippedMessageKey {
    std::string message_key_id;
    std::vector<uint8_t> key;
    uint32_t chain_length = 0;
    uint32_t message_number = 0;
    /// Insertion order; the smallest sequence is evicted first.
    uint64_t sequence = 0;
    TimePoint created_at{};
    TimePoint expires_at{};
};

/**
 * @brief Plaintext view of one (conversation, user) ratchet.
 *
 * Only ever held in memory; KeyMaterialStore encrypts the secret members before they reach a
 * storage backend.
 */
struct RatchetState {
    std::string id;
    std::string conversation_id;
    std::string user_id;

    std::vector<uint8_t> root_key;
    std::vector<uint8_t> sending_chain_key;
    std::vector<uint8_t> receiving_chain_key;

    uint32_t sending_message_number = 0;
    uint32_t receiving_message_number = 0;
    uint32_t sending_chain_length = 0;
    uint32_t receiving_chain_length = 0;
    uint32_t previous_sending_count = 0;

    std::vector<uint8_t> sending_ephemeral_private_key;
    std::vector<uint8_t> sending_ephemeral_public_key;
    std::vector<uint8_t> receiving_ephemeral_public_key;

    bool is_initiator = false;
    CipherSuite suite = CipherSuite::Classical;

    // Hybrid suite only.
    std::vector<uint8_t> kyber_secret_key;
    std::vector<uint8_t> kyber_public_key;
    std::vector<uint8_t> peer_kyber_public_key;
    std::vector<uint8_t> sending_pqc_ciphertext;

    std::map<std::string, SkippedMessageKey> skipped_keys;
    uint64_t skipped_key_sequence = 0;

    uint64_t version = 0;
    TimePoint created_at{};
    TimePoint updated_at{};

    [[nodiscard]] bool HasSendingChain() const noexcept { return !sending_chain_key.empty(); }
    [[nodiscard]] bool HasReceivingChain() const noexcept { return !receiving_chain_key.empty(); }
    [[nodiscard]] bool IsHybrid() const noexcept { return suite == CipherSuite::Hybrid; }

    /// Zeroes every secret member in place.
    void WipeSecrets() noexcept;
};

struct RatchetStatistics {
    uint32_t sending_message_number = 0;
    uint32_t receiving_message_number = 0;
    uint32_t sending_chain_length = 0;
    uint32_t receiving_chain_length = 0;
    size_t skipped_keys_count = 0;
    TimePoint created_at{};
    TimePoint updated_at{};
};

struct RatchetStateSummary {
    std::string id;
    std::string user_id;
    uint32_t sending_chain_length = 0;
    uint32_t receiving_chain_length = 0;
    uint64_t version = 0;
    TimePoint updated_at{};
};

struct StoreHealth {
    size_t total_ratchet_states = 0;
    size_t total_skipped_keys = 0;
    size_t expired_keys = 0;
    bool healthy = false;
};

}
