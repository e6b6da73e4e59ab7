#pragma once

#include "pfs/interfaces/i_clock.hpp"
#include "pfs/models/algorithms.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfs::protocol::models {

using interfaces::TimePoint;

enum class ExchangeType {
    InitialSetup,
    RatchetUpdate,
    PqcUpgrade,
    DeviceAddition
};

enum class ExchangeStatus {
    Pending,
    Responded,
    Completed,
    Expired
};

std::string_view ToString(ExchangeType type) noexcept;
std::string_view ToString(ExchangeStatus status) noexcept;

/// Accepts the wire names initial_setup, ratchet_update, pqc_upgrade, device_addition.
std::optional<ExchangeType> ParseExchangeType(std::string_view text) noexcept;

/// Public half of a party's key material plus what it selected and supports.
struct PublicKeyBundle {
    std::vector<uint8_t> x25519_public_key;
    std::optional<std::vector<uint8_t>> kyber_public_key;
    uint32_t security_level = 1;
    bool quantum_resistant = false;
    SelectedAlgorithms selected;
    bool hybrid_mode = false;
    std::string protocol_version = "1.0";
    CapabilitySet capabilities;
};

struct KeyExchange {
    std::string id;
    std::string initiator_id;
    std::string recipient_id;
    std::string conversation_id;
    ExchangeType type = ExchangeType::InitialSetup;
    ExchangeStatus status = ExchangeStatus::Pending;
    PublicKeyBundle public_key_bundle;
    std::optional<PublicKeyBundle> recipient_public_key_bundle;
    std::vector<uint8_t> encrypted_key_data;
    std::vector<uint8_t> response_data;
    std::vector<uint8_t> confirmation_signature;
    TimePoint created_at{};
    std::optional<TimePoint> responded_at;
    std::optional<TimePoint> completed_at;
    TimePoint expires_at{};
};

struct ExchangeReceipt {
    std::string exchange_id;
    ExchangeStatus status = ExchangeStatus::Pending;
    TimePoint expires_at{};
};

struct PendingExchange {
    std::string exchange_id;
    std::string conversation_id;
    ExchangeType type = ExchangeType::InitialSetup;
    ExchangeStatus status = ExchangeStatus::Pending;
    bool is_initiator = false;
    std::string other_party_id;
    PublicKeyBundle public_key_bundle;
    TimePoint created_at{};
    TimePoint expires_at{};
};

/// The caller's half of an exchange. Exactly one of encrypted_key_data / response_data is
/// populated depending on the caller's role.
struct ExchangeData {
    std::string exchange_id;
    std::string conversation_id;
    ExchangeType type = ExchangeType::InitialSetup;
    ExchangeStatus status = ExchangeStatus::Pending;
    std::optional<std::vector<uint8_t>> encrypted_key_data;
    std::optional<std::vector<uint8_t>> response_data;
    PublicKeyBundle public_key_bundle;
    std::optional<PublicKeyBundle> recipient_public_key_bundle;
    TimePoint created_at{};
    std::optional<TimePoint> responded_at;
    TimePoint expires_at{};
};

struct ExchangeStats {
    size_t total = 0;
    std::map<ExchangeStatus, size_t> by_status;
    std::map<ExchangeType, size_t> by_type;
    /// completed / total, in percent (0 when total is 0).
    double success_rate = 0.0;
};

}
