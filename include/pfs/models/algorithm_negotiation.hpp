#pragma once

#include "pfs/interfaces/i_clock.hpp"
#include "pfs/models/algorithms.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pfs::protocol::models {

using interfaces::TimePoint;

struct NegotiatedCapabilities {
    CapabilitySet local;
    CapabilitySet remote;
};

/// What an initial_setup exchange settled on, as handed to the ledger.
struct NegotiationOutcome {
    SelectedAlgorithms selected;
    uint32_t security_level = 1;
    bool quantum_resistant = false;
    bool hybrid_mode = false;
    std::string protocol_version = "1.0";
    NegotiatedCapabilities capabilities;
};

struct AlgorithmNegotiation {
    std::string negotiation_id;
    std::string conversation_id;
    std::string initiator_id;
    std::string responder_id;
    SelectedAlgorithms selected;
    uint32_t achieved_security_level = 1;
    bool quantum_resistant = false;
    bool hybrid_mode = false;
    std::string protocol_version = "1.0";
    NegotiatedCapabilities capabilities;
    TimePoint created_at{};
    TimePoint expires_at{};
    bool is_active = true;
};

/// One relayed message as counted by the ledger.
struct RelayedMessage {
    std::string conversation_id;
    std::string algorithm;
    bool encrypted = false;
    TimePoint recorded_at{};
};

struct EncryptionStatus {
    bool encryption_enabled = false;
    bool has_negotiation = false;
    uint32_t security_level = 1;
    bool quantum_resistant = false;
    /// Selected key-exchange algorithm name, or "none".
    std::string algorithm = "none";
    std::optional<TimePoint> negotiated_at;
};

struct NegotiationStats {
    size_t total = 0;
    size_t encrypted = 0;
    std::map<std::string, size_t> by_algorithm;
    /// encrypted / total, in percent (0 when total is 0).
    double encryption_rate = 0.0;
    size_t negotiations = 0;
    size_t quantum_resistant_negotiations = 0;
};

}
