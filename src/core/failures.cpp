#include "pfs/core/failures.hpp"

namespace pfs::protocol {

std::string_view ErrorCode(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "INTERNAL_ERROR";
        case ProtocolFailureType::KeyGeneration: return "KEY_GENERATION_FAILED";
        case ProtocolFailureType::DeriveKey: return "KEY_DERIVATION_FAILED";
        case ProtocolFailureType::Decode: return "DECODE_FAILED";
        case ProtocolFailureType::Encode: return "ENCODE_FAILED";
        case ProtocolFailureType::InvalidState: return "INVALID_STATE";
        case ProtocolFailureType::Configuration: return "CONFIGURATION_ERROR";
        case ProtocolFailureType::ValidationError: return "VALIDATION_ERROR";
        case ProtocolFailureType::RatchetNotInitialized: return "RATCHET_NOT_INITIALIZED";
        case ProtocolFailureType::AlreadyInitialized: return "ALREADY_INITIALIZED";
        case ProtocolFailureType::AuthenticationFailure: return "AUTHENTICATION_FAILURE";
        case ProtocolFailureType::SkipWindowExceeded: return "SKIP_WINDOW_EXCEEDED";
        case ProtocolFailureType::CorruptedState: return "CORRUPTED_STATE";
        case ProtocolFailureType::ExchangeNotFound: return "EXCHANGE_NOT_FOUND";
        case ProtocolFailureType::ExchangeUnauthorized: return "EXCHANGE_UNAUTHORIZED";
        case ProtocolFailureType::ExchangeInvalidState: return "EXCHANGE_INVALID_STATE";
        case ProtocolFailureType::ExchangeExpired: return "EXCHANGE_EXPIRED";
        case ProtocolFailureType::DeviceOwnershipMismatch: return "DEVICE_OWNERSHIP_MISMATCH";
        case ProtocolFailureType::DeviceUnauthorized: return "DEVICE_UNAUTHORIZED";
        case ProtocolFailureType::PackageNotFound: return "PACKAGE_NOT_FOUND";
        case ProtocolFailureType::SessionNotFound: return "SESSION_NOT_FOUND";
        case ProtocolFailureType::SessionExpired: return "SESSION_EXPIRED";
        case ProtocolFailureType::ConflictNotFound: return "CONFLICT_NOT_FOUND";
        case ProtocolFailureType::StorageUnavailable: return "STORAGE_UNAVAILABLE";
    }
    return "UNKNOWN";
}

}
