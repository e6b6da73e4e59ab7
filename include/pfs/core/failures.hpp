#pragma once
#include <string>
#include <string_view>

namespace pfs::protocol {

/// Failures raised by the libsodium / liboqs wrappers. Converted into ProtocolFailure at
/// the protocol boundary.
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};

enum class ProtocolFailureType {
    Generic,
    KeyGeneration,
    DeriveKey,
    Decode,
    Encode,
    InvalidState,
    Configuration,
    ValidationError,
    RatchetNotInitialized,
    AlreadyInitialized,
    AuthenticationFailure,
    SkipWindowExceeded,
    CorruptedState,
    ExchangeNotFound,
    ExchangeUnauthorized,
    ExchangeInvalidState,
    ExchangeExpired,
    DeviceOwnershipMismatch,
    DeviceUnauthorized,
    PackageNotFound,
    SessionNotFound,
    SessionExpired,
    ConflictNotFound,
    StorageUnavailable
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Stable upper-snake code for a failure kind, e.g. "AUTHENTICATION_FAILURE".
std::string_view ErrorCode(ProtocolFailureType type) noexcept;

class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;

    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    [[nodiscard]] std::string_view Code() const noexcept { return ErrorCode(type); }

    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Configuration(std::string msg) {
        return {ProtocolFailureType::Configuration, std::move(msg)};
    }
    static ProtocolFailure ValidationError(std::string msg) {
        return {ProtocolFailureType::ValidationError, std::move(msg)};
    }
    static ProtocolFailure RatchetNotInitialized(std::string msg) {
        return {ProtocolFailureType::RatchetNotInitialized, std::move(msg)};
    }
    static ProtocolFailure AlreadyInitialized(std::string msg) {
        return {ProtocolFailureType::AlreadyInitialized, std::move(msg)};
    }
    static ProtocolFailure AuthenticationFailure(std::string msg) {
        return {ProtocolFailureType::AuthenticationFailure, std::move(msg)};
    }
    static ProtocolFailure SkipWindowExceeded(std::string msg) {
        return {ProtocolFailureType::SkipWindowExceeded, std::move(msg)};
    }
    static ProtocolFailure CorruptedState(std::string msg) {
        return {ProtocolFailureType::CorruptedState, std::move(msg)};
    }
    static ProtocolFailure ExchangeNotFound(std::string msg) {
        return {ProtocolFailureType::ExchangeNotFound, std::move(msg)};
    }
    static ProtocolFailure ExchangeUnauthorized(std::string msg) {
        return {ProtocolFailureType::ExchangeUnauthorized, std::move(msg)};
    }
    static ProtocolFailure ExchangeInvalidState(std::string msg) {
        return {ProtocolFailureType::ExchangeInvalidState, std::move(msg)};
    }
    static ProtocolFailure ExchangeExpired(std::string msg) {
        return {ProtocolFailureType::ExchangeExpired, std::move(msg)};
    }
    static ProtocolFailure DeviceOwnershipMismatch(std::string msg) {
        return {ProtocolFailureType::DeviceOwnershipMismatch, std::move(msg)};
    }
    static ProtocolFailure DeviceUnauthorized(std::string msg) {
        return {ProtocolFailureType::DeviceUnauthorized, std::move(msg)};
    }
    static ProtocolFailure PackageNotFound(std::string msg) {
        return {ProtocolFailureType::PackageNotFound, std::move(msg)};
    }
    static ProtocolFailure SessionNotFound(std::string msg) {
        return {ProtocolFailureType::SessionNotFound, std::move(msg)};
    }
    static ProtocolFailure SessionExpired(std::string msg) {
        return {ProtocolFailureType::SessionExpired, std::move(msg)};
    }
    static ProtocolFailure ConflictNotFound(std::string msg) {
        return {ProtocolFailureType::ConflictNotFound, std::move(msg)};
    }
    static ProtocolFailure StorageUnavailable(std::string msg) {
        return {ProtocolFailureType::StorageUnavailable, std::move(msg)};
    }

    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};

}
