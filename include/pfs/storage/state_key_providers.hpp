#pragma once

#include "pfs/interfaces/i_state_key_provider.hpp"

#include <memory>
#include <span>
#include <string>

namespace pfs::protocol::storage {

/// Holds one AES-256 key in guarded memory and hands out copies of it.
class StaticStateKeyProvider final : public interfaces::IStateKeyProvider {
public:
    static Result<std::unique_ptr<StaticStateKeyProvider>, ProtocolFailure>
    FromKey(std::span<const uint8_t> key);

    /// Fresh random key; only meaningful for one process lifetime.
    static Result<std::unique_ptr<StaticStateKeyProvider>, ProtocolFailure> Generate();

    /// Decodes a base64 32-byte key from `variable` (default PFS_STATE_ENCRYPTION_KEY).
    static Result<std::unique_ptr<StaticStateKeyProvider>, ProtocolFailure>
    FromEnvironment(const char* variable = "PFS_STATE_ENCRYPTION_KEY");

    Result<crypto::SecureMemoryHandle, ProtocolFailure> GetStateEncryptionKey() override;

private:
    explicit StaticStateKeyProvider(crypto::SecureMemoryHandle key) noexcept
        : key_(std::move(key)) {}

    crypto::SecureMemoryHandle key_;
};

}
