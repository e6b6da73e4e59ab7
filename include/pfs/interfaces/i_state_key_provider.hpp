#pragma once
#include "pfs/core/result.hpp"
#include "pfs/core/failures.hpp"
#include "pfs/crypto/secure_memory_handle.hpp"

namespace pfs::protocol::interfaces {

/// Supplies the operator-held AES-256 key that protects ratchet state at rest.
class IStateKeyProvider {
public:
    virtual ~IStateKeyProvider() = default;

    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, ProtocolFailure> GetStateEncryptionKey() = 0;
};

}
