#include "pfs/storage/state_key_providers.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"
#include "pfs/crypto/sodium_interop.hpp"

#include <cstdlib>

namespace pfs::protocol::storage {
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    Result<std::unique_ptr<StaticStateKeyProvider>, ProtocolFailure>
    StaticStateKeyProvider::FromKey(std::span<const uint8_t> key) {
        using ProviderResult = Result<std::unique_ptr<StaticStateKeyProvider>, ProtocolFailure>;
        if (key.size() != kAesKeyBytes) {
            return ProviderResult::Err(ProtocolFailure::Configuration(
                compat::format("State encryption key must be {} bytes, got {}", kAesKeyBytes, key.size())));
        }
        auto handle = SecureMemoryHandle::FromBytes(key);
        if (handle.IsErr()) {
            return ProviderResult::Err(ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return ProviderResult::Ok(std::unique_ptr<StaticStateKeyProvider>(
            new StaticStateKeyProvider(std::move(handle).Unwrap())));
    }

    Result<std::unique_ptr<StaticStateKeyProvider>, ProtocolFailure> StaticStateKeyProvider::Generate() {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::unique_ptr<StaticStateKeyProvider>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto key = SodiumInterop::GetRandomBytes(kAesKeyBytes);
        auto provider = FromKey(key);
        auto _wipe = SodiumInterop::SecureWipe(std::span(key));
        (void) _wipe;
        return provider;
    }

    Result<std::unique_ptr<StaticStateKeyProvider>, ProtocolFailure>
    StaticStateKeyProvider::FromEnvironment(const char* variable) {
        using ProviderResult = Result<std::unique_ptr<StaticStateKeyProvider>, ProtocolFailure>;
        const char* encoded = std::getenv(variable);
        if (encoded == nullptr || *encoded == '\0') {
            return ProviderResult::Err(ProtocolFailure::Configuration(
                compat::format("{} is not set", variable)));
        }
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return ProviderResult::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto decoded = SodiumInterop::FromBase64(encoded);
        if (decoded.IsErr()) {
            return ProviderResult::Err(ProtocolFailure::Configuration(
                compat::format("{} is not valid base64", variable)));
        }
        auto key = std::move(decoded).Unwrap();
        auto provider = FromKey(key);
        auto _wipe = SodiumInterop::SecureWipe(std::span(key));
        (void) _wipe;
        return provider;
    }

    Result<SecureMemoryHandle, ProtocolFailure> StaticStateKeyProvider::GetStateEncryptionKey() {
        auto copy = key_.WithReadAccess([](std::span<const uint8_t> key) {
            return SecureMemoryHandle::FromBytes(key);
        });
        if (copy.IsErr()) {
            return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(copy.UnwrapErr()));
        }
        auto handle = std::move(copy).Unwrap();
        if (handle.IsErr()) {
            return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle).Unwrap());
    }

}  // namespace pfs::protocol::storage
