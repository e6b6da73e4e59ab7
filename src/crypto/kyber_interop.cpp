#include "pfs/crypto/kyber_interop.hpp"
#include "pfs/crypto/sodium_interop.hpp"

#include <oqs/oqs.h>
#include <oqs/rand.h>
#include <sodium.h>

#include <algorithm>
#include <memory>
#include <mutex>

namespace pfs::protocol::crypto {

namespace {
    struct KemDeleter {
        void operator()(OQS_KEM* kem) const {
            OQS_KEM_free(kem);
        }
    };
    using KemPtr = std::unique_ptr<OQS_KEM, KemDeleter>;

    void SodiumRandomBytes(uint8_t* buffer, size_t length) {
        randombytes_buf(buffer, length);
    }

    Result<KemPtr, SodiumFailure> CreateKem() {
        auto init = KyberInterop::Initialize();
        if (init.IsErr()) {
            return Result<KemPtr, SodiumFailure>::Err(init.UnwrapErr());
        }
        KemPtr kem(OQS_KEM_new(OQS_KEM_alg_kyber_768));
        if (!kem) {
            return Result<KemPtr, SodiumFailure>::Err(
                SodiumFailure::InitializationFailed("Kyber-768 is not enabled in liboqs"));
        }
        if (kem->length_public_key != KyberInterop::KYBER_768_PUBLIC_KEY_SIZE ||
            kem->length_secret_key != KyberInterop::KYBER_768_SECRET_KEY_SIZE ||
            kem->length_ciphertext != KyberInterop::KYBER_768_CIPHERTEXT_SIZE ||
            kem->length_shared_secret != KyberInterop::KYBER_768_SHARED_SECRET_SIZE) {
            return Result<KemPtr, SodiumFailure>::Err(
                SodiumFailure::InitializationFailed("Kyber-768 parameter sizes do not match"));
        }
        return Result<KemPtr, SodiumFailure>::Ok(std::move(kem));
    }

    bool AllZero(std::span<const uint8_t> bytes) {
        return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    }
}

Result<Unit, SodiumFailure> KyberInterop::Initialize() {
    static std::once_flag rng_flag;
    auto sodium = SodiumInterop::Initialize();
    if (sodium.IsErr()) {
        return sodium;
    }
    std::call_once(rng_flag, []() {
        OQS_randombytes_custom_algorithm(&SodiumRandomBytes);
    });
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
KyberInterop::GenerateKyber768KeyPair(const std::string_view purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>;
    auto kem_result = CreateKem();
    if (kem_result.IsErr()) {
        return KeyPairResult::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    auto sk_result = SecureMemoryHandle::Allocate(KYBER_768_SECRET_KEY_SIZE);
    if (sk_result.IsErr()) {
        return KeyPairResult::Err(sk_result.UnwrapErr());
    }
    auto secret_key = std::move(sk_result).Unwrap();
    std::vector<uint8_t> public_key(KYBER_768_PUBLIC_KEY_SIZE);

    OQS_STATUS status = OQS_ERROR;
    auto write = secret_key.WithWriteAccess([&](std::span<uint8_t> sk) {
        status = OQS_KEM_keypair(kem.get(), public_key.data(), sk.data());
        return status;
    });
    if (write.IsErr()) {
        return KeyPairResult::Err(write.UnwrapErr());
    }
    if (status != OQS_SUCCESS) {
        return KeyPairResult::Err(SodiumFailure::InvalidOperation(
            std::string("Kyber-768 key generation failed for ") + std::string(purpose)));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(secret_key), std::move(public_key)));
}

Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, SodiumFailure>
KyberInterop::Encapsulate(const std::span<const uint8_t> public_key) {
    using EncapsResult = Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, SodiumFailure>;
    auto valid = ValidatePublicKey(public_key);
    if (valid.IsErr()) {
        return EncapsResult::Err(valid.UnwrapErr());
    }
    auto kem_result = CreateKem();
    if (kem_result.IsErr()) {
        return EncapsResult::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    auto ss_result = SecureMemoryHandle::Allocate(KYBER_768_SHARED_SECRET_SIZE);
    if (ss_result.IsErr()) {
        return EncapsResult::Err(ss_result.UnwrapErr());
    }
    auto shared_secret = std::move(ss_result).Unwrap();
    std::vector<uint8_t> ciphertext(KYBER_768_CIPHERTEXT_SIZE);

    OQS_STATUS status = OQS_ERROR;
    auto write = shared_secret.WithWriteAccess([&](std::span<uint8_t> ss) {
        status = OQS_KEM_encaps(kem.get(), ciphertext.data(), ss.data(), public_key.data());
        return status;
    });
    if (write.IsErr()) {
        return EncapsResult::Err(write.UnwrapErr());
    }
    if (status != OQS_SUCCESS) {
        return EncapsResult::Err(SodiumFailure::InvalidOperation("Kyber-768 encapsulation failed"));
    }
    return EncapsResult::Ok(std::make_pair(std::move(ciphertext), std::move(shared_secret)));
}

Result<SecureMemoryHandle, SodiumFailure>
KyberInterop::Decapsulate(
    const std::span<const uint8_t> ciphertext,
    const SecureMemoryHandle& secret_key) {
    auto ct_valid = ValidateCiphertext(ciphertext);
    if (ct_valid.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(ct_valid.UnwrapErr());
    }
    auto sk_valid = ValidateSecretKey(secret_key);
    if (sk_valid.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(sk_valid.UnwrapErr());
    }
    auto kem_result = CreateKem();
    if (kem_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    auto ss_result = SecureMemoryHandle::Allocate(KYBER_768_SHARED_SECRET_SIZE);
    if (ss_result.IsErr()) {
        return ss_result;
    }
    auto shared_secret = std::move(ss_result).Unwrap();

    OQS_STATUS status = OQS_ERROR;
    auto access = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        auto inner = shared_secret.WithWriteAccess([&](std::span<uint8_t> ss) {
            status = OQS_KEM_decaps(kem.get(), ss.data(), ciphertext.data(), sk.data());
            return status;
        });
        return inner.IsOk();
    });
    if (access.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(access.UnwrapErr());
    }
    if (!access.Unwrap() || status != OQS_SUCCESS) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Kyber-768 decapsulation failed"));
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(shared_secret));
}

Result<Unit, SodiumFailure> KyberInterop::ValidatePublicKey(const std::span<const uint8_t> public_key) {
    if (public_key.size() != KYBER_768_PUBLIC_KEY_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Invalid Kyber-768 public key size (expected 1184 bytes)"));
    }
    if (AllZero(public_key)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Invalid Kyber-768 public key (all zeros)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> KyberInterop::ValidateCiphertext(const std::span<const uint8_t> ciphertext) {
    if (ciphertext.size() != KYBER_768_CIPHERTEXT_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Invalid Kyber-768 ciphertext size (expected 1088 bytes)"));
    }
    if (AllZero(ciphertext)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Invalid Kyber-768 ciphertext (all zeros)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> KyberInterop::ValidateSecretKey(const SecureMemoryHandle& secret_key) {
    if (secret_key.Size() != KYBER_768_SECRET_KEY_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Invalid Kyber-768 secret key size (expected 2400 bytes)"));
    }
    auto all_zero = secret_key.WithReadAccess([](std::span<const uint8_t> sk) { return AllZero(sk); });
    if (all_zero.IsErr()) {
        return Result<Unit, SodiumFailure>::Err(all_zero.UnwrapErr());
    }
    if (all_zero.Unwrap()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Invalid Kyber-768 secret key (all zeros)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

}
