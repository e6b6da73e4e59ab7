#include "pfs/crypto/hkdf.hpp"
#include "pfs/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <memory>

namespace pfs::protocol::crypto {

namespace {
    struct KdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using KdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, KdfCtxDeleter>;

    enum class HkdfMode { ExtractAndExpand, ExtractOnly, ExpandOnly };

    const char* ModeName(const HkdfMode mode) {
        switch (mode) {
            case HkdfMode::ExtractOnly: return "EXTRACT_ONLY";
            case HkdfMode::ExpandOnly: return "EXPAND_ONLY";
            case HkdfMode::ExtractAndExpand: break;
        }
        return "EXTRACT_AND_EXPAND";
    }

    Result<Unit, ProtocolFailure> RunHkdf(
        const HkdfMode mode,
        std::span<const uint8_t> key,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) {
        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
        if (kdf == nullptr) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("Failed to fetch HKDF implementation"));
        }
        KdfCtxPtr ctx(EVP_KDF_CTX_new(kdf));
        EVP_KDF_free(kdf);
        if (!ctx) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("Failed to create HKDF context"));
        }

        OSSL_PARAM params[6];
        size_t n = 0;
        params[n++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
        params[n++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_MODE, const_cast<char*>(ModeName(mode)), 0);
        params[n++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(key.data()), key.size());
        if (!salt.empty()) {
            params[n++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
        }
        if (!info.empty()) {
            params[n++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
        }
        params[n] = OSSL_PARAM_construct_end();

        if (EVP_KDF_derive(ctx.get(), output.data(), output.size(), params) != 1) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("HKDF derivation failed"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

Result<Unit, ProtocolFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    if (ikm.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("HKDF input key material cannot be empty"));
    }
    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                compat::format("HKDF output size {} outside 1..{}", output.size(), MAX_OUTPUT_LEN)));
    }
    return RunHkdf(HkdfMode::ExtractAndExpand, ikm, output, salt, info);
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    const size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    std::vector<uint8_t> output(output_size);
    PFS_TRY(DeriveKey(ikm, output, salt, info));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    const size_t output_size,
    std::span<const uint8_t> salt,
    const std::string_view info) {
    return DeriveKeyBytes(
        ikm, output_size, salt,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(info.data()), info.size()));
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {
    if (ikm.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("HKDF input key material cannot be empty"));
    }
    std::vector<uint8_t> prk(HASH_LEN);
    PFS_TRY(RunHkdf(HkdfMode::ExtractOnly, ikm, prk, salt, {}));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(prk));
}

Result<Unit, ProtocolFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    std::span<uint8_t> output,
    std::span<const uint8_t> info) {
    if (prk.size() != HASH_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(compat::format("PRK must be exactly {} bytes", HASH_LEN)));
    }
    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("HKDF-Expand output size out of range"));
    }
    return RunHkdf(HkdfMode::ExpandOnly, prk, output, {}, info);
}

}
