#include "pfs/crypto/aes_gcm.hpp"
#include "pfs/crypto/sodium_interop.hpp"
#include "pfs/core/constants.hpp"
#include "pfs/core/format.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <memory>
#include <string>

namespace pfs::protocol::crypto {
namespace {
    constexpr int kOpenSslSuccess = 1;

    struct CipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

    std::string LastOpenSslError() {
        const unsigned long err = ERR_get_error();
        if (err == 0) {
            return "unknown OpenSSL error";
        }
        char buffer[256];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return buffer;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> OpenSslFailure(const char* step) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(compat::format("{}: {}", step, LastOpenSslError())));
    }

    Result<Unit, ProtocolFailure> CheckKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(
                    compat::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::ValidationError(
                    compat::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    PFS_TRY(CheckKeyAndNonce(key, nonce));

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSslFailure("Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != kOpenSslSuccess ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != kOpenSslSuccess ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != kOpenSslSuccess) {
        return OpenSslFailure("Failed to initialize AES-256-GCM");
    }
    int len = 0;
    if (!associated_data.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, associated_data.data(),
                          static_cast<int>(associated_data.size())) != kOpenSslSuccess) {
        return OpenSslFailure("Failed to add associated data");
    }

    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != kOpenSslSuccess) {
            SodiumInterop::SecureWipe(output);
            return OpenSslFailure("Encryption failed");
        }
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != kOpenSslSuccess) {
        SodiumInterop::SecureWipe(output);
        return OpenSslFailure("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != kOpenSslSuccess) {
        SodiumInterop::SecureWipe(output);
        return OpenSslFailure("Failed to read authentication tag");
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    PFS_TRY(CheckKeyAndNonce(key, nonce));
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::ValidationError(
                compat::format("Ciphertext too small: {} bytes", ciphertext_with_tag.size())));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    const auto ciphertext = ciphertext_with_tag.first(ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSslFailure("Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != kOpenSslSuccess ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != kOpenSslSuccess ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != kOpenSslSuccess) {
        return OpenSslFailure("Failed to initialize AES-256-GCM");
    }
    int len = 0;
    if (!associated_data.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, associated_data.data(),
                          static_cast<int>(associated_data.size())) != kOpenSslSuccess) {
        return OpenSslFailure("Failed to add associated data");
    }

    // Padded so the buffer is never empty when finalizing an empty message.
    std::vector<uint8_t> output(ciphertext_len + kAesGcmTagBytes);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != kOpenSslSuccess) {
        SodiumInterop::SecureWipe(output);
        return OpenSslFailure("Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kAesGcmTagBytes),
                            tag.data()) != kOpenSslSuccess) {
        SodiumInterop::SecureWipe(output);
        return OpenSslFailure("Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != kOpenSslSuccess) {
        SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailure("AES-GCM authentication tag verification failed"));
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

}
