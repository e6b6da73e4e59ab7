#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pfs::protocol {

inline constexpr uint32_t kProtocolVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;

inline constexpr size_t kKyberPublicKeyBytes = 1184;
inline constexpr size_t kKyberSecretKeyBytes = 2400;
inline constexpr size_t kKyberCiphertextBytes = 1088;
inline constexpr size_t kKyberSharedSecretBytes = 32;

inline constexpr size_t kSharedSecretBytes = 32;
inline constexpr size_t kRootKeyBytes = 32;
inline constexpr size_t kChainKeyBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;

inline constexpr size_t kAeadNonceBytes = 12;
inline constexpr size_t kAeadTagBytes = 16;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kStateIdBytes = 16;
inline constexpr size_t kExchangeIdBytes = 16;
inline constexpr size_t kPackageIdBytes = 16;
inline constexpr size_t kNegotiationIdBytes = 12;
inline constexpr size_t kAuthSessionIdBytes = 16;
inline constexpr size_t kConflictIdBytes = 16;
inline constexpr size_t kVerificationDigestBytes = 32;
inline constexpr size_t kVerificationSaltBytes = 32;

inline constexpr uint32_t kDefaultMaxSkip = 1000;
inline constexpr size_t kDefaultMaxSkippedKeys = 1000;
inline constexpr size_t kDefaultPendingLimit = 10;
inline constexpr uint32_t kMaxSkipLimit = 100'000;
inline constexpr size_t kMaxSkippedKeysLimit = 1'000'000;
inline constexpr uint32_t kDeviceAuthMaxAttempts = 3;

inline constexpr std::chrono::hours kSkippedKeyTtl{24 * 7};
inline constexpr std::chrono::hours kExchangeTtl{24};
inline constexpr std::chrono::hours kSyncPackageTtl{24};
inline constexpr std::chrono::hours kNegotiationTtl{24 * 30};
inline constexpr std::chrono::minutes kDeviceAuthTtl{15};
inline constexpr std::chrono::hours kCleanupInterval{1};
inline constexpr std::chrono::hours kMaxCleanupInterval{24 * 7};
// Finished relay records stay this long so the longest statistics window still sees them.
inline constexpr std::chrono::hours kRecordRetention{24 * 30};

inline constexpr std::string_view kRatchetInitInfo = "PFS-Ratchet-Init";
inline constexpr std::string_view kDhRatchetInfo = "PFS-DH-Ratchet";
inline constexpr std::string_view kHybridRatchetInfo = "PFS-Hybrid-Ratchet";
inline constexpr std::string_view kChainInfo = "PFS-Chain";
inline constexpr std::string_view kMessageInfo = "PFS-Msg";
inline constexpr std::string_view kEnvelopeAdLabel = "PFS-Envelope-v1";
inline constexpr std::string_view kStateFieldAdLabel = "PFS-State-Field";

inline constexpr std::string_view kClassicalAlgorithm = "X25519-ChaCha20Poly1305";
inline constexpr std::string_view kHybridAlgorithm = "X25519+Kyber768-ChaCha20Poly1305";
inline constexpr uint32_t kClassicalSecurityLevel = 1;
inline constexpr uint32_t kHybridSecurityLevel = 3;

}
