#ifndef INCLUDE_PHOTOVAULT_CRYPTO_INTEGRITYSEAL_HPP
#define INCLUDE_PHOTOVAULT_CRYPTO_INTEGRITYSEAL_HPP

#include "photovault/crypto/ContainerKeys.hpp"
#include "photovault/crypto/ICryptoProvider.hpp"
#include "photovault/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace photovault::crypto
{

// Wire form: [nonce(12)][HMAC-SHA256(32) over sealed][sealed = ciphertext || tag(16)]
constexpr std::size_t g_kSealPrefixBytes{ g_aeadNonceBytes + g_hmacSha256Bytes };
constexpr std::size_t g_kSealMinBytes{ g_kSealPrefixBytes + g_aeadTagBytes };

// AEAD under the encryption key, then HMAC under the HMAC key. No associated data.
[[nodiscard]] std::vector<std::uint8_t> sealWithIntegrity(ICryptoProvider& crypto, std::span<const std::byte> plain,
                                                          const ContainerKeys& keys);

// HMAC is checked first, in constant time; only then is the AEAD opened. Either failing yields std::nullopt.
[[nodiscard]] std::optional<photovault::security::SecureBuffer>
openWithIntegrity(ICryptoProvider& crypto, std::span<const std::uint8_t> sealed, const ContainerKeys& keys);

} // namespace photovault::crypto

#endif // INCLUDE_PHOTOVAULT_CRYPTO_INTEGRITYSEAL_HPP
