#ifndef INCLUDE_PHOTOVAULT_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_PHOTOVAULT_CRYPTO_KEYDERIVATION_HPP

#include "photovault/crypto/ContainerKeys.hpp"
#include "photovault/crypto/ICryptoProvider.hpp"
#include "photovault/crypto/KdfParams.hpp"
#include "photovault/security/SecureBuffer.hpp"
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string_view>

namespace photovault::crypto
{

constexpr std::string_view g_kEncryptionKeyInfo{ "PhotoVault-Encryption" };
constexpr std::string_view g_kHmacKeyInfo{ "PhotoVault-HMAC" };
constexpr std::string_view g_kVerifierInfo{ "PhotoVault-Verifier" };

// Fatal derivation failure (entropy source or crypto library). Never degraded silently.
class KeyDerivationError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct DerivedKeyMaterial final
{
    ContainerKeys keys;
    photovault::security::SecureBuffer verifier;
};

// Argon2id(password, salt) stretched once, then split with HKDF-SHA256 into independent keys.
// Contract violations (empty password, unsafe params) throw std::invalid_argument.
[[nodiscard]] ContainerKeys deriveKeys(const ICryptoProvider& crypto, std::span<const std::byte> password,
                                       const KdfSettings& settings);

[[nodiscard]] photovault::security::SecureBuffer deriveVerifier(const ICryptoProvider& crypto,
                                                                std::span<const std::byte> password,
                                                                const KdfSettings& settings);

// Same result as deriveKeys + deriveVerifier with a single Argon2id pass.
[[nodiscard]] DerivedKeyMaterial deriveKeyMaterial(const ICryptoProvider& crypto, std::span<const std::byte> password,
                                                   const KdfSettings& settings);

[[nodiscard]] KdfSalt generateSalt();

} // namespace photovault::crypto

#endif // INCLUDE_PHOTOVAULT_CRYPTO_KEYDERIVATION_HPP
