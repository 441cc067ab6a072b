#include "photovault/crypto/KeyDerivation.hpp"
#include "photovault/crypto/Argon2id.hpp"
#include "photovault/security/SecureRandom.hpp"
#include <new>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace photovault::crypto
{
namespace
{

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

[[nodiscard]] photovault::security::SecureBuffer stretchPassword(std::span<const std::byte> password,
                                                                 const KdfSettings& settings)
{
    try
    {
        return deriveMasterKeyArgon2id(password, std::span<const std::uint8_t>{ settings.salt }, settings.params);
    }
    catch (const std::bad_alloc&)
    {
        throw KeyDerivationError{ "deriveKeys: Argon2id work area allocation failed" };
    }
}

[[nodiscard]] photovault::security::SecureBuffer expand(const ICryptoProvider& crypto,
                                                        const photovault::security::SecureBuffer& masterKey,
                                                        const KdfSettings& settings, std::string_view info,
                                                        std::size_t outBytes)
{
    try
    {
        return crypto.deriveSubkey(photovault::security::asSpan(masterKey),
                                   std::span<const std::uint8_t>{ settings.salt }, asBytes(info), outBytes);
    }
    catch (const std::runtime_error& e)
    {
        throw KeyDerivationError{ e.what() };
    }
}

[[nodiscard]] ContainerKeys expandKeys(const ICryptoProvider& crypto, const photovault::security::SecureBuffer& masterKey,
                                       const KdfSettings& settings)
{
    auto encryptionKey{ expand(crypto, masterKey, settings, g_kEncryptionKeyInfo, g_aeadKeyBytes) };
    auto hmacKey{ expand(crypto, masterKey, settings, g_kHmacKeyInfo, g_aeadKeyBytes) };
    return ContainerKeys{ std::move(encryptionKey), std::move(hmacKey) };
}

} // namespace

ContainerKeys deriveKeys(const ICryptoProvider& crypto, std::span<const std::byte> password,
                         const KdfSettings& settings)
{
    auto masterKey{ stretchPassword(password, settings) };
    auto keys{ expandKeys(crypto, masterKey, settings) };
    photovault::security::secureRelease(masterKey);
    return keys;
}

photovault::security::SecureBuffer deriveVerifier(const ICryptoProvider& crypto, std::span<const std::byte> password,
                                                  const KdfSettings& settings)
{
    auto masterKey{ stretchPassword(password, settings) };
    auto verifier{ expand(crypto, masterKey, settings, g_kVerifierInfo, g_kVerifierBytes) };
    photovault::security::secureRelease(masterKey);
    return verifier;
}

DerivedKeyMaterial deriveKeyMaterial(const ICryptoProvider& crypto, std::span<const std::byte> password,
                                     const KdfSettings& settings)
{
    auto masterKey{ stretchPassword(password, settings) };
    DerivedKeyMaterial out{ .keys = expandKeys(crypto, masterKey, settings),
                            .verifier = expand(crypto, masterKey, settings, g_kVerifierInfo, g_kVerifierBytes) };
    photovault::security::secureRelease(masterKey);
    return out;
}

KdfSalt generateSalt()
{
    KdfSalt salt{};
    if (!photovault::security::secureRandomFill(std::span<std::uint8_t>{ salt }))
    {
        throw KeyDerivationError{ "generateSalt: CSPRNG failure" };
    }
    return salt;
}

} // namespace photovault::crypto
