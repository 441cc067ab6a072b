#ifndef INCLUDE_PHOTOVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_PHOTOVAULT_CRYPTO_ICRYPTOPROVIDER_HPP

#include "photovault/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace photovault::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };
constexpr std::size_t g_hmacSha256Bytes{ 32 };

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

using HmacSha256 = std::array<std::uint8_t, g_hmacSha256Bytes>;

// Implementations must be safe to call from several threads at once; the container codec shares one provider
// across concurrent rotations.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AEAD: ChaCha20-Poly1305 (IETF, 12-byte nonce). A fresh random nonce is drawn per call.
    // Throws std::runtime_error on CSPRNG or library failure.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<photovault::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;

    [[nodiscard]] virtual HmacSha256 hmacSha256(std::span<const std::uint8_t> key,
                                                std::span<const std::byte> message) const = 0;

    // HKDF-SHA256 (RFC 5869). `info` provides domain separation between derived keys.
    [[nodiscard]] virtual photovault::security::SecureBuffer deriveSubkey(std::span<const std::uint8_t> inputKey,
                                                                          std::span<const std::uint8_t> salt,
                                                                          std::span<const std::byte> info,
                                                                          std::size_t outBytes) const = 0;
};

} // namespace photovault::crypto

#endif // INCLUDE_PHOTOVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
