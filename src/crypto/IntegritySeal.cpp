#include "photovault/crypto/IntegritySeal.hpp"
#include "photovault/security/SecureEquals.hpp"
#include <algorithm>
#include <span>

namespace photovault::crypto
{

std::vector<std::uint8_t> sealWithIntegrity(ICryptoProvider& crypto, std::span<const std::byte> plain,
                                            const ContainerKeys& keys)
{
    AeadBox box{ crypto.aeadEncrypt(keys.encryptionKey(), plain, {}) };

    std::vector<std::uint8_t> out{};
    out.reserve(g_kSealPrefixBytes + box.cipherText.size() + box.tag.size());
    out.insert(out.end(), box.nonce.begin(), box.nonce.end());
    out.resize(g_kSealPrefixBytes);
    out.insert(out.end(), box.cipherText.begin(), box.cipherText.end());
    out.insert(out.end(), box.tag.begin(), box.tag.end());

    const auto sealed{ std::span<const std::uint8_t>{ out }.subspan(g_kSealPrefixBytes) };
    const HmacSha256 mac{ crypto.hmacSha256(keys.hmacKey(), std::as_bytes(sealed)) };
    std::copy(mac.begin(), mac.end(), out.begin() + static_cast<std::ptrdiff_t>(g_aeadNonceBytes));
    return out;
}

std::optional<photovault::security::SecureBuffer> openWithIntegrity(ICryptoProvider& crypto,
                                                                    std::span<const std::uint8_t> sealed,
                                                                    const ContainerKeys& keys)
{
    if (sealed.size() < g_kSealMinBytes)
    {
        return std::nullopt;
    }

    const auto nonce{ sealed.first(g_aeadNonceBytes) };
    const auto storedMac{ sealed.subspan(g_aeadNonceBytes, g_hmacSha256Bytes) };
    const auto body{ sealed.subspan(g_kSealPrefixBytes) };

    const HmacSha256 mac{ crypto.hmacSha256(keys.hmacKey(), std::as_bytes(body)) };
    if (!photovault::security::secureEquals(std::span<const std::uint8_t>{ mac }, storedMac))
    {
        return std::nullopt;
    }

    AeadBox box{};
    std::copy(nonce.begin(), nonce.end(), box.nonce.begin());
    const auto cipherText{ body.first(body.size() - g_aeadTagBytes) };
    const auto tag{ body.last(g_aeadTagBytes) };
    box.cipherText.assign(cipherText.begin(), cipherText.end());
    std::copy(tag.begin(), tag.end(), box.tag.begin());

    return crypto.aeadDecrypt(keys.encryptionKey(), box, {});
}

} // namespace photovault::crypto
