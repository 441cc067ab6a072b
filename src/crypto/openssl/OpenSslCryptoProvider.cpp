#include "photovault/crypto/providers/OpenSslProviderFactory.hpp"
#include "photovault/security/SecureBuffer.hpp"
#include "photovault/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace photovault::crypto::providers
{
namespace
{

constexpr std::size_t g_kHkdfMaxOutBytes{ 255U * 32U };

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t n, const char* what)
{
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

EvpKdfPtr fetchHkdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_HKDF, nullptr), &EVP_KDF_free };
}

EvpMacPtr fetchHmac()
{
    return EvpMacPtr{ EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr), &EVP_MAC_free };
}

class OpenSslCryptoProvider final : public photovault::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_hkdf{ fetchHkdf() }, m_hmac{ fetchHmac() }
    {
        if (!m_hkdf)
        {
            throw std::runtime_error("OpenSslCryptoProvider: HKDF not available");
        }
        if (!m_hmac)
        {
            throw std::runtime_error("OpenSslCryptoProvider: HMAC not available");
        }
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return photovault::security::secureRandomFill(out);
    }

    [[nodiscard]] photovault::crypto::HmacSha256 hmacSha256(std::span<const std::uint8_t> key,
                                                            std::span<const std::byte> message) const override
    {
        if (key.empty())
        {
            throw std::invalid_argument("hmacSha256: empty key");
        }

        EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(m_hmac.get()), &EVP_MAC_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("hmacSha256: EVP_MAC_CTX_new failed");
        }

        // OSSL_PARAM takes non-const pointers even for read-only inputs.
        std::array<char, 7> digest{ 'S', 'H', 'A', '2', '5', '6', '\0' };
        OSSL_PARAM params[]{
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest.data(), 0),
            OSSL_PARAM_construct_end(),
        };

        if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1)
        {
            throw std::runtime_error("hmacSha256: EVP_MAC_init failed");
        }
        const auto* msg{ reinterpret_cast<const unsigned char*>(message.data()) };
        if (!message.empty() && EVP_MAC_update(ctx.get(), msg, message.size()) != 1)
        {
            throw std::runtime_error("hmacSha256: EVP_MAC_update failed");
        }

        photovault::crypto::HmacSha256 out{};
        std::size_t written{ 0U };
        if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1 || written != out.size())
        {
            throw std::runtime_error("hmacSha256: EVP_MAC_final failed");
        }
        return out;
    }

    [[nodiscard]] photovault::security::SecureBuffer deriveSubkey(std::span<const std::uint8_t> inputKey,
                                                                  std::span<const std::uint8_t> salt,
                                                                  std::span<const std::byte> info,
                                                                  std::size_t outBytes) const override
    {
        if (inputKey.empty())
        {
            throw std::invalid_argument("deriveSubkey: empty input key");
        }
        if (info.empty())
        {
            throw std::invalid_argument("deriveSubkey: empty info");
        }
        if (outBytes == 0U || outBytes > g_kHkdfMaxOutBytes)
        {
            throw std::invalid_argument("deriveSubkey: invalid outBytes");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_hkdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveSubkey: EVP_KDF_CTX_new failed");
        }

        // Copies keep const_cast out of the OSSL_PARAM construction.
        photovault::security::SecureBuffer keyCopy{ photovault::security::secureCopy(inputKey) };
        std::vector<std::uint8_t> saltCopy(salt.begin(), salt.end());
        std::vector<std::uint8_t> infoCopy(info.size());
        std::memcpy(infoCopy.data(), info.data(), info.size());
        std::array<char, 7> digest{ 'S', 'H', 'A', '2', '5', '6', '\0' };

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest.data(), 0),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY, keyCopy.data(), keyCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO, infoCopy.data(), infoCopy.size()),
            OSSL_PARAM_construct_end(),
        };

        photovault::security::SecureBuffer out(outBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            throw std::runtime_error("deriveSubkey: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] photovault::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                          std::span<const std::byte> plainText,
                                                          std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, photovault::crypto::g_aeadKeyBytes, "aeadEncrypt: key");
        requireIntSized(plainText.size(), "aeadEncrypt: plainText too large");
        requireIntSized(associatedData.size(), "aeadEncrypt: associatedData too large");

        photovault::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadEncrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: EVP_EncryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set ivlen failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set key/nonce failed");
        }

        int len{ 0 };
        if (!associatedData.empty())
        {
            const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
            if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
            {
                throw std::runtime_error("aeadEncrypt: add aad failed");
            }
        }

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        if (!plainText.empty())
        {
            const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
            if (EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &outLen, ptPtr,
                                  static_cast<int>(plainText.size())) != 1)
            {
                throw std::runtime_error("aeadEncrypt: encrypt update failed");
            }
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > box.cipherText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }

        // ChaCha20 is a stream cipher: final emits nothing, but it must run to compute the tag.
        std::array<unsigned char, 16> finalScratch{};
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        box.cipherText.resize(static_cast<std::size_t>(outLen));

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }

        return box;
    }

    [[nodiscard]] std::optional<photovault::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const photovault::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, photovault::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        requireIntSized(associatedData.size(), "aeadDecrypt: associatedData too large");
        requireIntSized(box.cipherText.size(), "aeadDecrypt: cipherText too large");

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadDecrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: EVP_DecryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set ivlen failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set key/nonce failed");
        }

        int len{ 0 };
        if (!associatedData.empty())
        {
            const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
            if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
            {
                throw std::runtime_error("aeadDecrypt: add aad failed");
            }
        }

        photovault::security::SecureBuffer plainText(box.cipherText.size());
        int outLen{ 0 };
        if (!box.cipherText.empty())
        {
            if (EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                                  static_cast<int>(box.cipherText.size())) != 1)
            {
                photovault::security::secureRelease(plainText);
                return std::nullopt;
            }
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) != plainText.size())
        {
            photovault::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, photovault::crypto::g_aeadTagBytes> tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        std::array<unsigned char, 16> finalScratch{};
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            photovault::security::secureRelease(plainText);
            return std::nullopt;
        }

        return plainText;
    }

private:
    EvpKdfPtr m_hkdf{ nullptr, &EVP_KDF_free };
    EvpMacPtr m_hmac{ nullptr, &EVP_MAC_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<photovault::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace photovault::crypto::providers
