#ifndef INCLUDE_PHOTOVAULT_CRYPTO_CONTAINERKEYS_HPP
#define INCLUDE_PHOTOVAULT_CRYPTO_CONTAINERKEYS_HPP

#include "photovault/crypto/ICryptoProvider.hpp"
#include "photovault/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>
#include <stdexcept>
#include <utility>

namespace photovault::crypto
{

// The (encryptionKey, hmacKey) pair every container operation consumes. Move-only; wiped on destruction.
class ContainerKeys final
{
public:
    ContainerKeys() = default;
    ContainerKeys(const ContainerKeys&) = delete;
    ContainerKeys& operator=(const ContainerKeys&) = delete;

    ContainerKeys(photovault::security::SecureBuffer encryptionKey, photovault::security::SecureBuffer hmacKey)
        : m_encryptionKey{ std::move(encryptionKey) }, m_hmacKey{ std::move(hmacKey) }
    {
        if (m_encryptionKey.size() != g_aeadKeyBytes || m_hmacKey.size() != g_aeadKeyBytes)
        {
            photovault::security::secureRelease(m_encryptionKey);
            photovault::security::secureRelease(m_hmacKey);
            throw std::invalid_argument("ContainerKeys: keys must be 32 bytes");
        }
    }

    ContainerKeys(ContainerKeys&& other) noexcept
    {
        m_encryptionKey.swap(other.m_encryptionKey);
        m_hmacKey.swap(other.m_hmacKey);
    }

    ContainerKeys& operator=(ContainerKeys&& other) noexcept
    {
        if (this == &other)
        {
            return *this;
        }
        photovault::security::secureRelease(m_encryptionKey);
        photovault::security::secureRelease(m_hmacKey);
        m_encryptionKey.swap(other.m_encryptionKey);
        m_hmacKey.swap(other.m_hmacKey);
        return *this;
    }

    ~ContainerKeys() noexcept
    {
        photovault::security::secureRelease(m_encryptionKey);
        photovault::security::secureRelease(m_hmacKey);
    }

    [[nodiscard]] std::span<const std::uint8_t> encryptionKey() const noexcept
    {
        return std::span{ m_encryptionKey };
    }

    [[nodiscard]] std::span<const std::uint8_t> hmacKey() const noexcept
    {
        return std::span{ m_hmacKey };
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_encryptionKey.empty();
    }

private:
    photovault::security::SecureBuffer m_encryptionKey;
    photovault::security::SecureBuffer m_hmacKey;
};

} // namespace photovault::crypto

#endif // INCLUDE_PHOTOVAULT_CRYPTO_CONTAINERKEYS_HPP
