#ifndef INCLUDE_PHOTOVAULT_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_PHOTOVAULT_SECURITY_SCOPEWIPE_HPP

#include "photovault/security/MemoryWiper.hpp"
#include "photovault/security/SecureBuffer.hpp"
#include "photovault/security/SecureString.hpp"
#include <cstdint>
#include <span>

namespace photovault::security
{
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    explicit ScopeWipe(std::span<std::byte> b) noexcept : m_bytes{ b }
    {
    }

    ScopeWipe(ScopeWipe&& sw) noexcept : m_bytes{ sw.m_bytes }
    {
        sw.m_bytes = {};
    }

    ~ScopeWipe() noexcept
    {
        if (!m_bytes.empty())
        {
            secureWipe(m_bytes);
        }
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

} // namespace photovault::security

#endif // INCLUDE_PHOTOVAULT_SECURITY_SCOPEWIPE_HPP
