#ifndef INCLUDE_PHOTOVAULT_SECURITY_SECURESTRING_HPP
#define INCLUDE_PHOTOVAULT_SECURITY_SECURESTRING_HPP

#include "photovault/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace photovault::security
{
// Passwords travel as SecureString so the plaintext never lands in an unwiped heap block.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // Parentheses select the range constructor.
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    SecureString temp{};
    s.swap(temp);
}

} // namespace photovault::security

#endif // INCLUDE_PHOTOVAULT_SECURITY_SECURESTRING_HPP
