#ifndef INCLUDE_PHOTOVAULT_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_PHOTOVAULT_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace photovault::security
{
// Constant-time for equal lengths. Length itself is not secret for MACs and verifiers.
[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile std::uint8_t diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= static_cast<std::uint8_t>(a[i] ^ b[i]);
    }
    return (diff == 0U);
}

} // namespace photovault::security

#endif // INCLUDE_PHOTOVAULT_SECURITY_SECUREEQUALS_HPP
