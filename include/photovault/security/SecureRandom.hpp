#ifndef INCLUDE_PHOTOVAULT_SECURITY_SECURERANDOM_HPP
#define INCLUDE_PHOTOVAULT_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace photovault::security
{

// OS CSPRNG. Returns false only when the kernel source fails; callers must not fall back.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Lowercase hex token of `bytes` random bytes, for unpredictable file names.
// Throws std::runtime_error on CSPRNG failure.
[[nodiscard]] std::string randomHexToken(std::size_t bytes);

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

} // namespace photovault::security

#endif // INCLUDE_PHOTOVAULT_SECURITY_SECURERANDOM_HPP
