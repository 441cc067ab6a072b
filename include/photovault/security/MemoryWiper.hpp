#ifndef INCLUDE_PHOTOVAULT_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_PHOTOVAULT_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace photovault::security
{
// Zeroes memory in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// For secrets that passed through a plain std::string (console input, CLI arguments).
// Wipes the whole capacity, then empties the string.
void secureWipe(std::string& text) noexcept;
} // namespace photovault::security
#endif // INCLUDE_PHOTOVAULT_SECURITY_MEMORYWIPER_HPP
