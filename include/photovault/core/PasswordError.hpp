#ifndef INCLUDE_PHOTOVAULT_CORE_PASSWORDERROR_HPP
#define INCLUDE_PHOTOVAULT_CORE_PASSWORDERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace photovault::core
{

enum class PasswordError : std::uint8_t
{
    NotInitialized,
    AlreadyInitialized,
    InvalidPassword,
    PasswordTooShort,
    PasswordTooLong,
    KeyDerivationFailed,
    RandomFailed,
    StorageError,
    // A previous password change has not finished; resume it before starting another.
    RotationIncomplete,
    NoPendingRotation,
    CryptoError,
};

template <class T> using PasswordResult = std::variant<T, PasswordError>;

[[nodiscard]] std::string_view describe(PasswordError error) noexcept;

} // namespace photovault::core

#endif // INCLUDE_PHOTOVAULT_CORE_PASSWORDERROR_HPP
