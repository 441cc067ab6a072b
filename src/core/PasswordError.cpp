#include "photovault/core/PasswordError.hpp"

namespace photovault::core
{

std::string_view describe(PasswordError error) noexcept
{
    switch (error)
    {
    case PasswordError::NotInitialized:
        return "album is not initialized";
    case PasswordError::AlreadyInitialized:
        return "album is already initialized";
    case PasswordError::InvalidPassword:
        return "invalid password";
    case PasswordError::PasswordTooShort:
        return "password is too short";
    case PasswordError::PasswordTooLong:
        return "password is too long";
    case PasswordError::KeyDerivationFailed:
        return "key derivation failed";
    case PasswordError::RandomFailed:
        return "random generator failure";
    case PasswordError::StorageError:
        return "credential storage error";
    case PasswordError::RotationIncomplete:
        return "a previous password change is incomplete; resume it first";
    case PasswordError::NoPendingRotation:
        return "no password change to resume";
    case PasswordError::CryptoError:
        return "crypto error";
    }
    return "unknown error";
}

} // namespace photovault::core
