#ifndef INCLUDE_PHOTOVAULT_CORE_PASSWORDSERVICE_HPP
#define INCLUDE_PHOTOVAULT_CORE_PASSWORDSERVICE_HPP

#include "photovault/container/ContainerCodec.hpp"
#include "photovault/container/ContainerOptions.hpp"
#include "photovault/core/CollectionRekeyer.hpp"
#include "photovault/core/PasswordError.hpp"
#include "photovault/crypto/ContainerKeys.hpp"
#include "photovault/crypto/ICryptoProvider.hpp"
#include "photovault/crypto/KdfParams.hpp"
#include "photovault/security/SecureString.hpp"
#include "photovault/storage/ICredentialStore.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <span>
#include <stop_token>
#include <variant>

namespace photovault::core
{

constexpr std::size_t g_kMinPasswordBytes{ 8U };
constexpr std::size_t g_kMaxPasswordBytes{ 128U };

// (containers done, containers total)
using RotationProgress = std::function<void(std::size_t, std::size_t)>;

struct PasswordServiceOptions final
{
    // Used for new passwords only; unlocking always uses the parameters stored with the salt.
    photovault::crypto::KdfParams kdf{};
    std::size_t maxConcurrentRotations{ g_kDefaultMaxConcurrentRotations };
    photovault::container::ContainerOptions container{};
};

[[nodiscard]] PasswordServiceOptions defaultPasswordServiceOptions() noexcept;

class PasswordService final
{
public:
    PasswordService(photovault::crypto::ICryptoProvider& crypto, photovault::storage::ICredentialStore& store,
                    std::filesystem::path albumDir, PasswordServiceOptions options = defaultPasswordServiceOptions());

    [[nodiscard]] static PasswordResult<std::monostate>
    validatePassword(const photovault::security::SecureString& password) noexcept;

    [[nodiscard]] bool isInitialized() const noexcept;

    [[nodiscard]] bool hasPendingRotation() const noexcept;

    // Fresh salt, verifier and key set. Returns the keys so the caller can start encrypting right away.
    [[nodiscard]] PasswordResult<photovault::crypto::ContainerKeys>
    initialize(const photovault::security::SecureString& password) noexcept;

    [[nodiscard]] PasswordResult<photovault::crypto::ContainerKeys>
    unlock(const photovault::security::SecureString& password) noexcept;

    [[nodiscard]] PasswordResult<bool> verifyPassword(const photovault::security::SecureString& password) noexcept;

    // Journals the change, re-encrypts every container, and stores the new credentials only when all of them
    // succeeded. Otherwise the old password stays valid and the report lists what is left; resume with
    // resumePasswordChange.
    [[nodiscard]] PasswordResult<RotationReport>
    changePassword(const photovault::security::SecureString& oldPassword,
                   const photovault::security::SecureString& newPassword,
                   std::span<const std::filesystem::path> containers, const RotationProgress& progress = {},
                   std::stop_token stop = {}) noexcept;

    [[nodiscard]] PasswordResult<RotationReport>
    resumePasswordChange(const photovault::security::SecureString& oldPassword,
                         std::span<const std::filesystem::path> containers, const RotationProgress& progress = {},
                         std::stop_token stop = {}) noexcept;

    [[nodiscard]] const std::filesystem::path& albumDir() const noexcept
    {
        return m_albumDir;
    }

private:
    photovault::crypto::ICryptoProvider* m_crypto{ nullptr };
    photovault::storage::ICredentialStore* m_store{ nullptr };
    std::filesystem::path m_albumDir;
    PasswordServiceOptions m_options;
    photovault::container::ContainerCodec m_codec;
};

} // namespace photovault::core

#endif // INCLUDE_PHOTOVAULT_CORE_PASSWORDSERVICE_HPP
