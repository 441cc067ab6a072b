#ifndef INCLUDE_PHOTOVAULT_STORAGE_ICREDENTIALSTORE_HPP
#define INCLUDE_PHOTOVAULT_STORAGE_ICREDENTIALSTORE_HPP

#include "photovault/crypto/ICryptoProvider.hpp"
#include "photovault/crypto/KdfParams.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace photovault::storage
{

using Verifier = std::array<std::uint8_t, photovault::crypto::g_kVerifierBytes>;

// Nothing here is secret: the verifier is a one-way HKDF output of the master key.
struct StoredCredentials final
{
    photovault::crypto::KdfSettings kdf{};
    Verifier verifier{};
};

enum class RotationStatus : std::uint8_t
{
    InProgress = 1,
    Failed = 2,
};

// Written before the first container is touched. `wrappedKeys` holds the new encryption and HMAC keys
// AEAD-encrypted under the old encryption key, so only the old password can resume.
struct RotationJournal final
{
    RotationStatus status{ RotationStatus::InProgress };
    std::int64_t startedAtUnixSeconds{};
    StoredCredentials next{};
    photovault::crypto::AeadBox wrappedKeys{};
    std::uint64_t totalContainers{};
};

class ICredentialStore
{
public:
    ICredentialStore() = default;
    ICredentialStore(const ICredentialStore&) = delete;
    ICredentialStore& operator=(const ICredentialStore&) = delete;
    ICredentialStore(ICredentialStore&&) = delete;
    ICredentialStore& operator=(ICredentialStore&&) = delete;
    virtual ~ICredentialStore() = default;

    [[nodiscard]] virtual bool exists(const std::filesystem::path& albumDir) const = 0;

    // Creates the album directory when missing. Throws std::invalid_argument if credentials already exist.
    virtual void initialize(const std::filesystem::path& albumDir, const StoredCredentials& credentials) = 0;

    // Throws CredentialsNotFound when the album was never initialized.
    [[nodiscard]] virtual StoredCredentials loadCredentials(const std::filesystem::path& albumDir) const = 0;

    virtual void storeCredentials(const std::filesystem::path& albumDir, const StoredCredentials& credentials) = 0;

    [[nodiscard]] virtual std::optional<RotationJournal> loadJournal(const std::filesystem::path& albumDir) const = 0;

    // Replaces any previous journal and forgets previously processed paths.
    virtual void beginRotation(const std::filesystem::path& albumDir, const RotationJournal& journal) = 0;

    virtual void setRotationStatus(const std::filesystem::path& albumDir, RotationStatus status) = 0;

    virtual void markProcessed(const std::filesystem::path& albumDir, const std::string& containerPath) = 0;

    [[nodiscard]] virtual std::vector<std::string> processedPaths(const std::filesystem::path& albumDir) const = 0;

    // Stores `credentials` and drops the journal in one transaction.
    virtual void commitRotation(const std::filesystem::path& albumDir, const StoredCredentials& credentials) = 0;
};

} // namespace photovault::storage

#endif // INCLUDE_PHOTOVAULT_STORAGE_ICREDENTIALSTORE_HPP
