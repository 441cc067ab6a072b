#include "photovault/core/PasswordService.hpp"
#include "photovault/core/KdfPolicy.hpp"
#include "photovault/crypto/KeyDerivation.hpp"
#include "photovault/security/SecureEquals.hpp"
#include "photovault/storage/StorageErrors.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <new>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace photovault::core
{
namespace
{

using photovault::crypto::ContainerKeys;
using photovault::crypto::DerivedKeyMaterial;
using photovault::security::SecureBuffer;
using photovault::security::SecureString;

constexpr std::string_view g_kRotationWrapContext{ "photovault.rotation.v1" };

[[nodiscard]] std::int64_t unixSecondsNow() noexcept
{
    using Clock = std::chrono::system_clock;
    const auto secs{ std::chrono::duration_cast<std::chrono::seconds>(Clock::now().time_since_epoch()) };
    return std::max<std::int64_t>(secs.count(), 0);
}

[[nodiscard]] photovault::storage::Verifier toVerifier(const SecureBuffer& verifier)
{
    photovault::storage::Verifier out{};
    std::copy_n(verifier.begin(), std::min(verifier.size(), out.size()), out.begin());
    return out;
}

// Stable identity of a container across runs, used by the processed-path journal.
[[nodiscard]] std::string journalKey(const std::filesystem::path& path)
{
    std::error_code ec{};
    auto canonical{ std::filesystem::weakly_canonical(path, ec) };
    if (ec)
    {
        return path.lexically_normal().string();
    }
    return canonical.string();
}

[[nodiscard]] std::vector<std::byte> wrapAad(const photovault::crypto::KdfSalt& newSalt)
{
    std::vector<std::byte> aad{};
    aad.reserve(g_kRotationWrapContext.size() + newSalt.size());
    for (const char c : g_kRotationWrapContext)
    {
        aad.push_back(static_cast<std::byte>(c));
    }
    for (const auto b : newSalt)
    {
        aad.push_back(static_cast<std::byte>(b));
    }
    return aad;
}

[[nodiscard]] photovault::crypto::AeadBox wrapKeys(photovault::crypto::ICryptoProvider& crypto,
                                                   const ContainerKeys& oldKeys, const ContainerKeys& newKeys,
                                                   const photovault::crypto::KdfSalt& newSalt)
{
    const auto encryptionKey{ newKeys.encryptionKey() };
    const auto hmacKey{ newKeys.hmacKey() };
    SecureBuffer plain{};
    plain.reserve(encryptionKey.size() + hmacKey.size());
    plain.insert(plain.end(), encryptionKey.begin(), encryptionKey.end());
    plain.insert(plain.end(), hmacKey.begin(), hmacKey.end());

    const auto aad{ wrapAad(newSalt) };
    auto box{ crypto.aeadEncrypt(oldKeys.encryptionKey(), photovault::security::asBytes(plain),
                                 std::span<const std::byte>{ aad }) };
    photovault::security::secureRelease(plain);
    return box;
}

[[nodiscard]] std::optional<ContainerKeys> unwrapKeys(photovault::crypto::ICryptoProvider& crypto,
                                                      const ContainerKeys& oldKeys,
                                                      const photovault::crypto::AeadBox& box,
                                                      const photovault::crypto::KdfSalt& newSalt)
{
    const auto aad{ wrapAad(newSalt) };
    auto plain{ crypto.aeadDecrypt(oldKeys.encryptionKey(), box, std::span<const std::byte>{ aad }) };
    if (!plain)
    {
        return std::nullopt;
    }
    if (plain->size() != photovault::crypto::g_aeadKeyBytes * 2U)
    {
        photovault::security::secureRelease(*plain);
        return std::nullopt;
    }
    const auto whole{ photovault::security::asSpan(*plain) };
    auto encryptionKey{ photovault::security::secureCopy(whole.first(photovault::crypto::g_aeadKeyBytes)) };
    auto hmacKey{ photovault::security::secureCopy(whole.last(photovault::crypto::g_aeadKeyBytes)) };
    photovault::security::secureRelease(*plain);
    return ContainerKeys{ std::move(encryptionKey), std::move(hmacKey) };
}

[[nodiscard]] PasswordResult<photovault::storage::StoredCredentials>
loadCredentialsOrError(const photovault::storage::ICredentialStore& store,
                       const std::filesystem::path& albumDir) noexcept
{
    try
    {
        return store.loadCredentials(albumDir);
    }
    catch (const photovault::storage::CredentialsNotFound&)
    {
        return PasswordError::NotInitialized;
    }
    catch (const std::exception&)
    {
        return PasswordError::StorageError;
    }
}

[[nodiscard]] PasswordResult<std::optional<photovault::storage::RotationJournal>>
loadJournalOrError(const photovault::storage::ICredentialStore& store, const std::filesystem::path& albumDir) noexcept
{
    try
    {
        return store.loadJournal(albumDir);
    }
    catch (const photovault::storage::CredentialsNotFound&)
    {
        return PasswordError::NotInitialized;
    }
    catch (const std::exception&)
    {
        return PasswordError::StorageError;
    }
}

[[nodiscard]] PasswordResult<DerivedKeyMaterial> deriveOrError(const photovault::crypto::ICryptoProvider& crypto,
                                                               const SecureString& password,
                                                               const photovault::crypto::KdfSettings& settings) noexcept
{
    try
    {
        return photovault::crypto::deriveKeyMaterial(crypto, photovault::security::asBytes(password), settings);
    }
    catch (const std::exception&)
    {
        // Covers KeyDerivationError, allocation failure and stored parameters outside the accepted range.
        return PasswordError::KeyDerivationFailed;
    }
}

// Derives with the stored parameters and compares verifiers in constant time.
[[nodiscard]] PasswordResult<DerivedKeyMaterial> authenticate(const photovault::crypto::ICryptoProvider& crypto,
                                                              const photovault::storage::ICredentialStore& store,
                                                              const std::filesystem::path& albumDir,
                                                              const SecureString& password) noexcept
{
    if (password.empty())
    {
        return PasswordError::InvalidPassword;
    }

    auto credentialsOrErr{ loadCredentialsOrError(store, albumDir) };
    if (std::holds_alternative<PasswordError>(credentialsOrErr))
    {
        return std::get<PasswordError>(credentialsOrErr);
    }
    const auto& credentials{ std::get<photovault::storage::StoredCredentials>(credentialsOrErr) };

    auto materialOrErr{ deriveOrError(crypto, password, credentials.kdf) };
    if (std::holds_alternative<PasswordError>(materialOrErr))
    {
        return std::get<PasswordError>(materialOrErr);
    }
    auto& material{ std::get<DerivedKeyMaterial>(materialOrErr) };

    if (!photovault::security::secureEquals(photovault::security::asSpan(material.verifier),
                                            std::span<const std::uint8_t>{ credentials.verifier }))
    {
        return PasswordError::InvalidPassword;
    }
    return std::move(material);
}

struct RotationContext final
{
    photovault::container::ContainerCodec* codec{ nullptr };
    photovault::storage::ICredentialStore* store{ nullptr };
    const std::filesystem::path* albumDir{ nullptr };
    std::size_t maxConcurrent{ g_kDefaultMaxConcurrentRotations };
    // Set when resuming: a crash or journal write failure may have left rotated containers unrecorded.
    bool reconcileJournal{ false };
};

// Records containers that already open under `newKeys` but are missing from the journal. Returns false when
// the journal could not be updated; such containers are still skipped for this run.
[[nodiscard]] bool reconcileRotated(const RotationContext& ctx, std::span<const std::filesystem::path> containers,
                                    const ContainerKeys& newKeys, std::set<std::string>& processed)
{
    bool journalOk{ true };
    for (const auto& path : containers)
    {
        auto key{ journalKey(path) };
        if (processed.contains(key))
        {
            continue;
        }
        const auto rotated{ ctx.codec->authenticatesWith(path, newKeys) };
        const auto* yes{ std::get_if<bool>(&rotated) };
        if (yes == nullptr || !*yes)
        {
            // Errors surface from the rekey attempt itself.
            continue;
        }
        try
        {
            ctx.store->markProcessed(*ctx.albumDir, key);
        }
        catch (const std::exception&)
        {
            journalOk = false;
        }
        processed.insert(std::move(key));
    }
    return journalOk;
}

[[nodiscard]] PasswordResult<RotationReport>
runRotation(const RotationContext& ctx, std::span<const std::filesystem::path> containers,
            const ContainerKeys& oldKeys, const ContainerKeys& newKeys,
            const photovault::storage::StoredCredentials& next, const RotationProgress& progress,
            std::stop_token stop) noexcept
{
    std::set<std::string> processed{};
    try
    {
        for (auto& p : ctx.store->processedPaths(*ctx.albumDir))
        {
            processed.insert(std::move(p));
        }
    }
    catch (const std::exception&)
    {
        return PasswordError::StorageError;
    }

    bool journalWriteFailed{ false };
    if (ctx.reconcileJournal)
    {
        try
        {
            journalWriteFailed = !reconcileRotated(ctx, containers, newKeys, processed);
        }
        catch (const std::bad_alloc&)
        {
            return PasswordError::StorageError;
        }
    }

    const std::size_t total{ containers.size() };
    std::size_t done{};

    const auto reportProgress = [&]() {
        ++done;
        if (progress)
        {
            progress(done, total);
        }
    };
    const CollectionRekeyer::SkipPredicate alreadyRotated = [&](const std::filesystem::path& path) {
        if (!processed.contains(journalKey(path)))
        {
            return false;
        }
        reportProgress();
        return true;
    };
    const CollectionRekeyer::RotatedCallback onRotated = [&](const std::filesystem::path& path) {
        try
        {
            ctx.store->markProcessed(*ctx.albumDir, journalKey(path));
        }
        catch (const std::exception&)
        {
            journalWriteFailed = true;
        }
        reportProgress();
    };

    RotationReport report{};
    try
    {
        const CollectionRekeyer rekeyer{ *ctx.codec, ctx.maxConcurrent };
        report = rekeyer.run(containers, oldKeys, newKeys, alreadyRotated, onRotated, stop);
    }
    catch (const std::exception&)
    {
        // Worker threads could not be started; nothing was rotated.
        return PasswordError::StorageError;
    }

    if (report.failed.empty() && !report.cancelled && !journalWriteFailed)
    {
        try
        {
            ctx.store->commitRotation(*ctx.albumDir, next);
        }
        catch (const std::exception&)
        {
            return PasswordError::StorageError;
        }
        report.committed = true;
        return report;
    }

    try
    {
        ctx.store->setRotationStatus(*ctx.albumDir, photovault::storage::RotationStatus::Failed);
    }
    catch (const std::exception&)
    {
        return PasswordError::StorageError;
    }
    return report;
}

} // namespace

PasswordServiceOptions defaultPasswordServiceOptions() noexcept
{
    return PasswordServiceOptions{
        .kdf = defaultKdfParams(),
        .maxConcurrentRotations = g_kDefaultMaxConcurrentRotations,
        .container = {},
    };
}

PasswordService::PasswordService(photovault::crypto::ICryptoProvider& crypto,
                                 photovault::storage::ICredentialStore& store, std::filesystem::path albumDir,
                                 PasswordServiceOptions options)
    : m_crypto(&crypto), m_store(&store), m_albumDir(std::move(albumDir)), m_options(std::move(options)),
      m_codec(crypto, m_options.container)
{
    if (m_options.maxConcurrentRotations == 0U)
    {
        throw std::invalid_argument("PasswordService: maxConcurrentRotations must be at least 1");
    }
}

PasswordResult<std::monostate> PasswordService::validatePassword(const SecureString& password) noexcept
{
    if (password.size() < g_kMinPasswordBytes)
    {
        return PasswordError::PasswordTooShort;
    }
    if (password.size() > g_kMaxPasswordBytes)
    {
        return PasswordError::PasswordTooLong;
    }
    return std::monostate{};
}

bool PasswordService::isInitialized() const noexcept
{
    try
    {
        return m_store->exists(m_albumDir);
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool PasswordService::hasPendingRotation() const noexcept
{
    const auto journalOrErr{ loadJournalOrError(*m_store, m_albumDir) };
    const auto* journal{ std::get_if<std::optional<photovault::storage::RotationJournal>>(&journalOrErr) };
    return journal != nullptr && journal->has_value();
}

PasswordResult<ContainerKeys> PasswordService::initialize(const SecureString& password) noexcept
{
    const auto valid{ validatePassword(password) };
    if (std::holds_alternative<PasswordError>(valid))
    {
        return std::get<PasswordError>(valid);
    }
    if (isInitialized())
    {
        return PasswordError::AlreadyInitialized;
    }

    const auto settingsOpt{ makeKdfSettings(m_options.kdf) };
    if (!settingsOpt)
    {
        return PasswordError::RandomFailed;
    }

    auto materialOrErr{ deriveOrError(*m_crypto, password, *settingsOpt) };
    if (std::holds_alternative<PasswordError>(materialOrErr))
    {
        return std::get<PasswordError>(materialOrErr);
    }
    auto& material{ std::get<DerivedKeyMaterial>(materialOrErr) };

    try
    {
        m_store->initialize(m_albumDir, photovault::storage::StoredCredentials{
                                            .kdf = *settingsOpt, .verifier = toVerifier(material.verifier) });
    }
    catch (const std::invalid_argument&)
    {
        return PasswordError::AlreadyInitialized;
    }
    catch (const std::exception&)
    {
        return PasswordError::StorageError;
    }
    return std::move(material.keys);
}

PasswordResult<ContainerKeys> PasswordService::unlock(const SecureString& password) noexcept
{
    auto materialOrErr{ authenticate(*m_crypto, *m_store, m_albumDir, password) };
    if (std::holds_alternative<PasswordError>(materialOrErr))
    {
        return std::get<PasswordError>(materialOrErr);
    }
    return std::move(std::get<DerivedKeyMaterial>(materialOrErr).keys);
}

PasswordResult<bool> PasswordService::verifyPassword(const SecureString& password) noexcept
{
    const auto materialOrErr{ authenticate(*m_crypto, *m_store, m_albumDir, password) };
    if (const auto* error{ std::get_if<PasswordError>(&materialOrErr) }; error != nullptr)
    {
        if (*error == PasswordError::InvalidPassword)
        {
            return false;
        }
        return *error;
    }
    return true;
}

PasswordResult<RotationReport> PasswordService::changePassword(const SecureString& oldPassword,
                                                               const SecureString& newPassword,
                                                               std::span<const std::filesystem::path> containers,
                                                               const RotationProgress& progress,
                                                               std::stop_token stop) noexcept
{
    const auto journalOrErr{ loadJournalOrError(*m_store, m_albumDir) };
    if (std::holds_alternative<PasswordError>(journalOrErr))
    {
        return std::get<PasswordError>(journalOrErr);
    }
    if (std::get<std::optional<photovault::storage::RotationJournal>>(journalOrErr).has_value())
    {
        return PasswordError::RotationIncomplete;
    }

    const auto valid{ validatePassword(newPassword) };
    if (std::holds_alternative<PasswordError>(valid))
    {
        return std::get<PasswordError>(valid);
    }

    auto currentOrErr{ authenticate(*m_crypto, *m_store, m_albumDir, oldPassword) };
    if (std::holds_alternative<PasswordError>(currentOrErr))
    {
        return std::get<PasswordError>(currentOrErr);
    }
    const auto& current{ std::get<DerivedKeyMaterial>(currentOrErr) };

    const auto settingsOpt{ makeKdfSettings(m_options.kdf) };
    if (!settingsOpt)
    {
        return PasswordError::RandomFailed;
    }
    auto nextOrErr{ deriveOrError(*m_crypto, newPassword, *settingsOpt) };
    if (std::holds_alternative<PasswordError>(nextOrErr))
    {
        return std::get<PasswordError>(nextOrErr);
    }
    const auto& next{ std::get<DerivedKeyMaterial>(nextOrErr) };

    photovault::storage::RotationJournal journal{};
    journal.status = photovault::storage::RotationStatus::InProgress;
    journal.startedAtUnixSeconds = unixSecondsNow();
    journal.next = photovault::storage::StoredCredentials{ .kdf = *settingsOpt,
                                                           .verifier = toVerifier(next.verifier) };
    journal.totalContainers = containers.size();
    try
    {
        journal.wrappedKeys = wrapKeys(*m_crypto, current.keys, next.keys, settingsOpt->salt);
    }
    catch (const std::exception&)
    {
        return PasswordError::CryptoError;
    }

    try
    {
        m_store->beginRotation(m_albumDir, journal);
    }
    catch (const std::exception&)
    {
        return PasswordError::StorageError;
    }

    const RotationContext ctx{ .codec = &m_codec,
                               .store = m_store,
                               .albumDir = &m_albumDir,
                               .maxConcurrent = m_options.maxConcurrentRotations };
    return runRotation(ctx, containers, current.keys, next.keys, journal.next, progress, stop);
}

PasswordResult<RotationReport> PasswordService::resumePasswordChange(const SecureString& oldPassword,
                                                                     std::span<const std::filesystem::path> containers,
                                                                     const RotationProgress& progress,
                                                                     std::stop_token stop) noexcept
{
    const auto journalOrErr{ loadJournalOrError(*m_store, m_albumDir) };
    if (std::holds_alternative<PasswordError>(journalOrErr))
    {
        return std::get<PasswordError>(journalOrErr);
    }
    const auto& journalOpt{ std::get<std::optional<photovault::storage::RotationJournal>>(journalOrErr) };
    if (!journalOpt)
    {
        return PasswordError::NoPendingRotation;
    }
    const auto& journal{ *journalOpt };

    auto currentOrErr{ authenticate(*m_crypto, *m_store, m_albumDir, oldPassword) };
    if (std::holds_alternative<PasswordError>(currentOrErr))
    {
        return std::get<PasswordError>(currentOrErr);
    }
    const auto& current{ std::get<DerivedKeyMaterial>(currentOrErr) };

    std::optional<ContainerKeys> nextKeys{};
    try
    {
        nextKeys = unwrapKeys(*m_crypto, current.keys, journal.wrappedKeys, journal.next.kdf.salt);
    }
    catch (const std::exception&)
    {
        return PasswordError::CryptoError;
    }
    if (!nextKeys)
    {
        // The old password verified, so the journal itself is damaged.
        return PasswordError::CryptoError;
    }

    try
    {
        m_store->setRotationStatus(m_albumDir, photovault::storage::RotationStatus::InProgress);
    }
    catch (const std::exception&)
    {
        return PasswordError::StorageError;
    }

    const RotationContext ctx{ .codec = &m_codec,
                               .store = m_store,
                               .albumDir = &m_albumDir,
                               .maxConcurrent = m_options.maxConcurrentRotations,
                               .reconcileJournal = true };
    return runRotation(ctx, containers, current.keys, *nextKeys, journal.next, progress, stop);
}

} // namespace photovault::core
