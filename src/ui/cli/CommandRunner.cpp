#include "CommandRunner.hpp"

#include "photovault/container/ContainerCodec.hpp"
#include "photovault/container/ContainerRekey.hpp"
#include "photovault/container/SecureDelete.hpp"
#include "photovault/container/TemporaryFiles.hpp"
#include "photovault/core/CollectionRekeyer.hpp"
#include "photovault/core/IKeyProvider.hpp"
#include "photovault/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include <unistd.h>

namespace photovault::ui::cli
{
namespace
{

using photovault::container::ContainerCodec;
using photovault::container::ContainerErrc;
using photovault::container::ContainerError;
using photovault::container::ContainerInfo;
using photovault::container::ContainerResult;
using photovault::container::MediaMetadata;
using photovault::container::MediaType;
using photovault::container::OperationCancelled;
using photovault::core::PasswordError;

template <class T> [[nodiscard]] std::optional<int> reportFailure(std::ostream& err, const ContainerResult<T>& result)
{
    if (const auto* error{ std::get_if<ContainerError>(&result) }; error != nullptr)
    {
        err << "error: " << photovault::container::describe(*error) << '\n';
        return exitCodeFor(*error);
    }
    if (std::holds_alternative<OperationCancelled>(result))
    {
        err << "cancelled\n";
        return g_kExitCancelled;
    }
    return std::nullopt;
}

[[nodiscard]] std::string_view mediaTypeName(MediaType type) noexcept
{
    return type == MediaType::Video ? "video" : "photo";
}

[[nodiscard]] std::string formatUtc(MediaMetadata::TimePoint tp)
{
    const auto secs{ std::chrono::floor<std::chrono::seconds>(tp) };
    const std::time_t t{ static_cast<std::time_t>(secs.time_since_epoch().count()) };
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr)
    {
        return std::to_string(secs.time_since_epoch().count()) + "s";
    }
    std::ostringstream os{};
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

void printMetadata(std::ostream& out, const MediaMetadata& md)
{
    out << "filename: " << md.filename << '\n';
    out << "created: " << formatUtc(md.creationDate) << '\n';
    if (md.originalAssetIdentifier)
    {
        out << "asset id: " << *md.originalAssetIdentifier << '\n';
    }
    if (md.durationSeconds)
    {
        out << "duration: " << *md.durationSeconds << " s\n";
    }
    if (md.location)
    {
        out << "location: " << md.location->latitude << ", " << md.location->longitude << '\n';
    }
    if (md.isFavorite)
    {
        out << "favorite: " << (*md.isFavorite ? "yes" : "no") << '\n';
    }
}

[[nodiscard]] MediaMetadata::TimePoint creationTimeOf(const std::filesystem::path& source)
{
    std::error_code ec{};
    const auto written{ std::filesystem::last_write_time(source, ec) };
    if (ec)
    {
        return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
    }
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::file_clock::to_sys(written));
}

// Directories expand to the containers directly inside them. Staging leftovers are never rotated.
[[nodiscard]] std::vector<std::filesystem::path> collectContainers(const std::vector<std::string>& inputs)
{
    std::vector<std::filesystem::path> out{};
    for (const auto& input : inputs)
    {
        const std::filesystem::path p{ input };
        std::error_code ec{};
        if (!std::filesystem::is_directory(p, ec))
        {
            out.push_back(p);
            continue;
        }

        std::vector<std::filesystem::path> found{};
        for (const auto& entry : std::filesystem::directory_iterator{ p })
        {
            if (!entry.is_regular_file(ec))
            {
                continue;
            }
            const auto name{ entry.path().filename().string() };
            if (name.find(photovault::container::g_kStagingSuffix) != std::string::npos)
            {
                continue;
            }
            if (std::holds_alternative<ContainerInfo>(ContainerCodec::readContainerInfo(entry.path())))
            {
                found.push_back(entry.path());
            }
        }
        std::sort(found.begin(), found.end());
        out.insert(out.end(), found.begin(), found.end());
    }
    return out;
}

// Moves the decrypted file to `outPath` without replacing anything already there.
[[nodiscard]] std::optional<std::string> placeDecryptedFile(const std::filesystem::path& tmp,
                                                            const std::filesystem::path& outPath)
{
    std::error_code ec{};
    if (::link(tmp.c_str(), outPath.c_str()) == 0)
    {
        std::filesystem::remove(tmp, ec);
        return std::nullopt;
    }
    const int err{ errno };
    if (err != EXDEV)
    {
        std::filesystem::remove(tmp, ec);
        return std::generic_category().message(err);
    }

    auto failure{ copyWithoutReplacing(tmp, outPath) };
    std::filesystem::remove(tmp, ec);
    return failure;
}

} // namespace

std::optional<std::string> copyWithoutReplacing(const std::filesystem::path& from, const std::filesystem::path& to)
{
    std::error_code ec{};
    const bool copied{ std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec) };
    if (copied && !ec)
    {
        return std::nullopt;
    }
    std::string reason{ ec ? ec.message() : std::string{ "copy failed" } };

    // Only file_exists means `to` was someone else's; any other failure may have left a truncated copy behind.
    if (ec != std::errc::file_exists)
    {
        std::error_code removeEc{};
        std::filesystem::remove(to, removeEc);
    }
    return reason;
}

int exitCodeFor(const ContainerError& error) noexcept
{
    switch (error.code)
    {
    case ContainerErrc::InvalidFileFormat:
    case ContainerErrc::DecryptionFailed:
        return g_kExitIntegrity;
    case ContainerErrc::FileAlreadyExists:
    case ContainerErrc::FileNotFound:
    case ContainerErrc::IoError:
        return g_kExitIo;
    case ContainerErrc::CryptoError:
        return g_kExitFailure;
    }
    return g_kExitFailure;
}

int exitCodeFor(PasswordError error) noexcept
{
    switch (error)
    {
    case PasswordError::InvalidPassword:
        return g_kExitAuth;
    case PasswordError::PasswordTooShort:
    case PasswordError::PasswordTooLong:
        return g_kExitUsage;
    case PasswordError::StorageError:
        return g_kExitIo;
    default:
        return g_kExitFailure;
    }
}

CommandRunner::CommandRunner(photovault::crypto::ICryptoProvider& crypto, photovault::storage::ICredentialStore& store,
                             std::ostream& out, std::ostream& err, PasswordReader pwdReader,
                             photovault::core::PasswordServiceOptions serviceOptions, std::stop_token stop)
    : m_crypto(crypto), m_store(store), m_out(out), m_err(err), m_pwdReader(std::move(pwdReader)),
      m_serviceOptions(std::move(serviceOptions)), m_stop(std::move(stop))
{
}

int CommandRunner::run(const std::vector<std::string>& args)
{
    CLI::App app{ "PhotoVault: encrypted photo and video containers", "pvault" };
    app.require_subcommand(1);

    std::string tempDir;
    app.add_option("--temp-dir", tempDir, "Directory for decrypted temporary files");

    std::string albumArg;
    std::string containerArg;

    auto* subInit = app.add_subcommand("init", "Create album credentials (prompts for a new password)");
    subInit->add_option("album", albumArg, "Album directory")->required();

    EncryptArgs enc{};
    std::string sourceArg;
    std::string destArg;
    auto* subEncrypt = app.add_subcommand("encrypt", "Encrypt a photo or video into a container");
    subEncrypt->add_option("album", albumArg, "Album directory")->required();
    subEncrypt->add_option("source", sourceArg, "Plaintext media file")->required()->check(CLI::ExistingFile);
    subEncrypt->add_option("dest", destArg, "Container to create (never overwritten)")->required();
    subEncrypt->add_flag("--video", enc.video, "Mark the content as video");
    subEncrypt->add_flag("--no-metadata", enc.noMetadata, "Do not store a metadata block");
    subEncrypt->add_option("--name", enc.name, "Original filename (defaults to the source name)");
    subEncrypt->add_option("--asset-id", enc.assetId, "Original library asset identifier");
    auto* durationOpt = subEncrypt->add_option("--duration", enc.durationSeconds, "Duration in seconds");
    auto* latOpt = subEncrypt->add_option("--lat", enc.latitude, "Latitude")->check(CLI::Range(-90.0, 90.0));
    auto* lonOpt = subEncrypt->add_option("--lon", enc.longitude, "Longitude")->check(CLI::Range(-180.0, 180.0));
    latOpt->needs(lonOpt);
    lonOpt->needs(latOpt);
    subEncrypt->add_flag("--favorite", enc.favorite, "Mark as favorite");

    std::string outArg;
    auto* subDecrypt = app.add_subcommand("decrypt", "Decrypt a container (to --out, or to a temporary file)");
    subDecrypt->add_option("album", albumArg, "Album directory")->required();
    subDecrypt->add_option("container", containerArg, "Container file")->required();
    subDecrypt->add_option("--out", outArg, "Output file (never overwritten)");

    auto* subInfo = app.add_subcommand("info", "Show the plaintext header of a container");
    subInfo->add_option("container", containerArg, "Container file")->required();

    auto* subMeta = app.add_subcommand("meta", "Show the decrypted metadata of a container");
    subMeta->add_option("album", albumArg, "Album directory")->required();
    subMeta->add_option("container", containerArg, "Container file")->required();

    std::vector<std::string> passwdInputs;
    bool resume{ false };
    auto* subPasswd = app.add_subcommand("passwd", "Change the password and re-encrypt every container");
    subPasswd->add_option("album", albumArg, "Album directory")->required();
    subPasswd->add_option("containers", passwdInputs, "Container files or directories of containers")->required();
    subPasswd->add_flag("--resume", resume, "Finish an interrupted password change");

    std::string shredArg;
    auto* subShred = app.add_subcommand("shred", "Overwrite and delete a file");
    subShred->add_option("file", shredArg, "File to destroy")->required();

    unsigned olderThanMinutes{ 60U };
    auto* subCleanup = app.add_subcommand("cleanup-temp", "Delete stale decrypted temporary files");
    subCleanup->add_option("--older-than-minutes", olderThanMinutes, "Minimum age")->capture_default_str();

    try
    {
        std::vector<const char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(arg.c_str());
        }
        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e, m_out, m_err) == 0 ? g_kExitOk : g_kExitUsage;
    }

    if (!tempDir.empty())
    {
        m_serviceOptions.container.temporaryDirectory = tempDir;
    }

    try
    {
        if (*subInit)
        {
            return doInit(albumArg);
        }
        if (*subEncrypt)
        {
            enc.albumDir = albumArg;
            enc.source = sourceArg;
            enc.destination = destArg;
            enc.hasDuration = durationOpt->count() > 0U;
            enc.hasLocation = latOpt->count() > 0U;
            return doEncrypt(enc);
        }
        if (*subDecrypt)
        {
            return doDecrypt(albumArg, containerArg, outArg);
        }
        if (*subInfo)
        {
            return doInfo(containerArg);
        }
        if (*subMeta)
        {
            return doMeta(albumArg, containerArg);
        }
        if (*subPasswd)
        {
            return doPasswd(albumArg, collectContainers(passwdInputs), resume);
        }
        if (*subShred)
        {
            return doShred(shredArg);
        }
        if (*subCleanup)
        {
            return doCleanupTemp(olderThanMinutes);
        }
    }
    catch (const std::exception& e)
    {
        m_err << "fatal: " << e.what() << '\n';
        return g_kExitFailure;
    }
    return g_kExitUsage;
}

photovault::core::PasswordService CommandRunner::makeService(const std::filesystem::path& albumDir) const
{
    return photovault::core::PasswordService{ m_crypto, m_store, albumDir, m_serviceOptions };
}

int CommandRunner::report(PasswordError error)
{
    m_err << "error: " << photovault::core::describe(error) << '\n';
    return exitCodeFor(error);
}

photovault::core::PasswordResult<photovault::crypto::ContainerKeys>
CommandRunner::unlockAlbum(photovault::core::PasswordService& service)
{
    if (service.hasPendingRotation())
    {
        m_err << "warning: a password change is unfinished; some containers may already use the new password. "
                 "Run `pvault passwd --resume`.\n";
    }
    photovault::core::PasswordKeyProvider provider{ service, [this]() { return m_pwdReader("Password: "); } };
    return provider.unlock();
}

int CommandRunner::doInit(const std::filesystem::path& albumDir)
{
    auto service{ makeService(albumDir) };
    if (service.isInitialized())
    {
        return report(PasswordError::AlreadyInitialized);
    }

    auto p1 = m_pwdReader("New password: ");
    auto wipeP1 = photovault::security::scopeWipe(p1);

    auto p2 = m_pwdReader("Confirm password: ");
    auto wipeP2 = photovault::security::scopeWipe(p2);

    if (photovault::security::asStringView(p1) != photovault::security::asStringView(p2))
    {
        m_err << "error: passwords do not match\n";
        return g_kExitUsage;
    }

    const auto result{ service.initialize(p1) };
    if (const auto* error{ std::get_if<PasswordError>(&result) }; error != nullptr)
    {
        return report(*error);
    }
    m_out << "album initialized: " << albumDir.string() << '\n';
    return g_kExitOk;
}

int CommandRunner::doEncrypt(const EncryptArgs& a)
{
    auto service{ makeService(a.albumDir) };
    auto keysOrErr{ unlockAlbum(service) };
    if (const auto* error{ std::get_if<PasswordError>(&keysOrErr) }; error != nullptr)
    {
        return report(*error);
    }
    const auto& keys{ std::get<photovault::crypto::ContainerKeys>(keysOrErr) };

    std::optional<MediaMetadata> metadata{};
    if (!a.noMetadata)
    {
        MediaMetadata md{};
        md.filename = a.name.empty() ? a.source.filename().string() : a.name;
        md.creationDate = creationTimeOf(a.source);
        if (!a.assetId.empty())
        {
            md.originalAssetIdentifier = a.assetId;
        }
        if (a.hasDuration)
        {
            md.durationSeconds = a.durationSeconds;
        }
        if (a.hasLocation)
        {
            md.location = photovault::container::GeoLocation{ .latitude = a.latitude, .longitude = a.longitude };
        }
        if (a.favorite)
        {
            md.isFavorite = true;
        }
        metadata = std::move(md);
    }

    ContainerCodec codec{ m_crypto, m_serviceOptions.container };
    const auto result{ codec.writeContainerFromFile(a.source, a.video ? MediaType::Video : MediaType::Photo, metadata,
                                                    keys, a.destination, {}, m_stop) };
    if (const auto code{ reportFailure(m_err, result) })
    {
        return *code;
    }
    m_out << "encrypted " << a.source.string() << " -> " << a.destination.string() << '\n';
    return g_kExitOk;
}

int CommandRunner::doDecrypt(const std::filesystem::path& albumDir, const std::filesystem::path& container,
                             const std::filesystem::path& outPath)
{
    std::error_code ec{};
    if (!outPath.empty() && std::filesystem::exists(outPath, ec))
    {
        m_err << "error: refusing to overwrite " << outPath.string() << '\n';
        return g_kExitIo;
    }

    auto service{ makeService(albumDir) };
    auto keysOrErr{ unlockAlbum(service) };
    if (const auto* error{ std::get_if<PasswordError>(&keysOrErr) }; error != nullptr)
    {
        return report(*error);
    }
    const auto& keys{ std::get<photovault::crypto::ContainerKeys>(keysOrErr) };

    ContainerCodec codec{ m_crypto, m_serviceOptions.container };

    // The stored filename gives the temporary file an extension viewers recognize.
    std::optional<std::string> extension{};
    const auto metadata{ codec.readMetadata(container, keys) };
    if (const auto* md{ std::get_if<std::optional<MediaMetadata>>(&metadata) }; md != nullptr && md->has_value())
    {
        const auto ext{ std::filesystem::path{ (*md)->filename }.extension().string() };
        if (!ext.empty())
        {
            extension = ext;
        }
    }

    const auto tmpOrErr{ codec.readContainerToTemporaryFile(container, keys, extension, {}, m_stop) };
    if (const auto code{ reportFailure(m_err, tmpOrErr) })
    {
        return *code;
    }
    const auto& tmp{ std::get<std::filesystem::path>(tmpOrErr) };

    if (outPath.empty())
    {
        m_out << tmp.string() << '\n';
        return g_kExitOk;
    }

    if (const auto failure{ placeDecryptedFile(tmp, outPath) })
    {
        m_err << "error: cannot write " << outPath.string() << ": " << *failure << '\n';
        return g_kExitIo;
    }
    m_out << "decrypted " << container.string() << " -> " << outPath.string() << '\n';
    return g_kExitOk;
}

int CommandRunner::doInfo(const std::filesystem::path& container)
{
    const auto infoOrErr{ ContainerCodec::readContainerInfo(container) };
    if (const auto code{ reportFailure(m_err, infoOrErr) })
    {
        return *code;
    }
    const auto& info{ std::get<ContainerInfo>(infoOrErr) };
    m_out << "format version: " << static_cast<unsigned>(info.header.version) << '\n';
    m_out << "media type: " << mediaTypeName(info.header.mediaType) << '\n';
    m_out << "original size: " << info.header.originalSize << " bytes\n";
    m_out << "chunk size: " << info.header.chunkSize << " bytes\n";
    m_out << "metadata: " << info.header.metadataLength << " bytes\n";
    m_out << "header: " << info.headerBytes.size() << " bytes\n";
    return g_kExitOk;
}

int CommandRunner::doMeta(const std::filesystem::path& albumDir, const std::filesystem::path& container)
{
    auto service{ makeService(albumDir) };
    auto keysOrErr{ unlockAlbum(service) };
    if (const auto* error{ std::get_if<PasswordError>(&keysOrErr) }; error != nullptr)
    {
        return report(*error);
    }
    const auto& keys{ std::get<photovault::crypto::ContainerKeys>(keysOrErr) };

    ContainerCodec codec{ m_crypto, m_serviceOptions.container };
    const auto metadataOrErr{ codec.readMetadata(container, keys) };
    if (const auto code{ reportFailure(m_err, metadataOrErr) })
    {
        return *code;
    }
    const auto& metadata{ std::get<std::optional<MediaMetadata>>(metadataOrErr) };
    if (!metadata)
    {
        m_out << "(no metadata)\n";
        return g_kExitOk;
    }
    printMetadata(m_out, *metadata);
    return g_kExitOk;
}

int CommandRunner::doPasswd(const std::filesystem::path& albumDir,
                            const std::vector<std::filesystem::path>& containers, bool resume)
{
    auto service{ makeService(albumDir) };

    auto oldPassword = m_pwdReader("Current password: ");
    auto wipeOld = photovault::security::scopeWipe(oldPassword);

    const photovault::core::RotationProgress progress = [this](std::size_t done, std::size_t total) {
        m_out << "\rre-encrypted " << done << '/' << total << std::flush;
    };

    photovault::core::PasswordResult<photovault::core::RotationReport> result{ PasswordError::StorageError };
    if (resume)
    {
        result = service.resumePasswordChange(oldPassword, containers, progress, m_stop);
    }
    else
    {
        auto p1 = m_pwdReader("New password: ");
        auto wipeP1 = photovault::security::scopeWipe(p1);

        auto p2 = m_pwdReader("Confirm new password: ");
        auto wipeP2 = photovault::security::scopeWipe(p2);

        if (photovault::security::asStringView(p1) != photovault::security::asStringView(p2))
        {
            m_err << "error: passwords do not match\n";
            return g_kExitUsage;
        }
        result = service.changePassword(oldPassword, p1, containers, progress, m_stop);
    }
    if (!containers.empty())
    {
        m_out << '\n';
    }

    if (const auto* error{ std::get_if<PasswordError>(&result) }; error != nullptr)
    {
        return report(*error);
    }
    const auto& rotation{ std::get<photovault::core::RotationReport>(result) };

    for (const auto& failure : rotation.failed)
    {
        m_err << "failed: " << photovault::container::describe(failure.error) << '\n';
    }

    if (rotation.committed)
    {
        m_out << "password changed; " << rotation.succeeded.size() << " container(s) re-encrypted";
        if (!rotation.skipped.empty())
        {
            m_out << ", " << rotation.skipped.size() << " already done";
        }
        m_out << '\n';
        return g_kExitOk;
    }

    m_err << "password unchanged: the old password stays valid until `pvault passwd --resume` completes\n";
    if (rotation.cancelled)
    {
        return g_kExitCancelled;
    }
    if (!rotation.failed.empty())
    {
        return exitCodeFor(rotation.failed.front().error);
    }
    return g_kExitIo;
}

int CommandRunner::doShred(const std::filesystem::path& file)
{
    const auto result{ photovault::container::secureDelete(file, m_serviceOptions.container) };
    if (const auto code{ reportFailure(m_err, result) })
    {
        return *code;
    }
    if (std::get<photovault::container::SecureDeleteOutcome>(result).wasOverwritten)
    {
        m_out << "overwritten and removed: " << file.string() << '\n';
    }
    else
    {
        m_out << "removed without overwriting (larger than the secure-delete cap): " << file.string() << '\n';
    }
    return g_kExitOk;
}

int CommandRunner::doCleanupTemp(unsigned olderThanMinutes)
{
    const auto removed{ photovault::container::cleanupTemporaryArtifacts(m_serviceOptions.container,
                                                                          std::chrono::minutes{ olderThanMinutes }) };
    m_out << "removed " << removed << " temporary file(s) from "
          << photovault::container::resolveTemporaryDirectory(m_serviceOptions.container).string() << '\n';
    return g_kExitOk;
}

} // namespace photovault::ui::cli
