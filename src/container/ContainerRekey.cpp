#include "photovault/container/ContainerRekey.hpp"

#include "PosixFile.hpp"
#include "photovault/security/SecureRandom.hpp"
#include <cerrno>
#include <cstdio>
#include <string>
#include <system_error>
#include <utility>

namespace photovault::container
{
namespace
{

constexpr std::size_t g_kStagingTokenBytes{ 8U };

// The plaintext scratch file never outlives the rotation, whatever the outcome.
class ScratchFileCleanup final
{
public:
    explicit ScratchFileCleanup(std::filesystem::path path) noexcept : m_path{ std::move(path) }
    {
    }
    ScratchFileCleanup(const ScratchFileCleanup&) = delete;
    ScratchFileCleanup& operator=(const ScratchFileCleanup&) = delete;
    ~ScratchFileCleanup() noexcept
    {
        std::error_code ec{};
        std::filesystem::remove(m_path, ec);
    }

private:
    std::filesystem::path m_path;
};

[[nodiscard]] std::optional<std::string> extensionOf(const std::filesystem::path& path)
{
    const auto ext{ path.extension().string() };
    if (ext.empty())
    {
        return std::nullopt;
    }
    return ext;
}

} // namespace

std::filesystem::path makeStagingPath(const std::filesystem::path& path)
{
    std::string name{ path.filename().string() };
    name += g_kStagingSuffix;
    name += ".";
    name += photovault::security::randomHexToken(g_kStagingTokenBytes);
    return path.parent_path() / std::filesystem::path{ name };
}

ContainerResult<std::monostate> reencryptContainer(ContainerCodec& codec, const std::filesystem::path& path,
                                                   const photovault::crypto::ContainerKeys& oldKeys,
                                                   const photovault::crypto::ContainerKeys& newKeys,
                                                   std::stop_token stop)
{
    auto info{ ContainerCodec::readContainerInfo(path) };
    if (!std::holds_alternative<ContainerInfo>(info))
    {
        return propagateFailure<std::monostate>(std::move(info));
    }
    const MediaType mediaType{ std::get<ContainerInfo>(info).header.mediaType };

    // Only a container without metadata proceeds with none; a failing metadata block aborts the rotation.
    auto metadata{ codec.readMetadata(path, oldKeys) };
    if (!std::holds_alternative<std::optional<MediaMetadata>>(metadata))
    {
        return propagateFailure<std::monostate>(std::move(metadata));
    }

    auto scratch{ codec.readContainerToTemporaryFile(path, oldKeys, extensionOf(path), {}, stop) };
    if (!std::holds_alternative<std::filesystem::path>(scratch))
    {
        return propagateFailure<std::monostate>(std::move(scratch));
    }
    const auto scratchPath{ std::get<std::filesystem::path>(scratch) };
    ScratchFileCleanup cleanup{ scratchPath };

    std::filesystem::path staging{};
    try
    {
        staging = makeStagingPath(path);
    }
    catch (const std::runtime_error& e)
    {
        return ContainerError{ .code = ContainerErrc::CryptoError, .reason = e.what(), .path = path };
    }

    auto written{ codec.writeContainerFromFile(scratchPath, mediaType,
                                               std::get<std::optional<MediaMetadata>>(metadata), newKeys, staging,
                                               {}, stop) };
    if (!std::holds_alternative<std::monostate>(written))
    {
        return written;
    }

    if (stop.stop_requested())
    {
        std::error_code ec{};
        std::filesystem::remove(staging, ec);
        return OperationCancelled{};
    }

    // rename(2) replaces the destination atomically: readers see either the old or the new container.
    if (std::rename(staging.c_str(), path.c_str()) != 0)
    {
        const int err{ errno };
        std::error_code ec{};
        std::filesystem::remove(staging, ec);
        return ContainerError{ .code = ContainerErrc::IoError,
                               .reason = "atomic replace failed: " + std::generic_category().message(err),
                               .path = path };
    }

    try
    {
        detail::syncDirectory(path.parent_path());
    }
    catch (const std::system_error& e)
    {
        return ContainerError{ .code = ContainerErrc::IoError, .reason = e.what(), .path = path };
    }
    return std::monostate{};
}

} // namespace photovault::container
