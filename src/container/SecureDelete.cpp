#include "photovault/container/SecureDelete.hpp"

#include "PosixFile.hpp"
#include "photovault/security/SecureBuffer.hpp"
#include "photovault/security/SecureRandom.hpp"
#include <cstdint>
#include <new>
#include <string>
#include <system_error>
#include <utility>

namespace photovault::container
{
namespace
{

[[nodiscard]] ContainerError makeError(ContainerErrc code, std::string reason, const std::filesystem::path& path)
{
    return ContainerError{ .code = code, .reason = std::move(reason), .path = path };
}

void overwritePass(detail::PosixFile& file, const photovault::security::SecureBuffer& pattern)
{
    file.writeAllAt(photovault::security::asBytes(pattern), 0U);
    file.sync();
}

} // namespace

ContainerResult<SecureDeleteOutcome> secureDelete(const std::filesystem::path& path, const ContainerOptions& options)
{
    std::error_code ec{};
    const auto status{ std::filesystem::symlink_status(path, ec) };
    if (ec || !std::filesystem::exists(status))
    {
        return makeError(ContainerErrc::FileNotFound, "no such file", path);
    }
    if (!std::filesystem::is_regular_file(status))
    {
        return makeError(ContainerErrc::IoError, "not a regular file", path);
    }

    const std::uintmax_t size{ std::filesystem::file_size(path, ec) };
    if (ec)
    {
        return makeError(ContainerErrc::IoError, ec.message(), path);
    }

    if (size > options.secureDeleteCapBytes)
    {
        if (!std::filesystem::remove(path, ec) || ec)
        {
            return makeError(ContainerErrc::IoError, "unlink failed: " + ec.message(), path);
        }
        return SecureDeleteOutcome{ .wasOverwritten = false };
    }

    try
    {
        // The path may have been swapped since the checks above; trust only the opened descriptor.
        auto file{ detail::PosixFile::openForOverwrite(path) };
        const std::uint64_t liveSize{ file.size() };
        if (liveSize > options.secureDeleteCapBytes)
        {
            return makeError(ContainerErrc::IoError, "file changed during delete", path);
        }
        photovault::security::SecureBuffer pattern(static_cast<std::size_t>(liveSize));

        if (!photovault::security::secureRandomFill(std::span<std::uint8_t>{ pattern }))
        {
            return makeError(ContainerErrc::CryptoError, "CSPRNG failure", path);
        }
        overwritePass(file, pattern);

        for (auto& b : pattern)
        {
            b = static_cast<std::uint8_t>(~b);
        }
        overwritePass(file, pattern);

        photovault::security::secureWipe(std::span<std::uint8_t>{ pattern });
        overwritePass(file, pattern);

        file.close();
    }
    catch (const std::system_error& e)
    {
        return makeError(ContainerErrc::IoError, e.what(), path);
    }
    catch (const std::bad_alloc&)
    {
        return makeError(ContainerErrc::IoError, "out of memory", path);
    }

    if (!std::filesystem::remove(path, ec) || ec)
    {
        return makeError(ContainerErrc::IoError, "unlink failed: " + ec.message(), path);
    }
    return SecureDeleteOutcome{ .wasOverwritten = true };
}

} // namespace photovault::container
