#include "photovault/container/TemporaryFiles.hpp"

#include "TemporaryFile.hpp"
#include "photovault/security/SecureRandom.hpp"
#include <stdexcept>
#include <string>
#include <system_error>

namespace photovault::container
{
namespace
{

constexpr std::size_t g_kTempNameTokenBytes{ 16U };
constexpr std::size_t g_kMaxCreateAttempts{ 8U };

void ensurePrivateDirectory(const std::filesystem::path& dir)
{
    std::error_code ec{};
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        throw std::system_error(ec, "create temporary directory: " + dir.string());
    }
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        throw std::system_error(ec, "restrict temporary directory: " + dir.string());
    }
}

// Keeps only a plain extension; anything that could escape the directory is dropped.
[[nodiscard]] std::string sanitizeExtension(const std::optional<std::string>& preferredExtension)
{
    if (!preferredExtension)
    {
        return {};
    }
    std::string ext{ *preferredExtension };
    while (!ext.empty() && ext.front() == '.')
    {
        ext.erase(ext.begin());
    }
    if (ext.empty() || ext.find('/') != std::string::npos || ext.find('\0') != std::string::npos)
    {
        return {};
    }
    return "." + ext;
}

} // namespace

std::filesystem::path resolveTemporaryDirectory(const ContainerOptions& options)
{
    if (!options.temporaryDirectory.empty())
    {
        return options.temporaryDirectory;
    }
    return std::filesystem::temp_directory_path() / std::filesystem::path{ g_kDefaultTempDirName };
}

namespace detail
{

TemporaryFile createTemporaryFile(const ContainerOptions& options, const std::optional<std::string>& preferredExtension)
{
    const auto dir{ resolveTemporaryDirectory(options) };
    ensurePrivateDirectory(dir);
    const std::string ext{ sanitizeExtension(preferredExtension) };

    for (std::size_t attempt{}; attempt < g_kMaxCreateAttempts; ++attempt)
    {
        std::string name{ g_kDecryptedTempPrefix };
        name += photovault::security::randomHexToken(g_kTempNameTokenBytes);
        name += ext;
        const auto path{ dir / std::filesystem::path{ name } };
        try
        {
            return TemporaryFile{ .file = PosixFile::createExclusive(path), .path = path };
        }
        catch (const std::system_error& e)
        {
            if (e.code() != std::errc::file_exists)
            {
                throw;
            }
        }
    }
    throw std::system_error(std::make_error_code(std::errc::file_exists), "create temporary file in " + dir.string());
}

} // namespace detail

std::size_t cleanupTemporaryArtifacts(const ContainerOptions& options, std::chrono::seconds olderThan)
{
    const auto dir{ resolveTemporaryDirectory(options) };
    std::error_code ec{};
    if (!std::filesystem::is_directory(dir, ec))
    {
        return 0U;
    }

    const auto cutoff{ std::filesystem::file_time_type::clock::now() - olderThan };
    std::size_t removed{ 0U };
    for (std::filesystem::directory_iterator it{ dir, ec }, end{}; !ec && it != end; it.increment(ec))
    {
        const auto& entry{ *it };
        if (!entry.path().filename().string().starts_with(g_kDecryptedTempPrefix))
        {
            continue;
        }
        std::error_code entryEc{};
        if (!entry.is_regular_file(entryEc) || entryEc)
        {
            continue;
        }
        const auto modified{ entry.last_write_time(entryEc) };
        if (entryEc || modified > cutoff)
        {
            continue;
        }
        if (std::filesystem::remove(entry.path(), entryEc) && !entryEc)
        {
            ++removed;
        }
    }
    return removed;
}

} // namespace photovault::container
