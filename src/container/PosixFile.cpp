#include "PosixFile.hpp"

#include <cerrno>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

#if defined(__linux__)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#else
#error Unsupported platform
#endif

namespace photovault::container::detail
{
namespace
{

[[noreturn]] void throwErrno(int err, const char* what, const std::filesystem::path& path)
{
    std::string msg{ what };
    msg.append(": ");
    msg.append(path.string());
    throw std::system_error(err, std::generic_category(), msg);
}

[[nodiscard]] int openOrThrow(const std::filesystem::path& path, int flags, const char* what)
{
    constexpr mode_t kOwnerReadWrite{ S_IRUSR | S_IWUSR };
    for (;;)
    {
        const int fd{ ::open(path.c_str(), flags | O_CLOEXEC, kOwnerReadWrite) };
        if (fd >= 0)
        {
            return fd;
        }
        if (errno != EINTR)
        {
            throwErrno(errno, what, path);
        }
    }
}

} // namespace

PosixFile::PosixFile(int fd, std::filesystem::path path) noexcept : m_fd{ fd }, m_path{ std::move(path) }
{
}

PosixFile::PosixFile(PosixFile&& other) noexcept
    : m_fd{ std::exchange(other.m_fd, -1) }, m_path{ std::move(other.m_path) }
{
}

PosixFile& PosixFile::operator=(PosixFile&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }
    if (m_fd >= 0)
    {
        (void)::close(m_fd);
    }
    m_fd = std::exchange(other.m_fd, -1);
    m_path = std::move(other.m_path);
    return *this;
}

PosixFile::~PosixFile() noexcept
{
    if (m_fd >= 0)
    {
        (void)::close(m_fd);
    }
}

PosixFile PosixFile::openForRead(const std::filesystem::path& path)
{
    return PosixFile{ openOrThrow(path, O_RDONLY, "open"), path };
}

PosixFile PosixFile::createExclusive(const std::filesystem::path& path)
{
    return PosixFile{ openOrThrow(path, O_WRONLY | O_CREAT | O_EXCL, "create"), path };
}

PosixFile PosixFile::openForOverwrite(const std::filesystem::path& path)
{
    PosixFile file{ openOrThrow(path, O_WRONLY | O_NOFOLLOW, "open"), path };
    struct stat st
    {
    };
    if (::fstat(file.m_fd, &st) != 0)
    {
        throwErrno(errno, "stat", path);
    }
    if (!S_ISREG(st.st_mode))
    {
        throwErrno(EINVAL, "not a regular file", path);
    }
    return file;
}

std::size_t PosixFile::readUpTo(std::span<std::byte> out)
{
    std::size_t total{ 0U };
    while (total < out.size())
    {
        const ssize_t n{ ::read(m_fd, out.data() + total, out.size() - total) };
        if (n > 0)
        {
            total += static_cast<std::size_t>(n);
            continue;
        }
        if (n == 0)
        {
            break;
        }
        if (errno == EINTR)
        {
            continue;
        }
        throwErrno(errno, "read", m_path);
    }
    return total;
}

void PosixFile::writeAll(std::span<const std::byte> bytes)
{
    std::size_t written{ 0U };
    while (written < bytes.size())
    {
        const ssize_t n{ ::write(m_fd, bytes.data() + written, bytes.size() - written) };
        if (n >= 0)
        {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR)
        {
            continue;
        }
        throwErrno(errno, "write", m_path);
    }
}

void PosixFile::writeAllAt(std::span<const std::byte> bytes, std::uint64_t offset)
{
    std::size_t written{ 0U };
    while (written < bytes.size())
    {
        const off_t at{ static_cast<off_t>(offset + written) };
        const ssize_t n{ ::pwrite(m_fd, bytes.data() + written, bytes.size() - written, at) };
        if (n >= 0)
        {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR)
        {
            continue;
        }
        throwErrno(errno, "pwrite", m_path);
    }
}

void PosixFile::skip(std::uint64_t bytes)
{
    if (bytes > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max()))
    {
        throwErrno(EOVERFLOW, "seek", m_path);
    }
    if (::lseek(m_fd, static_cast<off_t>(bytes), SEEK_CUR) < 0)
    {
        throwErrno(errno, "seek", m_path);
    }
}

void PosixFile::sync()
{
    while (::fsync(m_fd) != 0)
    {
        if (errno != EINTR)
        {
            throwErrno(errno, "fsync", m_path);
        }
    }
}

std::uint64_t PosixFile::size() const
{
    struct stat st
    {
    };
    if (::fstat(m_fd, &st) != 0)
    {
        throwErrno(errno, "stat", m_path);
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void PosixFile::close()
{
    if (m_fd < 0)
    {
        return;
    }
    const int fd{ std::exchange(m_fd, -1) };
    // Linux releases the descriptor even when close fails, so never retry.
    if (::close(fd) != 0 && errno != EINTR)
    {
        throwErrno(errno, "close", m_path);
    }
}

void syncDirectory(const std::filesystem::path& dir)
{
    const std::filesystem::path target{ dir.empty() ? std::filesystem::path{ "." } : dir };
    PosixFile d{ openOrThrow(target, O_RDONLY | O_DIRECTORY, "open directory"), target };
    d.sync();
}

} // namespace photovault::container::detail
