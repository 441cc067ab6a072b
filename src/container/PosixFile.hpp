#ifndef PHOTOVAULT_SRC_CONTAINER_POSIXFILE_HPP
#define PHOTOVAULT_SRC_CONTAINER_POSIXFILE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>
#include <utility>

namespace photovault::container::detail
{

// Owning file descriptor. Every failing call throws std::system_error carrying errno and the path.
class PosixFile final
{
public:
    PosixFile() = default;
    PosixFile(const PosixFile&) = delete;
    PosixFile& operator=(const PosixFile&) = delete;
    PosixFile(PosixFile&& other) noexcept;
    PosixFile& operator=(PosixFile&& other) noexcept;
    ~PosixFile() noexcept;

    [[nodiscard]] static PosixFile openForRead(const std::filesystem::path& path);
    // O_EXCL: fails with errc::file_exists instead of truncating. Mode 0600.
    [[nodiscard]] static PosixFile createExclusive(const std::filesystem::path& path);
    // Refuses symlinks (ELOOP) and anything that is not a regular file (EINVAL).
    [[nodiscard]] static PosixFile openForOverwrite(const std::filesystem::path& path);

    // Loops until `out` is full or EOF; returns bytes read.
    [[nodiscard]] std::size_t readUpTo(std::span<std::byte> out);
    void writeAll(std::span<const std::byte> bytes);
    void writeAllAt(std::span<const std::byte> bytes, std::uint64_t offset);
    void skip(std::uint64_t bytes);
    void sync();
    [[nodiscard]] std::uint64_t size() const;
    // Reports close() errors, which can carry deferred write failures.
    void close();

    [[nodiscard]] bool isOpen() const noexcept
    {
        return m_fd >= 0;
    }

private:
    friend void syncDirectory(const std::filesystem::path& dir);

    PosixFile(int fd, std::filesystem::path path) noexcept;

    int m_fd{ -1 };
    std::filesystem::path m_path;
};

// Deletes a partially written artifact on scope exit unless released after success.
class PartialFileGuard final
{
public:
    explicit PartialFileGuard(std::filesystem::path path) noexcept : m_path{ std::move(path) }
    {
    }
    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;

    ~PartialFileGuard() noexcept
    {
        if (m_armed)
        {
            std::error_code ec{};
            std::filesystem::remove(m_path, ec);
        }
    }

    void release() noexcept
    {
        m_armed = false;
    }

private:
    std::filesystem::path m_path;
    bool m_armed{ true };
};

// fsync on the directory so a rename or create inside it survives a crash.
void syncDirectory(const std::filesystem::path& dir);

} // namespace photovault::container::detail

#endif // PHOTOVAULT_SRC_CONTAINER_POSIXFILE_HPP
