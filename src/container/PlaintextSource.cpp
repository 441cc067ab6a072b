#include "photovault/container/PlaintextSource.hpp"

#include "PosixFile.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

namespace photovault::container
{
namespace
{

class BufferSource final : public IPlaintextSource
{
public:
    explicit BufferSource(std::span<const std::byte> plainText) noexcept
        : m_remaining{ plainText }, m_size{ plainText.size() }
    {
    }

    [[nodiscard]] std::size_t read(std::span<std::byte> out) override
    {
        const std::size_t n{ std::min(out.size(), m_remaining.size()) };
        if (n > 0U)
        {
            std::memcpy(out.data(), m_remaining.data(), n);
            m_remaining = m_remaining.subspan(n);
        }
        return n;
    }

    [[nodiscard]] std::uint64_t sizeHint() const noexcept override
    {
        return m_size;
    }

private:
    std::span<const std::byte> m_remaining;
    std::uint64_t m_size{ 0U };
};

class FileSource final : public IPlaintextSource
{
public:
    explicit FileSource(detail::PosixFile file) : m_size{ file.size() }, m_file{ std::move(file) }
    {
    }

    [[nodiscard]] std::size_t read(std::span<std::byte> out) override
    {
        return m_file.readUpTo(out);
    }

    [[nodiscard]] std::uint64_t sizeHint() const noexcept override
    {
        return m_size;
    }

private:
    std::uint64_t m_size{ 0U };
    detail::PosixFile m_file;
};

} // namespace

std::unique_ptr<IPlaintextSource> makeBufferSource(std::span<const std::byte> plainText)
{
    return std::make_unique<BufferSource>(plainText);
}

std::unique_ptr<IPlaintextSource> openFileSource(const std::filesystem::path& path)
{
    return std::make_unique<FileSource>(detail::PosixFile::openForRead(path));
}

} // namespace photovault::container
