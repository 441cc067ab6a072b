#ifndef INCLUDE_PHOTOVAULT_CONTAINER_PLAINTEXTSOURCE_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_PLAINTEXTSOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace photovault::container
{

// Where writeContainer pulls plaintext from. Both buffers and files go through the same chunking loop.
class IPlaintextSource
{
public:
    IPlaintextSource() = default;
    IPlaintextSource(const IPlaintextSource&) = delete;
    IPlaintextSource& operator=(const IPlaintextSource&) = delete;
    IPlaintextSource(IPlaintextSource&&) = delete;
    IPlaintextSource& operator=(IPlaintextSource&&) = delete;
    virtual ~IPlaintextSource() = default;

    // Fills as much of `out` as possible; a short count means end of data.
    // Throws std::system_error on read failure.
    [[nodiscard]] virtual std::size_t read(std::span<std::byte> out) = 0;

    // Stored in the header as originalSize; 0 when unknown.
    [[nodiscard]] virtual std::uint64_t sizeHint() const noexcept = 0;
};

// The buffer must outlive the source.
[[nodiscard]] std::unique_ptr<IPlaintextSource> makeBufferSource(std::span<const std::byte> plainText);

// Throws std::system_error (errc::no_such_file_or_directory when missing).
[[nodiscard]] std::unique_ptr<IPlaintextSource> openFileSource(const std::filesystem::path& path);

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_PLAINTEXTSOURCE_HPP
