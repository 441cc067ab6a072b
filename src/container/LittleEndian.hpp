#ifndef PHOTOVAULT_SRC_CONTAINER_LITTLEENDIAN_HPP
#define PHOTOVAULT_SRC_CONTAINER_LITTLEENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace photovault::container::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::size_t g_kU64Bytes{ sizeof(std::uint64_t) };

constexpr std::uint64_t g_kByteMaskU64{ 0xFFU };
constexpr std::uint64_t g_kBitsPerByte{ 8U };

inline void writeU32LE(std::span<std::byte, g_kU32Bytes> out, std::uint32_t v) noexcept
{
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const std::uint32_t shiftBits{ static_cast<std::uint32_t>(i) * static_cast<std::uint32_t>(g_kBitsPerByte) };
        out[i] = static_cast<std::byte>((v >> shiftBits) & static_cast<std::uint32_t>(g_kByteMaskU64));
    }
}

inline void writeU64LE(std::span<std::byte, g_kU64Bytes> out, std::uint64_t v) noexcept
{
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const std::uint64_t shiftBits{ static_cast<std::uint64_t>(i) * g_kBitsPerByte };
        out[i] = static_cast<std::byte>((v >> shiftBits) & g_kByteMaskU64);
    }
}

[[nodiscard]] inline std::uint32_t readU32LE(std::span<const std::byte, g_kU32Bytes> in) noexcept
{
    std::uint32_t v{ 0U };
    for (std::size_t i{}; i < in.size(); ++i)
    {
        const std::uint32_t shiftBits{ static_cast<std::uint32_t>(i) * static_cast<std::uint32_t>(g_kBitsPerByte) };
        v |= (static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(in[i])) << shiftBits);
    }
    return v;
}

[[nodiscard]] inline std::uint64_t readU64LE(std::span<const std::byte, g_kU64Bytes> in) noexcept
{
    std::uint64_t v{ 0U };
    for (std::size_t i{}; i < in.size(); ++i)
    {
        const std::uint64_t shiftBits{ static_cast<std::uint64_t>(i) * g_kBitsPerByte };
        v |= (static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(in[i])) << shiftBits);
    }
    return v;
}

inline void appendU32LE(std::vector<std::byte>& out, std::uint32_t v)
{
    const std::size_t at{ out.size() };
    out.resize(at + g_kU32Bytes);
    writeU32LE(std::span<std::byte, g_kU32Bytes>{ out.data() + at, g_kU32Bytes }, v);
}

inline void appendU64LE(std::vector<std::byte>& out, std::uint64_t v)
{
    const std::size_t at{ out.size() };
    out.resize(at + g_kU64Bytes);
    writeU64LE(std::span<std::byte, g_kU64Bytes>{ out.data() + at, g_kU64Bytes }, v);
}

// Sequential reader over a byte span; every accessor reports underrun instead of reading past the end.
class ByteCursor final
{
public:
    explicit ByteCursor(std::span<const std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    [[nodiscard]] bool readU8(std::uint8_t& out) noexcept
    {
        if (remaining() < 1U)
        {
            return false;
        }
        out = std::to_integer<std::uint8_t>(m_bytes[m_offset]);
        ++m_offset;
        return true;
    }

    [[nodiscard]] bool readU32(std::uint32_t& out) noexcept
    {
        if (remaining() < g_kU32Bytes)
        {
            return false;
        }
        out = readU32LE(std::span<const std::byte, g_kU32Bytes>{ m_bytes.data() + m_offset, g_kU32Bytes });
        m_offset += g_kU32Bytes;
        return true;
    }

    [[nodiscard]] bool readU64(std::uint64_t& out) noexcept
    {
        if (remaining() < g_kU64Bytes)
        {
            return false;
        }
        out = readU64LE(std::span<const std::byte, g_kU64Bytes>{ m_bytes.data() + m_offset, g_kU64Bytes });
        m_offset += g_kU64Bytes;
        return true;
    }

    [[nodiscard]] bool take(std::size_t n, std::span<const std::byte>& out) noexcept
    {
        if (remaining() < n)
        {
            return false;
        }
        out = m_bytes.subspan(m_offset, n);
        m_offset += n;
        return true;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_bytes.size() - m_offset;
    }

private:
    std::span<const std::byte> m_bytes;
    std::size_t m_offset{ 0U };
};

} // namespace photovault::container::detail

#endif // PHOTOVAULT_SRC_CONTAINER_LITTLEENDIAN_HPP
