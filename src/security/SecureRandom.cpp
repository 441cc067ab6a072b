#include "photovault/security/SecureRandom.hpp"
#include "photovault/security/MemoryWiper.hpp"
#include <cerrno>
#include <cstddef>
#include <stdexcept>
#include <vector>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace photovault::security
{
bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* outPtr{ out.data() };
    std::size_t remaining{ out.size() };

    while (remaining > 0U)
    {
        const ssize_t bytesReceived{ ::getrandom(outPtr, remaining, 0) };
        if (bytesReceived > 0)
        {
            const std::size_t received{ static_cast<std::size_t>(bytesReceived) };
            if (received > remaining)
            {
                return false;
            }
            remaining -= received;
            outPtr += received;
            continue;
        }
        if (bytesReceived < 0 && errno == EINTR)
        {
            continue;
        }
        return false;
    }
    return true;
}

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

std::string randomHexToken(std::size_t bytes)
{
    std::vector<std::uint8_t> rnd(bytes);
    if (!secureRandomFill(std::span<std::uint8_t>{ rnd }))
    {
        throw std::runtime_error("randomHexToken: CSPRNG failure");
    }
    return toHex(std::span<const std::uint8_t>{ rnd });
}

} // namespace photovault::security
