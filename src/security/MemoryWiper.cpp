#include "photovault/security/MemoryWiper.hpp"

#if defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace photovault::security
{
void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
    ::explicit_bzero(bytes.data(), bytes.size());
}

void secureWipe(std::string& text) noexcept
{
    if (text.capacity() != 0U)
    {
        // data() is writable up to capacity(); the short-string buffer is covered too.
        ::explicit_bzero(text.data(), text.capacity());
    }
    text.clear();
}
} // namespace photovault::security
