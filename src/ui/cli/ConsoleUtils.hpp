#ifndef PHOTOVAULT_UI_CLI_CONSOLEUTILS_HPP
#define PHOTOVAULT_UI_CLI_CONSOLEUTILS_HPP

#include "photovault/security/SecureString.hpp"
#include <stop_token>
#include <string>
#include <thread>

namespace photovault::ui::cli
{

void lockProcessMemory() noexcept;

[[nodiscard]] photovault::security::SecureString readPassword(const std::string& prompt);

// Turns SIGINT/SIGTERM into a stop request so long operations clean up their partial files.
// Construct before any other thread starts: the signals are blocked process-wide and consumed by a watcher thread.
class InterruptWatcher final
{
public:
    InterruptWatcher();
    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;
    InterruptWatcher(InterruptWatcher&&) = delete;
    InterruptWatcher& operator=(InterruptWatcher&&) = delete;
    ~InterruptWatcher() = default;

    [[nodiscard]] std::stop_token token() const noexcept
    {
        return m_source.get_token();
    }

private:
    std::stop_source m_source;
    std::jthread m_watcher;
};

} // namespace photovault::ui::cli

#endif // PHOTOVAULT_UI_CLI_CONSOLEUTILS_HPP
