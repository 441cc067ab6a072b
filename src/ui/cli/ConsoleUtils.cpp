#include "ConsoleUtils.hpp"
#include "photovault/security/MemoryWiper.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>
#include <system_error>

#if defined(__linux__)
#include <csignal>
#include <pthread.h>
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace photovault::ui::cli
{

namespace
{

constexpr long g_kSignalPollNanos{ 200'000'000L };
constexpr int g_kInterruptedExitCode{ 130 };

void setConsoleEcho(bool enable)
{
    struct termios tty
    {
    };
    if (tcgetattr(STDIN_FILENO, &tty) != 0)
    {
        // Not a terminal (piped input): nothing to hide.
        return;
    }
    if (!enable)
    {
        tty.c_lflag &= ~ECHO;
    }
    else
    {
        tty.c_lflag |= ECHO;
    }
    (void)tcsetattr(STDIN_FILENO, TCSANOW, &tty);
}

[[nodiscard]] sigset_t interruptSignals() noexcept
{
    sigset_t set{};
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

void lockProcessMemory() noexcept
{
    // Best effort: without CAP_IPC_LOCK or a high RLIMIT_MEMLOCK this fails and keys may reach swap.
    (void)mlockall(MCL_CURRENT | MCL_FUTURE);
    struct rlimit lim
    {
        0, 0
    };
    (void)setrlimit(RLIMIT_CORE, &lim);
}

photovault::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    setConsoleEcho(false);

    std::string line;
    std::getline(std::cin, line);

    setConsoleEcho(true);
    std::cout << "\n";

    auto sec = photovault::security::secureStringFrom(line);
    photovault::security::secureWipe(line);

    return sec;
}

InterruptWatcher::InterruptWatcher()
{
    const sigset_t set{ interruptSignals() };
    const int rc{ pthread_sigmask(SIG_BLOCK, &set, nullptr) };
    if (rc != 0)
    {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }

    m_watcher = std::jthread{ [source = m_source](std::stop_token own) mutable {
        const sigset_t waitSet{ interruptSignals() };
        const timespec poll{ .tv_sec = 0, .tv_nsec = g_kSignalPollNanos };
        while (!own.stop_requested())
        {
            if (sigtimedwait(&waitSet, nullptr, &poll) <= 0)
            {
                continue;
            }
            if (source.stop_requested())
            {
                // Second interrupt: the user does not want to wait for cleanup.
                std::_Exit(g_kInterruptedExitCode);
            }
            std::cerr << "\ninterrupted, cleaning up (interrupt again to quit now)...\n";
            source.request_stop();
        }
    } };
}

} // namespace photovault::ui::cli
