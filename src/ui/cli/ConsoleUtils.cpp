#include "ConsoleUtils.hpp"
#include "keyhop/security/MemoryWiper.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__) || defined(__APPLE__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace keyhop::ui::cli
{

namespace
{

// Restores the previous echo mode when it goes out of scope. No-op if stdin is not a terminal.
class EchoOff final
{
public:
    EchoOff() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (GetConsoleMode(m_handle, &m_saved) != 0)
        {
            m_active = SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
        }
#else
        if (isatty(STDIN_FILENO) == 1 && tcgetattr(STDIN_FILENO, &m_saved) == 0)
        {
            struct termios tty = m_saved;
            tty.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = tcsetattr(STDIN_FILENO, TCSANOW, &tty) == 0;
        }
#endif
    }

    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;
    EchoOff(EchoOff&&) = delete;
    EchoOff& operator=(EchoOff&&) = delete;

    ~EchoOff() noexcept
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_saved);
#else
        tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{ nullptr };
    DWORD m_saved{ 0 };
#else
    struct termios m_saved
    {
    };
#endif
    bool m_active{ false };
};

} // namespace

bool lockProcessMemory() noexcept
{
#if defined(_WIN32)
    // Windows has no process-wide equivalent of mlockall; SecureBuffer pages are wiped instead.
    return false;
#else
    const bool locked{ mlockall(MCL_CURRENT | MCL_FUTURE) == 0 };
    const struct rlimit noCore
    {
        0, 0
    };
    const bool noDumps{ setrlimit(RLIMIT_CORE, &noCore) == 0 };
    return locked && noDumps;
#endif
}

keyhop::security::SecureString readSecret(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    {
        const EchoOff echoOff{};
        std::getline(std::cin, line);
    }
    std::cout << "\n";

    if (!line.empty() && line.back() == '\r')
    {
        line.pop_back();
    }
    auto sec{ keyhop::security::secureStringFrom(line) };
    keyhop::security::secureWipe(line);
    return sec;
}

bool confirm(const std::string& prompt, std::istream& in, std::ostream& out)
{
    out << prompt << " [y/N] " << std::flush;

    std::string answer;
    if (!std::getline(in, answer))
    {
        return false;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!answer.empty() && answer.back() == '\r')
    {
        answer.pop_back();
    }
    return answer == "y" || answer == "yes";
}

} // namespace keyhop::ui::cli
