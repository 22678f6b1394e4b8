#include "ConsoleUtils.hpp"

#include "cipherbook/security/MemoryWiper.hpp"
#include <cstddef>
#include <iostream>
#include <span>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace cipherbook::ui::cli
{
namespace
{

// Turns echo off for its lifetime when stdin is a terminal; restores the original mode.
class EchoOff final
{
public:
    EchoOff() noexcept
    {
        if (::isatty(STDIN_FILENO) == 0 || ::tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        termios quiet{ m_saved };
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == 0);
    }

    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;
    EchoOff(EchoOff&&) = delete;
    EchoOff& operator=(EchoOff&&) = delete;

    ~EchoOff()
    {
        if (m_active)
        {
            (void)::tcsetattr(STDIN_FILENO, TCSAFLUSH, &m_saved);
        }
    }

private:
    termios m_saved{};
    bool m_active{ false };
};

} // namespace

bool lockProcessMemory() noexcept
{
    const rlimit noCore{ 0, 0 };
    (void)::setrlimit(RLIMIT_CORE, &noCore);
    return ::mlockall(MCL_CURRENT | MCL_FUTURE) == 0;
}

cipherbook::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line{};
    {
        EchoOff echoOff{};
        std::getline(std::cin, line);
    }
    std::cout << "\n";

    auto sec{ cipherbook::security::secureStringFrom(line) };
    cipherbook::security::secureWipe(std::as_writable_bytes(std::span<char>{ line.data(), line.size() }));
    return sec;
}

} // namespace cipherbook::ui::cli
