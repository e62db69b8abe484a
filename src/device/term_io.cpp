//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/device/term_io.cpp
// Purpose: POSIX terminal output and raw-mode handling.
// Key invariants: A session only restores attributes it saved itself.
//
//===----------------------------------------------------------------------===//

#include "keydeck/device/term_io.hpp"

#include "keydeck/log/log.hpp"

#include <cstddef>
#include <cstdlib>
#include <termios.h>
#include <unistd.h>

namespace keydeck::device
{

void RealTermIO::write(std::string_view s)
{
    while (!s.empty())
    {
        ssize_t n = ::write(STDOUT_FILENO, s.data(), s.size());
        if (n <= 0)
            return;
        s.remove_prefix(static_cast<std::size_t>(n));
    }
}

void RealTermIO::flush() {}

struct TerminalSession::Saved
{
    termios attrs{};
};

bool TerminalSession::headlessRequested()
{
    const char *v = std::getenv("KEYDECK_NO_TTY");
    return v && v[0] == '1';
}

TerminalSession::TerminalSession()
{
    if (headlessRequested() || !::isatty(STDIN_FILENO))
        return;
    auto saved = std::make_unique<Saved>();
    if (::tcgetattr(STDIN_FILENO, &saved->attrs) != 0)
    {
        log::warn("tcgetattr failed; staying in cooked mode");
        return;
    }
    termios raw = saved->attrs;
    raw.c_lflag &= ~(ECHO | ICANON | ISIG | IEXTEN);
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0)
    {
        log::warn("tcsetattr failed; staying in cooked mode");
        return;
    }
    saved_ = std::move(saved);
    active_ = true;
}

TerminalSession::~TerminalSession()
{
    if (saved_)
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_->attrs);
}

} // namespace keydeck::device
