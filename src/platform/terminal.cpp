#include "terminal.hpp"
#include <cstdio>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#else
#  include <termios.h>
#  include <unistd.h>
#endif

namespace platform {

// ── TTY detection ────────────────────────────────────────────

#ifdef _WIN32

bool stdin_is_terminal()  { return _isatty(_fileno(stdin)) != 0; }
bool stdout_is_terminal() { return _isatty(_fileno(stdout)) != 0; }
bool stderr_is_terminal() { return _isatty(_fileno(stderr)) != 0; }

#else

bool stdin_is_terminal()  { return isatty(STDIN_FILENO) == 1; }
bool stdout_is_terminal() { return isatty(STDOUT_FILENO) == 1; }
bool stderr_is_terminal() { return isatty(STDERR_FILENO) == 1; }

#endif

// ── NoEchoGuard ──────────────────────────────────────────────

#ifdef _WIN32

NoEchoGuard::NoEchoGuard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    GetConsoleMode(h, &old_mode_);
    SetConsoleMode(h, old_mode_ & ~static_cast<DWORD>(ENABLE_ECHO_INPUT));
}

NoEchoGuard::~NoEchoGuard() {
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

#else // Unix

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;

    // Canonical mode stays on so the line is still read with getline.
    struct termios quiet = impl_->old_term;
    quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_->saved) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
    }
    delete impl_;
}

#endif

} // namespace platform
