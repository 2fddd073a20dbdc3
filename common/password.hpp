#pragma once

// ============================================================
// password.hpp -- Read a password from the terminal without echo
// ============================================================

#include <iostream>
#include <string>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <termios.h>
#  include <unistd.h>
#endif

namespace password {

inline std::string prompt(const std::string& label) {
    std::cout << label << std::flush;
    std::string pw;

#ifdef _WIN32
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    bool tty = GetConsoleMode(h, &mode) != 0;
    if (tty) SetConsoleMode(h, mode & ~ENABLE_ECHO_INPUT);
    std::getline(std::cin, pw);
    if (tty) SetConsoleMode(h, mode);
#else
    termios old_tio{};
    bool tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old_tio) == 0;
    if (tty) {
        termios tio = old_tio;
        tio.c_lflag &= ~(tcflag_t)ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &tio);
    }
    std::getline(std::cin, pw);
    if (tty) tcsetattr(STDIN_FILENO, TCSANOW, &old_tio);
#endif

    std::cout << "\n";
    if (!pw.empty() && pw.back() == '\r') pw.pop_back();
    return pw;
}

} // namespace password
