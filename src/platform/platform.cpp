// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "domaindump/platform.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <termios.h>
#include <unistd.h>

namespace domaindump::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // POSIX: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.string();
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
    return isatty(fileno(stdout)) != 0;
}

bool is_tty_stderr() {
    return isatty(fileno(stderr)) != 0;
}

bool is_tty_stdin() {
    return isatty(fileno(stdin)) != 0;
}

// ----------------------------------------------------------------------------
// Пароль
// ----------------------------------------------------------------------------

std::optional<std::string> read_password(std::string_view prompt) {
    std::fwrite(prompt.data(), 1, prompt.size(), stderr);
    std::fflush(stderr);

    termios saved{};
    bool restore = false;
    if (is_tty_stdin() && tcgetattr(STDIN_FILENO, &saved) == 0) {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        restore = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
    }

    std::string line;
    bool got = static_cast<bool>(std::getline(std::cin, line));

    if (restore) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved);
        std::fputc('\n', stderr);
    }

    if (!got) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

// ----------------------------------------------------------------------------
// Временные каталоги
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_dir(std::string_view prefix) {
    std::string temp_dir = "/tmp";
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir != nullptr && tmpdir[0] != '\0') {
        temp_dir = tmpdir;
    }

    std::string tmpl = temp_dir + "/" + std::string(prefix) + "_XXXXXX";
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    if (mkdtemp(tmpl_buf.data()) == nullptr) {
        throw std::runtime_error("failed to create temp directory in " + temp_dir);
    }
    return std::filesystem::path(tmpl_buf.data());
}

}  // namespace domaindump::platform
