// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты первичны: std::endl не
// используется, перевод строки пишется явно.
//
// ==============================================================================

#include "domaindump/output.hpp"

#include "domaindump/platform.hpp"

#include <algorithm>
#include <cstdio>

namespace domaindump::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters, UTF-8
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

std::string with_prefix(std::string_view prefix, std::string_view message) {
    std::string result(prefix);
    result += ' ';
    result.append(message);
    result += '\n';
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write(Stream::Stderr, " ");
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    prefixed("[+]", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    prefixed("[!]", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    prefixed("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    prefixed("[*]", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    prefixed("[~]", Color::Magenta, message);
}

void Writer::green_line_stderr(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_colored(Stream::Stderr, message, Color::Green);
    write(Stream::Stderr, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    if (supports_color(s)) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(char left, char middle, char right) const {
    std::string line;

    if (left == 'T') {
        line += BOX_TL;  // ┌
    } else if (left == 'M') {
        line += BOX_LT;  // ├
    } else if (left == 'B') {
        line += BOX_BL;  // └
    }

    for (size_t i = 0; i < col_widths_.size(); ++i) {
        // padding (1 space each side) + content width
        for (size_t j = 0; j < col_widths_[i] + 2; ++j) {
            line += BOX_H;  // ─
        }

        if (i < col_widths_.size() - 1) {
            if (middle == 'T') {
                line += BOX_TT;  // ┬
            } else if (middle == 'M') {
                line += BOX_CROSS;  // ┼
            } else if (middle == 'B') {
                line += BOX_BT;  // ┴
            }
        }
    }

    if (right == 'T') {
        line += BOX_TR;  // ┐
    } else if (right == 'M') {
        line += BOX_RT;  // ┤
    } else if (right == 'B') {
        line += BOX_BR;  // ┘
    }

    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    std::string line;
    line += BOX_V;  // │

    for (size_t i = 0; i < col_widths_.size(); ++i) {
        line += ' ';

        std::string cell = (i < cells.size()) ? cells[i] : "";
        line += cell;

        size_t width = display_width(cell);
        if (width < col_widths_[i]) {
            line.append(col_widths_[i] - width, ' ');
        }

        line += ' ';
        line += BOX_V;  // │
    }

    return line;
}

std::string Table::to_string() const {
    col_widths_ = column_widths();

    std::string result;

    // ┌───┬───┐
    result += format_line('T', 'T', 'T');
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';

        // ├───┼───┤
        result += format_line('M', 'M', 'M');
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    // └───┴───┘
    result += format_line('B', 'B', 'B');
    result += '\n';

    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_error(std::string_view message) {
    return with_prefix("[x]", message);
}

size_t display_width(std::string_view text) {
    size_t width = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace domaindump::output
