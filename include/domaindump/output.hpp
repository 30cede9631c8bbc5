// ==============================================================================
// domaindump/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами ([+], [!], [x], [*], [~]) и уровни подробности
// - Цветной вывод (ANSI escape codes) на терминале
// - Таблица итогов прогона (Unicode box-drawing)
//
// Файлы отчётов этот модуль не пишет: их пишет dump::ReportWriter.
//
// ==============================================================================

#ifndef DOMAINDUMP_OUTPUT_HPP
#define DOMAINDUMP_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace domaindump::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить informational stderr
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner: скрыть баннер
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// Зелёная строка в stderr (если не quiet) - баннер
    void green_line_stderr(std::string_view message);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    void prefixed(std::string_view prefix, Color color, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w);

    std::string to_string() const;

private:
    std::string format_line(char left, char middle, char right) const;
    std::string format_row(const std::vector<std::string>& cells) const;
    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    mutable std::vector<size_t> col_widths_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[x] <message>\n" для сообщений в обход Writer (до его создания)
std::string format_error(std::string_view message);

/// Ширина строки в символах терминала (UTF-8 continuation-байты не считаются)
size_t display_width(std::string_view text);

std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace domaindump::output

#endif  // DOMAINDUMP_OUTPUT_HPP
