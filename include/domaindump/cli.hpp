// ==============================================================================
// domaindump/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv: domaindump [OPTIONS] HOSTNAME
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2 для ошибок использования)
// - Наложение значений командной строки на DumpConfig
//
// ==============================================================================

#ifndef DOMAINDUMP_CLI_HPP
#define DOMAINDUMP_CLI_HPP

#include "domaindump/config.hpp"

#include <optional>
#include <string>
#include <variant>

namespace domaindump::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;                // --no-banner
    std::optional<int> num_threads;        // --num-threads
    int verbose = 0;                       // -v (repeatable)
    bool quiet = false;                    // -q
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Основной режим: дамп каталога
struct DumpCommand {
    std::string host;                        // HOSTNAME
    std::optional<std::string> user;         // -u, --user
    std::optional<std::string> password;     // -p, --password
    std::optional<std::string> outdir;       // -o, --outdir
    bool no_html = false;                    // --no-html
    bool no_json = false;                    // --no-json
    bool no_grep = false;                    // --no-grep
    std::optional<std::string> delimiter;    // -d, --delimiter
    bool resolve = false;                    // -r, --resolve
    std::optional<std::string> dns_server;   // -n, --dns-server
    std::optional<std::string> config_path;  // -c, --config
    std::optional<std::string> base_dn;      // -b, --base
};

struct HelpCommand {};

struct VersionCommand {};

using Command = std::variant<DumpCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv);

std::string render_help();

std::string render_version();

/// Сообщение об ошибке использования: error + Usage + подсказка
std::string render_usage_error(const std::string& error_msg);

/// Предупреждение перед анонимным подключением (без --user); иначе пусто
std::string anonymous_bind_notice(const DumpCommand& cmd);

/// Применить значения командной строки поверх конфигурации
void apply_overrides(const DumpCommand& cmd, const GlobalOptions& global,
                     config::DumpConfig& cfg);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.9.4";

constexpr const char* ABOUT = "Active Directory information dumper via LDAP";

}  // namespace domaindump::cli

#endif  // DOMAINDUMP_CLI_HPP
