// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер argv. Опции со значением принимаются в двух формах:
// "--user VALUE" и "--user=VALUE". Короткие флаги не склеиваются (-rv - ошибка).
//
// ==============================================================================

#include "domaindump/cli.hpp"

#include "domaindump/output.hpp"

#include <charconv>
#include <cstring>
#include <string_view>
#include <utility>

namespace domaindump::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

// Опция со значением
struct ValueOption {
    const char* short_name;  // nullptr если нет
    const char* long_name;
    const char* metavar;
};

constexpr ValueOption OPT_USER = {"-u", "--user", "USERNAME"};
constexpr ValueOption OPT_PASSWORD = {"-p", "--password", "PASSWORD"};
constexpr ValueOption OPT_OUTDIR = {"-o", "--outdir", "DIRECTORY"};
constexpr ValueOption OPT_DELIMITER = {"-d", "--delimiter", "DELIMITER"};
constexpr ValueOption OPT_DNS_SERVER = {"-n", "--dns-server", "DNS_SERVER"};
constexpr ValueOption OPT_CONFIG = {"-c", "--config", "CONFIG"};
constexpr ValueOption OPT_BASE = {"-b", "--base", "BASE_DN"};
constexpr ValueOption OPT_NUM_THREADS = {nullptr, "--num-threads", "NUM_THREADS"};

std::string option_label(const ValueOption& opt) {
    return std::string(opt.long_name) + " <" + opt.metavar + ">";
}

// Совпадение аргумента с опцией; inline_value - часть после '=' в "--long=value"
bool matches(const char* arg, const ValueOption& opt, std::optional<std::string>& inline_value) {
    inline_value.reset();
    if (opt.short_name != nullptr && str_eq(arg, opt.short_name)) {
        return true;
    }
    if (str_eq(arg, opt.long_name)) {
        return true;
    }
    std::size_t len = std::strlen(opt.long_name);
    if (std::strncmp(arg, opt.long_name, len) == 0 && arg[len] == '=') {
        inline_value = std::string(arg + len + 1);
        return true;
    }
    return false;
}

std::optional<int> parse_positive_int(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

// Разворот "\t" в настоящий таб: в shell удобнее передать escape-последовательность
std::string unescape_delimiter(const std::string& text) {
    if (text == "\\t") {
        return "\t";
    }
    return text;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("domaindump ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: domaindump [OPTIONS] <HOSTNAME>\n"
           "\n"
           "Arguments:\n"
           "  <HOSTNAME>  Hostname/ip or ldap://host:port connection string to connect to\n"
           "\n"
           "Main options:\n"
           "  -u, --user <USERNAME>        DOMAIN\\username for authentication, leave empty for\n"
           "                               anonymous authentication\n"
           "  -p, --password <PASSWORD>    Password, will prompt if not specified\n"
           "  -c, --config <CONFIG>        YAML configuration file\n"
           "  -b, --base <BASE_DN>         Search base (default: defaultNamingContext)\n"
           "\n"
           "Output options:\n"
           "  -o, --outdir <DIRECTORY>     Directory in which the dump will be saved\n"
           "                               (default: current)\n"
           "      --no-html                Disable HTML output\n"
           "      --no-json                Disable JSON output\n"
           "      --no-grep                Disable Greppable output\n"
           "  -d, --delimiter <DELIMITER>  Field delimiter for greppable output (default: tab)\n"
           "\n"
           "Misc options:\n"
           "  -r, --resolve                Resolve computer hostnames (might take a while and\n"
           "                               cause high traffic on large networks)\n"
           "  -n, --dns-server <DNS_SERVER>\n"
           "                               Use custom DNS resolver instead of system DNS (try a\n"
           "                               domain controller IP)\n"
           "      --num-threads <NUM_THREADS>\n"
           "                               Limit the resolver thread number (default: num of\n"
           "                               CPUs)\n"
           "      --no-banner              Hide the banner\n"
           "  -v...                        Print verbose output\n"
           "  -q                           Suppress informational output\n"
           "  -h, --help                   Print help\n"
           "  -V, --version                Print version\n";
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg +
           "\n\n"
           "Usage: domaindump [OPTIONS] <HOSTNAME>\n\n"
           "For more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help();
        return result;
    }

    auto usage_error = [&result](const std::string& message) {
        result.ok = false;
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_usage_error("error: " + message);
        return result;
    };

    DumpCommand dump_cmd;
    bool have_host = false;
    std::optional<std::string> inline_value;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Значение опции: "--opt=value" либо следующий аргумент
        auto take_value = [&]() -> std::optional<std::string> {
            if (inline_value) {
                return inline_value;
            }
            if (i + 1 < argc) {
                ++i;
                return std::string(argv[i]);
            }
            return std::nullopt;
        };

        const ValueOption* value_options[] = {&OPT_USER,       &OPT_PASSWORD, &OPT_OUTDIR,
                                              &OPT_DELIMITER,  &OPT_DNS_SERVER, &OPT_CONFIG,
                                              &OPT_BASE,       &OPT_NUM_THREADS};
        const ValueOption* matched = nullptr;
        for (const auto* opt : value_options) {
            if (matches(arg, *opt, inline_value)) {
                matched = opt;
                break;
            }
        }

        if (matched != nullptr) {
            auto value = take_value();
            if (!value) {
                return usage_error("a value is required for '" + option_label(*matched) +
                                   "' but none was supplied");
            }
            if (matched == &OPT_USER) {
                dump_cmd.user = *value;
            } else if (matched == &OPT_PASSWORD) {
                dump_cmd.password = *value;
            } else if (matched == &OPT_OUTDIR) {
                dump_cmd.outdir = *value;
            } else if (matched == &OPT_DELIMITER) {
                dump_cmd.delimiter = unescape_delimiter(*value);
            } else if (matched == &OPT_DNS_SERVER) {
                dump_cmd.dns_server = *value;
            } else if (matched == &OPT_CONFIG) {
                dump_cmd.config_path = *value;
            } else if (matched == &OPT_BASE) {
                dump_cmd.base_dn = *value;
            } else if (matched == &OPT_NUM_THREADS) {
                auto threads = parse_positive_int(*value);
                if (!threads) {
                    return usage_error("invalid value '" + *value + "' for '" +
                                       option_label(*matched) +
                                       "': expected a positive integer");
                }
                result.global.num_threads = threads;
            }
        } else if (str_eq(arg, "--no-html")) {
            dump_cmd.no_html = true;
        } else if (str_eq(arg, "--no-json")) {
            dump_cmd.no_json = true;
        } else if (str_eq(arg, "--no-grep")) {
            dump_cmd.no_grep = true;
        } else if (str_eq(arg, "-r") || str_eq(arg, "--resolve")) {
            dump_cmd.resolve = true;
        } else if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            return usage_error(std::string("unexpected argument '") + arg + "' found");
        } else if (!have_host) {
            dump_cmd.host = arg;
            have_host = true;
        } else {
            return usage_error(std::string("unexpected argument '") + arg + "' found");
        }
    }

    if (!have_host || dump_cmd.host.empty()) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            "error: the following required arguments were not provided:\n"
            "  <HOSTNAME>\n\n"
            "Usage: domaindump [OPTIONS] <HOSTNAME>\n\n"
            "For more information, try '--help'.\n";
        return result;
    }

    // Имя пользователя без домена: ошибка времени выполнения, не разбора
    if (dump_cmd.user && dump_cmd.user->find('\\') == std::string::npos) {
        result.diagnostic.exit_code = 1;
        result.diagnostic.stderr_message =
            output::format_error("Username must include a domain, use: DOMAIN\\username");
        return result;
    }

    if (dump_cmd.delimiter && dump_cmd.delimiter->empty()) {
        return usage_error("the delimiter must not be empty");
    }

    result.ok = true;
    result.command = std::move(dump_cmd);
    return result;
}

// ----------------------------------------------------------------------------
// anonymous_bind_notice
// ----------------------------------------------------------------------------

std::string anonymous_bind_notice(const DumpCommand& cmd) {
    if (cmd.user && !cmd.user->empty()) {
        return {};
    }
    return "Connecting as anonymous user, dumping will probably fail. "
           "Consider specifying a username/password to login with";
}

// ----------------------------------------------------------------------------
// apply_overrides
// ----------------------------------------------------------------------------

void apply_overrides(const DumpCommand& cmd, const GlobalOptions& global,
                     config::DumpConfig& cfg) {
    if (cmd.outdir) {
        cfg.basepath = *cmd.outdir;
    }
    if (cmd.no_html) {
        cfg.output_html = false;
    }
    if (cmd.no_json) {
        cfg.output_json = false;
    }
    if (cmd.no_grep) {
        cfg.output_grep = false;
    }
    if (cmd.delimiter) {
        cfg.grep_delimiter = *cmd.delimiter;
    }
    if (cmd.resolve) {
        cfg.lookup_hostnames = true;
    }
    if (cmd.dns_server) {
        cfg.dns_server = *cmd.dns_server;
    }
    if (cmd.base_dn) {
        cfg.base_dn = *cmd.base_dn;
    }
    if (global.num_threads) {
        cfg.num_threads = *global.num_threads;
    }
}

}  // namespace domaindump::cli
