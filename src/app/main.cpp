// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Конфигурация: YAML-файл + значения командной строки
// 4. Соединение с каталогом, прогон DomainDumper
// 5. Таблица итогов, exit code
//
// Исключения перехватываются на границе app: "[x] <err>", exit code 1.
//
// ==============================================================================

#include "domaindump/cli.hpp"
#include "domaindump/config.hpp"
#include "domaindump/directory.hpp"
#include "domaindump/dumper.hpp"
#include "domaindump/output.hpp"
#include "domaindump/platform.hpp"
#include "domaindump/resolver.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

namespace {

constexpr const char* BANNER = R"(
     _                       _           _
  __| | ___  _ __ ___   __ _(_)_ __   __| |_   _ _ __ ___  _ __
 / _` |/ _ \| '_ ` _ \ / _` | | '_ \ / _` | | | | '_ ` _ \| '_ \
| (_| | (_) | | | | | | (_| | | | | | (_| | |_| | | | | | | |_) |
 \__,_|\___/|_| |_| |_|\__,_|_|_| |_|\__,_|\__,_|_| |_| |_| .__/
                                                          |_|
)";

void print_banner(domaindump::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.green_line_stderr(BANNER);
}

void print_summary(domaindump::output::Writer& writer, const domaindump::dump::DumpSummary& summary) {
    using namespace domaindump;

    output::Table table;
    table.set_headers({"Report", "Entries", "Files"});
    for (const auto& report : summary.reports) {
        std::string files;
        for (const auto& f : report.files) {
            if (!files.empty()) {
                files += ", ";
            }
            files += f;
        }
        table.add_row({report.name, std::to_string(report.entries), files.empty() ? "-" : files});
    }
    table.print(writer);
}

int run_dump(const domaindump::cli::DumpCommand& cmd, const domaindump::cli::GlobalOptions& global,
             domaindump::output::Writer& writer) {
    using namespace domaindump;

    config::DumpConfig cfg;
    if (cmd.config_path) {
        auto loaded = config::load_config(platform::path_from_utf8(*cmd.config_path));
        if (!loaded.ok) {
            writer.error(loaded.error);
            return 1;
        }
        cfg = loaded.config;
        writer.debug("loaded configuration from " + *cmd.config_path);
    }
    cli::apply_overrides(cmd, global, cfg);
    if (auto problem = config::validate(cfg); !problem.empty()) {
        writer.error(problem);
        return 1;
    }

    directory::LdapOptions ldap;
    ldap.host = cmd.host;
    ldap.page_size = cfg.page_size;
    ldap.timeout_seconds = cfg.ldap_timeout_seconds;
    if (cmd.user) {
        ldap.user = *cmd.user;
        if (cmd.password) {
            ldap.password = *cmd.password;
        } else {
            auto password = platform::read_password("Password: ");
            if (!password) {
                writer.error("no password supplied");
                return 1;
            }
            ldap.password = *password;
        }
    }

    std::unique_ptr<resolver::DnsResolver> dns;
    if (cfg.lookup_hostnames) {
        resolver::DnsOptions dns_options;
        dns_options.server = cfg.dns_server;
        dns_options.timeout_seconds = cfg.dns_timeout_seconds;
        dns = std::make_unique<resolver::DnsResolver>(dns_options);
    }

    if (auto notice = cli::anonymous_bind_notice(cmd); !notice.empty()) {
        writer.info(notice);
    }
    writer.info("Connecting to host...");
    try {
        directory::LdapDirectory directory(ldap);
        writer.info(ldap.user.empty() ? "Bound anonymously" : "Bind OK");

        writer.info("Starting domain dump");
        dump::DomainDumper dumper(directory, dns.get(), cfg, writer);
        auto summary = dumper.run();

        writer.info("Domain dump finished (" + summary.root + ")");
        if (summary.warnings > 0) {
            writer.warn(std::to_string(summary.warnings) + " warnings, see above");
        }
        if (!writer.config().quiet) {
            print_summary(writer, summary);
        }
    } catch (const directory::DirectoryError& e) {
        // Нет отчётов: выборка прерывается до записи файлов
        writer.error(e.what());
        return 1;
    }
    return 0;
}

int run(int argc, char** argv) {
    using namespace domaindump;

    auto parsed = cli::parse(argc, argv);
    if (!parsed.ok) {
        std::cerr << parsed.diagnostic.stderr_message;
        return parsed.diagnostic.exit_code;
    }

    if (std::holds_alternative<cli::HelpCommand>(parsed.command)) {
        std::cout << cli::render_help();
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parsed.command)) {
        std::cout << cli::render_version();
        return 0;
    }

    output::OutputConfig out_cfg;
    out_cfg.quiet = parsed.global.quiet;
    out_cfg.verbose = parsed.global.verbose;
    out_cfg.no_banner = parsed.global.no_banner;
    output::Writer writer(out_cfg);

    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);

    return run_dump(std::get<cli::DumpCommand>(parsed.command), parsed.global, writer);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << domaindump::output::format_error(e.what());
        return 1;
    } catch (...) {
        std::cerr << domaindump::output::format_error("Unknown error occurred");
        return 1;
    }
}
