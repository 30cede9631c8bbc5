// ==============================================================================
// domaindump/config.hpp - Конфигурация прогона
// ==============================================================================
//
// Назначение:
// - DumpConfig: каталог вывода, имена отчётов, включённые форматы,
//   разрешение имён хостов, параметры каталога
// - Загрузка из YAML (yaml-cpp); значения командной строки применяются
//   поверх загруженных (см. cli::apply_overrides)
//
// Формат файла (все ключи необязательны):
//
//   output:
//     directory: ./dump
//     html: true
//     json: true
//     grep: true
//     delimiter: "\t"
//     stylesheet: /usr/share/domaindump/style.css
//   reports:
//     users: domain_users
//     groups: domain_groups
//     computers: domain_computers
//     policy: domain_policy
//     users_by_group: domain_users_by_group
//     computers_by_os: domain_computers_by_os
//   resolve:
//     enabled: false
//     dns_server: 10.0.0.1
//     timeout: 2
//     threads: 0
//   directory:
//     base_dn: DC=corp,DC=local
//     page_size: 500
//     timeout: 30
//   unresolved_primary_group: unknown   # unknown | skip
//
// ==============================================================================

#ifndef DOMAINDUMP_CONFIG_HPP
#define DOMAINDUMP_CONFIG_HPP

#include "domaindump/index.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace domaindump::config {

/// Путь к таблице стилей по умолчанию (задаётся при сборке)
std::string default_stylesheet_path();

struct DumpConfig {
    // Вывод
    std::string basepath = ".";
    bool output_html = true;
    bool output_json = true;
    bool output_grep = true;
    std::string grep_delimiter = "\t";
    std::string stylesheet = default_stylesheet_path();

    // Базовые имена отчётов
    std::string users_basename = "domain_users";
    std::string groups_basename = "domain_groups";
    std::string computers_basename = "domain_computers";
    std::string policy_basename = "domain_policy";
    std::string users_by_group_basename = "domain_users_by_group";
    std::string computers_by_os_basename = "domain_computers_by_os";

    // Разрешение имён хостов
    bool lookup_hostnames = false;
    std::string dns_server;
    int dns_timeout_seconds = 2;
    int num_threads = 0;  // 0 = число аппаратных потоков

    // Каталог
    std::string base_dn;  // пусто = defaultNamingContext
    int page_size = 500;
    int ldap_timeout_seconds = 30;

    index::UnresolvedGroupPolicy unresolved_group = index::UnresolvedGroupPolicy::Unknown;
};

struct ConfigResult {
    bool ok = false;
    DumpConfig config;
    std::string error;
};

/// Загрузить конфигурацию из YAML-файла; отсутствующие ключи - значения по умолчанию
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из YAML-текста
ConfigResult parse_config(std::string_view yaml);

/// "unknown" / "skip" (регистронезависимо)
std::optional<index::UnresolvedGroupPolicy> parse_group_policy(std::string_view text);

/// Проверка согласованности значений; пустая строка - всё в порядке
std::string validate(const DumpConfig& config);

}  // namespace domaindump::config

#endif  // DOMAINDUMP_CONFIG_HPP
