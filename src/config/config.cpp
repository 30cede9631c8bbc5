// ==============================================================================
// config.cpp - Конфигурация прогона (yaml-cpp)
// ==============================================================================

#include "domaindump/config.hpp"

#include "domaindump/entity.hpp"
#include "domaindump/platform.hpp"

#include <fstream>

#include <yaml-cpp/yaml.h>

namespace domaindump::config {

namespace {

// Необязательный скаляр: значение ключа, если он есть
template <typename T>
void read_scalar(const YAML::Node& node, const char* key, T& target) {
    if (node && node[key]) {
        target = node[key].as<T>();
    }
}

bool apply_yaml(const YAML::Node& root, DumpConfig& cfg, std::string& error) {
    if (!root || root.IsNull()) {
        return true;
    }
    if (!root.IsMap()) {
        error = "configuration root must be a mapping";
        return false;
    }

    if (const YAML::Node output = root["output"]) {
        read_scalar(output, "directory", cfg.basepath);
        read_scalar(output, "html", cfg.output_html);
        read_scalar(output, "json", cfg.output_json);
        read_scalar(output, "grep", cfg.output_grep);
        read_scalar(output, "delimiter", cfg.grep_delimiter);
        read_scalar(output, "stylesheet", cfg.stylesheet);
    }

    if (const YAML::Node reports = root["reports"]) {
        read_scalar(reports, "users", cfg.users_basename);
        read_scalar(reports, "groups", cfg.groups_basename);
        read_scalar(reports, "computers", cfg.computers_basename);
        read_scalar(reports, "policy", cfg.policy_basename);
        read_scalar(reports, "users_by_group", cfg.users_by_group_basename);
        read_scalar(reports, "computers_by_os", cfg.computers_by_os_basename);
    }

    if (const YAML::Node resolve = root["resolve"]) {
        read_scalar(resolve, "enabled", cfg.lookup_hostnames);
        read_scalar(resolve, "dns_server", cfg.dns_server);
        read_scalar(resolve, "timeout", cfg.dns_timeout_seconds);
        read_scalar(resolve, "threads", cfg.num_threads);
    }

    if (const YAML::Node directory = root["directory"]) {
        read_scalar(directory, "base_dn", cfg.base_dn);
        read_scalar(directory, "page_size", cfg.page_size);
        read_scalar(directory, "timeout", cfg.ldap_timeout_seconds);
    }

    if (root["unresolved_primary_group"]) {
        auto text = root["unresolved_primary_group"].as<std::string>();
        auto policy = parse_group_policy(text);
        if (!policy) {
            error = "invalid unresolved_primary_group '" + text + "' (expected unknown or skip)";
            return false;
        }
        cfg.unresolved_group = *policy;
    }

    error = validate(cfg);
    return error.empty();
}

}  // anonymous namespace

std::string default_stylesheet_path() {
#ifdef DOMAINDUMP_STYLESHEET_PATH
    return DOMAINDUMP_STYLESHEET_PATH;
#else
    return "";
#endif
}

std::optional<index::UnresolvedGroupPolicy> parse_group_policy(std::string_view text) {
    std::string lower = to_lower(text);
    if (lower == "unknown") {
        return index::UnresolvedGroupPolicy::Unknown;
    }
    if (lower == "skip") {
        return index::UnresolvedGroupPolicy::Skip;
    }
    return std::nullopt;
}

std::string validate(const DumpConfig& config) {
    if (config.grep_delimiter.empty()) {
        return "grep delimiter must not be empty";
    }
    if (config.dns_timeout_seconds <= 0) {
        return "DNS timeout must be positive";
    }
    if (config.num_threads < 0) {
        return "number of threads must not be negative";
    }
    if (config.page_size <= 0) {
        return "page size must be positive";
    }
    if (config.ldap_timeout_seconds <= 0) {
        return "directory timeout must be positive";
    }
    if (config.basepath.empty()) {
        return "output directory must not be empty";
    }
    return {};
}

ConfigResult parse_config(std::string_view yaml) {
    ConfigResult result;
    result.ok = false;

    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        result.ok = apply_yaml(root, result.config, result.error);
        return result;
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;
    result.ok = false;

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            result.error = "cannot open configuration file: " + platform::path_to_utf8(path);
            return result;
        }

        YAML::Node root = YAML::Load(file);
        result.ok = apply_yaml(root, result.config, result.error);
        if (!result.ok) {
            result.error = platform::path_to_utf8(path) + ": " + result.error;
        }
        return result;

    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

}  // namespace domaindump::config
