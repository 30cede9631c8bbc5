// ==============================================================================
// dumper.cpp - Снимок каталога и запись отчётов
// ==============================================================================

#include "domaindump/dumper.hpp"

#include "domaindump/identity.hpp"
#include "domaindump/platform.hpp"
#include "domaindump/render.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

namespace domaindump::dump {

// ----------------------------------------------------------------------------
// Запросы и столбцы
// ----------------------------------------------------------------------------

std::string computers_base(const std::string& root) {
    return "CN=Computers," + root;
}

std::vector<std::string> user_columns() {
    return {"cn",         "name",           "sAMAccountName", "memberOf",
            "whenCreated", "whenChanged",   "lastLogon",      "userAccountControl",
            "pwdLastSet", "objectSid",      "description"};
}

std::vector<std::string> group_columns() {
    return {"cn", "sAMAccountName", "whenCreated", "whenChanged", "description", "objectSid"};
}

std::vector<std::string> computer_columns(bool with_ipv4) {
    std::vector<std::string> columns = {"cn", "sAMAccountName", "dNSHostName"};
    if (with_ipv4) {
        columns.emplace_back(IPV4_ATTRIBUTE);
    }
    for (const char* name : {"operatingSystem", "operatingSystemServicePack",
                             "operatingSystemVersion", "lastLogon", "userAccountControl",
                             "whenCreated", "objectSid", "description"}) {
        columns.emplace_back(name);
    }
    return columns;
}

std::vector<std::string> policy_columns() {
    return {"cn",        "lockOutObservationWindow", "lockoutDuration",
            "lockoutThreshold", "maxPwdAge",         "minPwdAge",
            "minPwdLength",     "pwdHistoryLength",  "pwdProperties"};
}

// ----------------------------------------------------------------------------
// Разрешение имён
// ----------------------------------------------------------------------------

namespace {

enum class Outcome { Resolved, NxDomain, Timeout, NoHostname };

Outcome outcome_of(resolver::ResolveStatus status) {
    switch (status) {
    case resolver::ResolveStatus::Ok:
        return Outcome::Resolved;
    case resolver::ResolveStatus::NxDomain:
        return Outcome::NxDomain;
    case resolver::ResolveStatus::Timeout:
        return Outcome::Timeout;
    }
    return Outcome::Timeout;
}

}  // anonymous namespace

void ThreadGroup::join() {
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

std::size_t worker_count(int requested, std::size_t tasks) {
    std::size_t workers = 0;
    if (requested > 0) {
        workers = static_cast<std::size_t>(requested);
    } else {
        workers = std::thread::hardware_concurrency();
    }
    if (workers == 0) {
        workers = 1;
    }
    return std::max<std::size_t>(1, std::min(workers, tasks));
}

ResolveStats resolve_hostnames(std::vector<Entity>& computers, resolver::HostResolver& resolver,
                               int num_threads) {
    std::vector<Outcome> outcomes(computers.size(), Outcome::Timeout);
    std::atomic<std::size_t> next{0};

    auto work = [&](std::exception_ptr& failure) {
        try {
            for (;;) {
                std::size_t i = next.fetch_add(1);
                if (i >= computers.size()) {
                    return;
                }
                Entity& computer = computers[i];
                auto host = computer.first_string("dNSHostName");
                if (!host || host->empty()) {
                    computer.set(IPV4_ATTRIBUTE, Value(resolver::SENTINEL_NOHOSTNAME));
                    outcomes[i] = Outcome::NoHostname;
                    continue;
                }
                auto result = resolver.resolve_a(*host);
                computer.set(IPV4_ATTRIBUTE, Value(resolver::ipv4_value(result)));
                outcomes[i] = outcome_of(result.status);
            }
        } catch (...) {
            // Передаётся вызывающему после join
            failure = std::current_exception();
            next.store(computers.size());
        }
    };

    std::size_t workers = worker_count(num_threads, computers.size());
    std::vector<std::exception_ptr> failures(workers);

    if (workers == 1) {
        work(failures[0]);
    } else {
        ThreadGroup threads;
        try {
            for (std::size_t w = 0; w < workers; ++w) {
                threads.spawn([&work, &failure = failures[w]] { work(failure); });
            }
        } catch (...) {
            // Уже запущенные потоки останавливаются и присоединяются в ~ThreadGroup
            next.store(computers.size());
            throw;
        }
        threads.join();
    }

    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    ResolveStats stats;
    for (Outcome o : outcomes) {
        switch (o) {
        case Outcome::Resolved:
            ++stats.resolved;
            break;
        case Outcome::NxDomain:
            ++stats.nxdomain;
            break;
        case Outcome::Timeout:
            ++stats.timeout;
            break;
        case Outcome::NoHostname:
            ++stats.no_hostname;
            break;
        }
    }
    return stats;
}

// ----------------------------------------------------------------------------
// ReportWriter
// ----------------------------------------------------------------------------

ReportWriter::ReportWriter(const config::DumpConfig& config, output::Writer& writer)
    : config_(config), writer_(writer) {
    context_.users_by_group_file = config_.users_by_group_basename;

    if (!config_.output_html) {
        return;
    }
    if (config_.stylesheet.empty()) {
        writer_.warn("no stylesheet configured, styling will be skipped");
        return;
    }
    std::ifstream css(platform::path_from_utf8(config_.stylesheet), std::ios::binary);
    if (!css.is_open()) {
        writer_.warn("stylesheet " + config_.stylesheet +
                     " not found, styling will be skipped");
        return;
    }
    std::ostringstream content;
    content << css.rdbuf();
    stylesheet_ = content.str();
    writer_.debug("loaded stylesheet " + config_.stylesheet);
}

std::filesystem::path ReportWriter::output_dir() {
    auto dir = platform::path_from_utf8(config_.basepath);
    if (!dir_ready_) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw ReportError("cannot create output directory " + config_.basepath + ": " +
                              ec.message());
        }
        dir_ready_ = true;
    }
    return dir;
}

std::string ReportWriter::write_file(const std::string& filename, const std::string& content) {
    auto path = output_dir() / platform::path_from_utf8(filename);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw ReportError("cannot open " + platform::path_to_utf8(path) + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw ReportError("failed to write " + platform::path_to_utf8(path));
    }
    writer_.trace("wrote " + platform::path_to_utf8(path));
    return filename;
}

ReportSummary ReportWriter::write_list(const std::string& basename, const std::string& title,
                                       const std::vector<Entity>& entities,
                                       const std::vector<std::string>& columns) {
    ReportSummary summary;
    summary.name = basename;
    summary.entries = entities.size();

    // Все форматы читают одни и те же декодированные записи
    auto decoded = decode::decode_entities(entities, context_);
    auto refs = render::all_of(decoded);

    if (config_.output_html) {
        render::HtmlTable table;
        table.append_section(refs, columns, title);
        summary.files.push_back(write_file(
            basename + ".html", render::render_html_page(table.to_string(), stylesheet_)));
    }
    if (config_.output_json) {
        auto doc = render::json_entity_list(refs);
        summary.files.push_back(write_file(basename + ".json", render::serialize_json(doc, true)));
    }
    if (config_.output_grep) {
        summary.files.push_back(write_file(
            basename + ".grep", render::grep_list(refs, columns, config_.grep_delimiter)));
    }
    return summary;
}

ReportSummary ReportWriter::write_grouped(const std::string& basename,
                                          const std::vector<Entity>& entities,
                                          const index::GroupedEntities& grouped,
                                          const std::vector<std::string>& columns) {
    ReportSummary summary;
    summary.name = basename;
    summary.entries = grouped.total_members();

    auto decoded = decode::decode_entities(entities, context_);

    if (config_.output_html) {
        auto table = render::grouped_html_table(decoded, grouped, columns);
        summary.files.push_back(write_file(
            basename + ".html", render::render_html_page(table.to_string(), stylesheet_)));
    }
    if (config_.output_json) {
        auto doc = render::json_grouped_list(decoded, grouped);
        summary.files.push_back(write_file(basename + ".json", render::serialize_json(doc, true)));
    }
    return summary;
}

// ----------------------------------------------------------------------------
// DomainDumper
// ----------------------------------------------------------------------------

DomainDumper::DomainDumper(directory::DirectorySource& directory,
                           resolver::HostResolver* resolver, const config::DumpConfig& config,
                           output::Writer& writer)
    : directory_(directory), resolver_(resolver), config_(config), writer_(writer) {
    if (config_.lookup_hostnames && resolver_ == nullptr) {
        throw std::invalid_argument("hostname resolution is enabled but no resolver was given");
    }
}

void DomainDumper::warn(const std::string& message) {
    ++warnings_;
    writer_.warn(message);
}

Snapshot DomainDumper::fetch() {
    Snapshot snap;
    snap.root = config_.base_dn.empty() ? directory_.default_naming_context() : config_.base_dn;
    writer_.debug("search root: " + snap.root);

    snap.users = directory_.search(snap.root, USERS_FILTER);
    writer_.info("Found " + std::to_string(snap.users.size()) + " users");

    snap.computers = directory_.search(computers_base(snap.root), COMPUTERS_FILTER);
    writer_.info("Found " + std::to_string(snap.computers.size()) + " computers");

    snap.groups = directory_.search(snap.root, GROUPS_FILTER);
    writer_.info("Found " + std::to_string(snap.groups.size()) + " groups");

    if (config_.lookup_hostnames) {
        writer_.info("Resolving " + std::to_string(snap.computers.size()) +
                     " computer hostnames");
        dns_ = resolve_hostnames(snap.computers, *resolver_, config_.num_threads);
        writer_.debug("DNS: " + std::to_string(dns_.resolved) + " resolved, " +
                      std::to_string(dns_.nxdomain) + " NXDOMAIN, " +
                      std::to_string(dns_.timeout) + " timeouts, " +
                      std::to_string(dns_.no_hostname) + " without hostname");
        if (dns_.timeout > 0) {
            warn(std::to_string(dns_.timeout) + " hostname lookups timed out or failed");
        }
    }

    snap.policy = directory_.search(snap.root, POLICY_FILTER);
    writer_.debug("Found " + std::to_string(snap.policy.size()) + " policy entries");

    return snap;
}

DumpSummary DomainDumper::run() {
    warnings_ = 0;
    dns_ = ResolveStats{};

    Snapshot snap = fetch();

    ReportWriter reports(config_, writer_);
    if (config_.output_html && !reports.has_stylesheet()) {
        ++warnings_;
    }

    DumpSummary summary;
    summary.root = snap.root;

    summary.reports.push_back(
        reports.write_list(config_.users_basename, USERS_TITLE, snap.users, user_columns()));
    summary.reports.push_back(
        reports.write_list(config_.groups_basename, GROUPS_TITLE, snap.groups, group_columns()));
    summary.reports.push_back(reports.write_list(config_.computers_basename, COMPUTERS_TITLE,
                                                 snap.computers,
                                                 computer_columns(config_.lookup_hostnames)));

    identity::RidMap rid_map = identity::build_rid_map(snap.groups);
    for (const auto& fault : rid_map.faults) {
        warn(fault.message());
    }
    index::Membership membership =
        index::group_by_membership(snap.users, rid_map, config_.unresolved_group);
    for (const auto& fault : membership.faults) {
        warn(fault.message());
    }
    summary.reports.push_back(reports.write_grouped(
        config_.users_by_group_basename, snap.users, membership.groups, user_columns()));

    index::GroupedEntities by_os = index::group_by_os(snap.computers);
    summary.reports.push_back(
        reports.write_grouped(config_.computers_by_os_basename, snap.computers, by_os,
                              computer_columns(config_.lookup_hostnames)));

    summary.reports.push_back(
        reports.write_list(config_.policy_basename, POLICY_TITLE, snap.policy, policy_columns()));

    summary.warnings = warnings_;
    summary.dns = dns_;
    return summary;
}

}  // namespace domaindump::dump
