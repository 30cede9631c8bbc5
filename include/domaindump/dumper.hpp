// ==============================================================================
// domaindump/dumper.hpp - Снимок каталога и запись отчётов
// ==============================================================================
//
// Назначение:
// - DomainDumper: строго последовательный прогон
//     users -> computers -> groups -> [DNS] -> policy ->
//     users, groups, computers, users_by_group, computers_by_os, policy
// - ReportWriter: запись R.html / R.json / R.grep в каталог вывода
// - resolve_hostnames: ограниченный пул потоков для A-запросов
//
// Ошибки:
// - directory::DirectoryError при выборке - прогон прерывается до записи
//   каких-либо файлов
// - ReportError - каталог вывода или файл не удалось записать
// - сбои данных (SID, primary group, DNS, таблица стилей) - предупреждения
//
// ==============================================================================

#ifndef DOMAINDUMP_DUMPER_HPP
#define DOMAINDUMP_DUMPER_HPP

#include "domaindump/config.hpp"
#include "domaindump/decode.hpp"
#include "domaindump/directory.hpp"
#include "domaindump/entity.hpp"
#include "domaindump/index.hpp"
#include "domaindump/output.hpp"
#include "domaindump/resolver.hpp"

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace domaindump::dump {

// ----------------------------------------------------------------------------
// Запросы и столбцы
// ----------------------------------------------------------------------------

constexpr const char* USERS_FILTER = "(&(objectCategory=person)(objectClass=user))";
constexpr const char* COMPUTERS_FILTER = "(objectClass=user)";
constexpr const char* GROUPS_FILTER = "(objectClass=group)";
constexpr const char* POLICY_FILTER = "(cn=Builtin)";

/// Атрибут с результатом разрешения имени компьютера
constexpr const char* IPV4_ATTRIBUTE = "IPv4";

/// База поиска компьютеров
std::string computers_base(const std::string& root);

std::vector<std::string> user_columns();
std::vector<std::string> group_columns();
std::vector<std::string> computer_columns(bool with_ipv4);
std::vector<std::string> policy_columns();

/// Заголовки секций списочных HTML-отчётов (якорь cn_<id>)
constexpr const char* USERS_TITLE = "Domain users";
constexpr const char* GROUPS_TITLE = "Domain groups";
constexpr const char* COMPUTERS_TITLE = "Domain computer accounts";
constexpr const char* POLICY_TITLE = "Domain policy";

// ----------------------------------------------------------------------------
// Снимок
// ----------------------------------------------------------------------------

struct Snapshot {
    std::string root;
    std::vector<Entity> users;
    std::vector<Entity> computers;
    std::vector<Entity> groups;
    std::vector<Entity> policy;
};

// ----------------------------------------------------------------------------
// Разрешение имён
// ----------------------------------------------------------------------------

struct ResolveStats {
    std::size_t resolved = 0;
    std::size_t nxdomain = 0;
    std::size_t timeout = 0;
    std::size_t no_hostname = 0;
};

/// Набор потоков, присоединяемых в деструкторе, в том числе при раскрутке
/// стека после сбоя создания очередного потока
class ThreadGroup {
public:
    ThreadGroup() = default;
    ~ThreadGroup() { join(); }

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    template <typename Fn>
    void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    /// Дождаться всех запущенных потоков
    void join();

    std::size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

/// Число рабочих потоков: requested > 0 - как есть, иначе число аппаратных
/// потоков; не больше числа задач и не меньше 1
std::size_t worker_count(int requested, std::size_t tasks);

/// Установить атрибут IPv4 каждому компьютеру (адрес или sentinel-строка).
/// Каждый рабочий поток пишет только в свои записи.
ResolveStats resolve_hostnames(std::vector<Entity>& computers, resolver::HostResolver& resolver,
                               int num_threads);

// ----------------------------------------------------------------------------
// Запись отчётов
// ----------------------------------------------------------------------------

class ReportError : public std::runtime_error {
public:
    explicit ReportError(const std::string& message) : std::runtime_error(message) {}
};

struct ReportSummary {
    std::string name;  // базовое имя отчёта
    std::size_t entries = 0;
    std::vector<std::string> files;
};

class ReportWriter {
public:
    /// Таблица стилей загружается один раз; сбой - предупреждение
    ReportWriter(const config::DumpConfig& config, output::Writer& writer);

    /// Отчёт по списку записей: html / json / grep (включённые форматы)
    /// @throws ReportError
    ReportSummary write_list(const std::string& basename, const std::string& title,
                             const std::vector<Entity>& entities,
                             const std::vector<std::string>& columns);

    /// Сгруппированный отчёт: html / json
    /// @throws ReportError
    ReportSummary write_grouped(const std::string& basename, const std::vector<Entity>& entities,
                                const index::GroupedEntities& grouped,
                                const std::vector<std::string>& columns);

    bool has_stylesheet() const { return !stylesheet_.empty(); }

private:
    std::filesystem::path output_dir();
    std::string write_file(const std::string& filename, const std::string& content);

    const config::DumpConfig& config_;
    output::Writer& writer_;
    decode::DecodeContext context_;
    std::string stylesheet_;
    bool dir_ready_ = false;
};

// ----------------------------------------------------------------------------
// DomainDumper
// ----------------------------------------------------------------------------

struct DumpSummary {
    std::string root;
    std::vector<ReportSummary> reports;
    std::size_t warnings = 0;
    ResolveStats dns;
};

class DomainDumper {
public:
    /// resolver может быть nullptr, если разрешение имён выключено
    DomainDumper(directory::DirectorySource& directory, resolver::HostResolver* resolver,
                 const config::DumpConfig& config, output::Writer& writer);

    /// Все выборки и (при включённом разрешении) DNS
    /// @throws directory::DirectoryError
    Snapshot fetch();

    /// Полный прогон: fetch + запись всех отчётов
    /// @throws directory::DirectoryError, ReportError
    DumpSummary run();

private:
    void warn(const std::string& message);

    directory::DirectorySource& directory_;
    resolver::HostResolver* resolver_;
    const config::DumpConfig& config_;
    output::Writer& writer_;
    std::size_t warnings_ = 0;
    ResolveStats dns_;
};

}  // namespace domaindump::dump

#endif  // DOMAINDUMP_DUMPER_HPP
