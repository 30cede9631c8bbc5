// ==============================================================================
// domaindump/index.hpp - Группировка записей (computers by OS, users by group)
// ==============================================================================
//
// Назначение:
// - Упорядоченное отображение ключ -> список записей (порядок ключей = порядок
//   первого появления, порядок записей внутри ключа = порядок входа)
// - Записи хранятся индексами в исходном списке: один пользователь может
//   присутствовать под несколькими ключами без копирования
// - Ошибки согласованности (неразрешённая primary group) возвращаются
//   значением, прогон не прерывается
//
// ==============================================================================

#ifndef DOMAINDUMP_INDEX_HPP
#define DOMAINDUMP_INDEX_HPP

#include "domaindump/entity.hpp"
#include "domaindump/identity.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace domaindump::index {

/// Ключ для записей без классифицирующего атрибута
constexpr const char* UNKNOWN_KEY = "Unknown";

struct Group {
    std::string key;
    std::vector<std::size_t> members;  // индексы в исходном списке
};

class GroupedEntities {
public:
    /// Добавить запись под ключ (ключ создаётся при первом появлении)
    void add(const std::string& key, std::size_t member);

    const std::vector<Group>& groups() const { return groups_; }

    /// nullptr если ключа нет
    const Group* find(const std::string& key) const;

    std::size_t size() const { return groups_.size(); }
    bool empty() const { return groups_.empty(); }

    /// Суммарное число вхождений по всем ключам
    std::size_t total_members() const;

private:
    std::vector<Group> groups_;
    std::unordered_map<std::string, std::size_t> positions_;
};

/// Компьютеры по operatingSystem; без атрибута - "Unknown"
GroupedEntities group_by_os(const std::vector<Entity>& computers);

// ----------------------------------------------------------------------------
// Пользователи по группам
// ----------------------------------------------------------------------------

/// Что делать, если primary group пользователя не найдена в таблице RID
enum class UnresolvedGroupPolicy {
    Unknown,  // поместить пользователя под ключ "Unknown"
    Skip      // не добавлять запись primary group
};

enum class MembershipFaultKind {
    MissingPrimaryGroupId,  // нет primaryGroupID или он не целое число
    UnresolvedPrimaryGroup  // RID отсутствует в таблице (таблица неполна/устарела)
};

struct MembershipFault {
    MembershipFaultKind kind;
    std::string user_dn;
    std::int64_t primary_group_id = 0;

    std::string message() const;
};

struct Membership {
    GroupedEntities groups;
    std::vector<MembershipFault> faults;
};

/// Для каждого пользователя: имена из memberOf (cn первого RDN) плюс primary
/// group через таблицу RID. Пользователь добавляется под каждое имя.
/// Каждый сбой разрешения primary group попадает в Membership::faults.
Membership group_by_membership(const std::vector<Entity>& users, const identity::RidMap& rid_map,
                               UnresolvedGroupPolicy policy = UnresolvedGroupPolicy::Unknown);

}  // namespace domaindump::index

#endif  // DOMAINDUMP_INDEX_HPP
