// ==============================================================================
// domaindump/decode.hpp - Декодирование атрибутов в читаемый вид
// ==============================================================================
//
// Назначение:
// - Битовые флаги (userAccountControl, pwdProperties) -> имена флагов
// - Интервалы в тиках (100 нс) -> дни / минуты
// - Списки DN групп -> ссылки на отчёт "users by group"
// - Остальные значения -> естественное строковое представление
//
// Два выхода с общей таблицей решений (classify_attribute):
// - flat: простая строка (grep/JSON)
// - rich: последовательность текстовых фрагментов и ссылок (HTML);
//   HTML-экранирование выполняет сериализатор разметки
//
// ==============================================================================

#ifndef DOMAINDUMP_DECODE_HPP
#define DOMAINDUMP_DECODE_HPP

#include "domaindump/entity.hpp"
#include "domaindump/value.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace domaindump::decode {

// ----------------------------------------------------------------------------
// Таблицы флагов
// ----------------------------------------------------------------------------

struct FlagDef {
    std::string_view name;
    std::int64_t mask;
};

/// Флаги userAccountControl (порядок таблицы = порядок вывода)
inline constexpr std::array<FlagDef, 10> UAC_FLAGS = {{
    {"ACCOUNT_DISABLED", 0x00000002},
    {"ACCOUNT_LOCKED", 0x00000010},
    {"PASSWD_NOTREQD", 0x00000020},
    {"PASSWD_CANT_CHANGE", 0x00000040},
    {"NORMAL_ACCOUNT", 0x00000200},
    {"WORKSTATION_ACCOUNT", 0x00001000},
    {"SERVER_TRUST_ACCOUNT", 0x00002000},
    {"DONT_EXPIRE_PASSWD", 0x00010000},
    {"SMARTCARD_REQUIRED", 0x00040000},
    {"PASSWORD_EXPIRED", 0x00800000},
}};

/// Флаги pwdProperties
inline constexpr std::array<FlagDef, 6> PWD_FLAGS = {{
    {"PASSWORD_COMPLEX", 0x01},
    {"PASSWORD_NO_ANON_CHANGE", 0x02},
    {"PASSWORD_NO_CLEAR_CHANGE", 0x04},
    {"LOCKOUT_ADMINS", 0x08},
    {"PASSWORD_STORE_CLEARTEXT", 0x10},
    {"REFUSE_PASSWORD_CHANGE", 0x20},
}};

/// Имена флагов, маска которых целиком входит в value, в порядке таблицы
template <std::size_t N>
std::vector<std::string> parse_flags(std::int64_t value, const std::array<FlagDef, N>& table) {
    std::vector<std::string> out;
    for (const auto& flag : table) {
        if ((value & flag.mask) == flag.mask) {
            out.emplace_back(flag.name);
        }
    }
    return out;
}

/// Склеить строки через ", "
std::string join(const std::vector<std::string>& items, std::string_view sep = ", ");

// ----------------------------------------------------------------------------
// Интервалы
// ----------------------------------------------------------------------------

/// |ticks| * 1e-7 / 86400
double ticks_to_days(std::int64_t ticks);

/// |ticks| * 1e-7 / 60
double ticks_to_minutes(std::int64_t ticks);

/// "%.2f days"
std::string format_days(std::int64_t ticks);

/// "%.1f minutes"
std::string format_minutes(std::int64_t ticks);

// ----------------------------------------------------------------------------
// Скалярные значения
// ----------------------------------------------------------------------------

/// strftime("%x %X") в UTC; "0" для лет вне 1900..9999
std::string format_timestamp(Timestamp ts);

/// Естественное строковое представление значения
std::string format_scalar(const Value& value);

// ----------------------------------------------------------------------------
// Таблица решений
// ----------------------------------------------------------------------------

enum class AttributeClass {
    AccountControl,      // useraccountcontrol
    GroupList,           // member, memberof
    PasswordProperties,  // pwdproperties
    PasswordAge,         // minpwdage, maxpwdage
    LockoutWindow,       // lockoutobservationwindow, lockoutduration
    Other
};

/// Класс атрибута по имени (регистронезависимо)
AttributeClass classify_attribute(std::string_view name);

// ----------------------------------------------------------------------------
// Rich-представление (разметка)
// ----------------------------------------------------------------------------

/// Фрагмент ячейки: текст, либо ссылка (href непуст)
struct RichPart {
    std::string text;
    std::string href;
    std::string title;

    bool is_link() const { return !href.empty(); }
};

using RichCell = std::vector<RichPart>;

/// Плоский текст rich-ячейки (ссылки -> их текст)
std::string rich_to_text(const RichCell& cell);

struct DecodeContext {
    /// Базовое имя отчёта "users by group" - цель ссылок на группы
    std::string users_by_group_file = "domain_users_by_group";
};

/// Плоское представление атрибута
std::string decode_flat(std::string_view name, const Value& value);

/// Rich-представление атрибута
RichCell decode_rich(std::string_view name, const Value& value, const DecodeContext& ctx);

// ----------------------------------------------------------------------------
// Декодированные записи
// ----------------------------------------------------------------------------

struct DecodedAttribute {
    std::string name;
    std::string flat;
    RichCell rich;
};

/// Запись, все присутствующие атрибуты которой декодированы один раз.
/// Все форматы отчёта читают одни и те же DecodedEntity.
struct DecodedEntity {
    std::string dn;
    const Entity* source = nullptr;
    std::vector<DecodedAttribute> attributes;

    /// nullptr если атрибута в исходной записи нет
    const DecodedAttribute* find(std::string_view name) const;
};

DecodedEntity decode_entity(const Entity& entity, const DecodeContext& ctx);

/// Декодировать список; DecodedEntity::source указывает в entities
std::vector<DecodedEntity> decode_entities(const std::vector<Entity>& entities,
                                           const DecodeContext& ctx);

}  // namespace domaindump::decode

#endif  // DOMAINDUMP_DECODE_HPP
