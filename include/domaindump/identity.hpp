// ==============================================================================
// domaindump/identity.hpp - Разрешение идентичности групп
// ==============================================================================
//
// Назначение:
// - Разбор DN на RDN-компоненты и снятие экранирования
// - Имя группы из DN (значение первого RDN)
// - RID из строкового SID
// - Таблица RID -> имя группы (строится один раз за прогон)
// - Идентификаторы HTML-якорей (sanitize_id, url_encode)
//
// Соглашение: отображаемым именем записи считается значение ПЕРВОГО RDN её DN
// после снятия экранирования. Протокол этого не гарантирует; для записей
// Active Directory первый RDN - это CN.
//
// ==============================================================================

#ifndef DOMAINDUMP_IDENTITY_HPP
#define DOMAINDUMP_IDENTITY_HPP

#include "domaindump/entity.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace domaindump::identity {

// ----------------------------------------------------------------------------
// DN
// ----------------------------------------------------------------------------

/// Один компонент DN: type=value (value - как в DN, с экранированием)
struct Rdn {
    std::string type;
    std::string value;
};

/// Ошибка разбора DN (пустой компонент или компонент без '=')
class DnParseError : public std::runtime_error {
public:
    explicit DnParseError(const std::string& dn)
        : std::runtime_error("malformed distinguished name: '" + dn + "'") {}
};

/// Специальные символы DN, экранируемые обратным слешем
/// (пробел, '"', '#', '+', ',', ';', '<', '=', '>', '\\', NUL)
extern const std::string_view DN_SPECIAL_CHARS;

/// Разобрать DN на компоненты. Разделитель - неэкранированная ','.
/// Для многозначного RDN (a=1+b=2) сохраняется первая пара.
/// @throws DnParseError
std::vector<Rdn> parse_dn(std::string_view dn);

/// Снять экранирование специальных символов DN ("\\," -> ",")
/// Экранирование вида \XX (hex) также раскрывается.
std::string unescape_dn_component(std::string_view value);

/// Имя из DN: значение первого RDN без экранирования
/// @throws DnParseError
std::string cn_from_dn(std::string_view dn);

// ----------------------------------------------------------------------------
// Якоря
// ----------------------------------------------------------------------------

/// Заменить каждую серию символов вне [A-Za-z0-9_-] одним '_'
std::string sanitize_id(std::string_view name);

/// Form-URL-кодирование (пробел -> '+', незарезервированные символы как есть)
std::string url_encode(std::string_view text);

// ----------------------------------------------------------------------------
// SID / RID
// ----------------------------------------------------------------------------

/// RID = последний '-'-компонент SID как целое без знака.
/// Длина SID не предполагается. std::nullopt при невалидном RID.
std::optional<std::uint32_t> rid_from_sid(std::string_view sid);

/// Почему группа не попала в таблицу RID
enum class FaultKind {
    MissingSid,    // нет objectSid
    MalformedSid,  // RID не разбирается как целое
    MissingName    // нет cn
};

struct IdentityFault {
    FaultKind kind;
    std::string dn;
    std::string detail;

    /// Сообщение для потока предупреждений
    std::string message() const;
};

/// Таблица RID -> отображаемое имя группы
struct RidMap {
    std::unordered_map<std::uint32_t, std::string> names;
    std::vector<IdentityFault> faults;

    /// Имя группы по RID
    std::optional<std::string> lookup(std::uint32_t rid) const;
};

/// Построить таблицу по записям групп.
/// Группы с отсутствующим/невалидным SID или без cn пропускаются и
/// регистрируются в RidMap::faults - прогон не прерывается.
RidMap build_rid_map(const std::vector<Entity>& groups);

}  // namespace domaindump::identity

#endif  // DOMAINDUMP_IDENTITY_HPP
