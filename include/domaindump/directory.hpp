// ==============================================================================
// domaindump/directory.hpp - Источник записей каталога
// ==============================================================================
//
// Назначение:
// - DirectorySource: абстрактный поиск "все записи по фильтру со всеми
//   атрибутами" (постраничная выборка - забота реализации)
// - DirectoryError: фатальные ошибки соединения / аутентификации / поиска
// - LdapDirectory: реализация поверх OpenLDAP (libldap)
//
// ==============================================================================

#ifndef DOMAINDUMP_DIRECTORY_HPP
#define DOMAINDUMP_DIRECTORY_HPP

#include "domaindump/entity.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace domaindump::directory {

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class ErrorKind {
    Connection,      // транспорт / инициализация
    Authentication,  // bind
    Search           // ошибка поиска
};

class DirectoryError : public std::runtime_error {
public:
    DirectoryError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// ----------------------------------------------------------------------------
// DirectorySource
// ----------------------------------------------------------------------------

class DirectorySource {
public:
    virtual ~DirectorySource() = default;

    /// DN корня домена (defaultNamingContext из RootDSE)
    /// @throws DirectoryError
    virtual std::string default_naming_context() = 0;

    /// Все записи поддерева base, подходящие под filter, со всеми атрибутами
    /// @throws DirectoryError
    virtual std::vector<Entity> search(const std::string& base, const std::string& filter) = 0;
};

// ----------------------------------------------------------------------------
// LdapDirectory
// ----------------------------------------------------------------------------

struct LdapOptions {
    /// "host", "host:port" или URI (ldap://, ldaps://)
    std::string host;

    /// DOMAIN\user; пусто - анонимный bind
    std::string user;
    std::string password;

    /// Размер страницы для paged results control
    int page_size = 500;

    /// Таймаут сетевых операций, секунд
    int timeout_seconds = 30;
};

/// Преобразовать "host" / "host:port" в LDAP URI
std::string make_ldap_uri(const std::string& host);

/// Привести сырые значения атрибута к типизированному Value
/// (SID/GUID, FILETIME, GeneralizedTime, целые, многозначные атрибуты)
Value convert_attribute(const std::string& name, const std::vector<std::string>& raw_values);

/// Бинарный SID -> "S-1-5-21-..."; std::nullopt при неверной длине
std::optional<std::string> format_sid(const std::string& binary);

/// Бинарный GUID (16 байт) -> "{xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}"
std::optional<std::string> format_guid(const std::string& binary);

class LdapDirectory : public DirectorySource {
public:
    /// Соединение и bind
    /// @throws DirectoryError (Connection / Authentication)
    explicit LdapDirectory(LdapOptions options);
    ~LdapDirectory() override;

    LdapDirectory(const LdapDirectory&) = delete;
    LdapDirectory& operator=(const LdapDirectory&) = delete;

    std::string default_naming_context() override;
    std::vector<Entity> search(const std::string& base, const std::string& filter) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace domaindump::directory

#endif  // DOMAINDUMP_DIRECTORY_HPP
