// ==============================================================================
// domaindump/entity.hpp - Запись каталога (Entity)
// ==============================================================================
//
// Назначение:
// - Запись каталога (пользователь, компьютер, группа, политика)
// - Упорядоченный набор атрибутов с регистронезависимым поиском
// - Явная проверка присутствия атрибута (отсутствие != пустое значение)
//
// ==============================================================================

#ifndef DOMAINDUMP_ENTITY_HPP
#define DOMAINDUMP_ENTITY_HPP

#include "domaindump/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace domaindump {

/// Атрибут: имя в том виде, в каком его вернул сервер, и значение
struct Attribute {
    std::string name;
    Value value;
};

class Entity {
public:
    Entity() = default;
    explicit Entity(std::string dn) : dn_(std::move(dn)) {}

    const std::string& dn() const { return dn_; }
    void set_dn(std::string dn) { dn_ = std::move(dn); }

    // -------------------------------------------------------------------------
    // Доступ к атрибутам
    // -------------------------------------------------------------------------

    /// Найти атрибут (регистронезависимо), nullptr если атрибута нет
    const Value* find(std::string_view name) const;

    /// Проверить наличие атрибута
    bool has(std::string_view name) const { return find(name) != nullptr; }

    /// Одиночное строковое значение (см. Value::single_string)
    std::optional<std::string> first_string(std::string_view name) const;

    /// Список строковых значений (см. Value::string_list)
    std::optional<std::vector<std::string>> strings(std::string_view name) const;

    /// Целочисленное значение (см. Value::integer)
    std::optional<std::int64_t> integer(std::string_view name) const;

    /// Установить атрибут; существующий (регистронезависимо) заменяется на месте
    void set(std::string name, Value value);

    /// Атрибуты в порядке добавления
    const std::vector<Attribute>& attributes() const { return attributes_; }

    std::size_t size() const { return attributes_.size(); }

private:
    std::string dn_;
    std::vector<Attribute> attributes_;
};

/// Регистронезависимое сравнение ASCII-имён атрибутов
bool iequals(std::string_view a, std::string_view b);

/// ASCII lower-case копия
std::string to_lower(std::string_view s);

}  // namespace domaindump

#endif  // DOMAINDUMP_ENTITY_HPP
