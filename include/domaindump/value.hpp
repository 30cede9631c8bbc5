// ==============================================================================
// domaindump/value.hpp - Типизированное значение атрибута каталога (Value)
// ==============================================================================
//
// Назначение:
// - Каноническое представление значения атрибута LDAP-записи
// - Явная типизация: String / Int64 / Bytes / Timestamp / StringList
// - Конверсия в RapidJSON Value (для "raw" секции JSON-отчёта)
//
// Значение не бывает "пустым": отсутствие атрибута выражается отсутствием
// Value в Entity, а не специальным Null.
//
// ==============================================================================

#ifndef DOMAINDUMP_VALUE_HPP
#define DOMAINDUMP_VALUE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace domaindump {

// ----------------------------------------------------------------------------
// Timestamp - момент времени (UTC)
// ----------------------------------------------------------------------------

/// Момент времени в секундах от Unix epoch (UTC)
/// Может лежать далеко за пределами time_t-диапазона (FILETIME 0 = 1601 год)
struct Timestamp {
    std::int64_t seconds = 0;

    bool operator==(const Timestamp& other) const { return seconds == other.seconds; }
};

/// Разница между 1601-01-01 и 1970-01-01 в секундах
constexpr std::int64_t FILETIME_EPOCH_OFFSET = 11644473600LL;

/// Тиков (100 нс) в секунде
constexpr std::int64_t TICKS_PER_SECOND = 10000000LL;

/// FILETIME (100 нс от 1601-01-01) -> Timestamp
Timestamp timestamp_from_filetime(std::int64_t filetime);

/// Разобрать LDAP GeneralizedTime ("20160102030405.0Z")
/// @return std::nullopt при невалидной строке
std::optional<Timestamp> parse_generalized_time(std::string_view text);

/// Разложить Timestamp на календарные поля (пролептический григорианский календарь)
struct CivilTime {
    std::int64_t year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

CivilTime to_civil(Timestamp ts);

// ----------------------------------------------------------------------------
// Value - значение атрибута
// ----------------------------------------------------------------------------

class Value {
public:
    using String = std::string;
    using Int64 = std::int64_t;
    using Bytes = std::vector<std::uint8_t>;
    using StringList = std::vector<std::string>;

    enum class Kind { String, Int64, Bytes, Timestamp, StringList };

private:
    std::variant<String, Int64, Bytes, Timestamp, StringList> data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(String{}) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(Bytes v) : data_(std::move(v)) {}
    explicit Value(Timestamp v) : data_(v) {}
    explicit Value(StringList v) : data_(std::move(v)) {}

    static Value make_string(std::string v) { return Value(std::move(v)); }
    static Value make_int(std::int64_t v) { return Value(v); }
    static Value make_bytes(Bytes v) { return Value(std::move(v)); }
    static Value make_timestamp(Timestamp v) { return Value(v); }
    static Value make_list(StringList v) { return Value(std::move(v)); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_bytes() const { return std::holds_alternative<Bytes>(data_); }
    bool is_timestamp() const { return std::holds_alternative<Timestamp>(data_); }
    bool is_list() const { return std::holds_alternative<StringList>(data_); }

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    const String& as_string() const { return std::get<String>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    const Bytes& as_bytes() const { return std::get<Bytes>(data_); }
    Timestamp as_timestamp() const { return std::get<Timestamp>(data_); }
    const StringList& as_list() const { return std::get<StringList>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const String* get_string() const { return std::get_if<String>(&data_); }
    const Int64* get_int() const { return std::get_if<Int64>(&data_); }
    const Bytes* get_bytes() const { return std::get_if<Bytes>(&data_); }
    const Timestamp* get_timestamp() const { return std::get_if<Timestamp>(&data_); }
    const StringList* get_list() const { return std::get_if<StringList>(&data_); }

    // -------------------------------------------------------------------------
    // Одиночное значение / список значений
    // -------------------------------------------------------------------------

    /// Одиночное строковое значение: String как есть, первый элемент StringList
    /// (если список не пуст). Для остальных типов - std::nullopt.
    std::optional<std::string> single_string() const;

    /// Целочисленное значение: Int64 как есть, либо String/StringList[0],
    /// целиком разбираемая как десятичное число. Иначе std::nullopt.
    std::optional<std::int64_t> integer() const;

    /// Список строковых значений: StringList как есть, String -> {s}.
    /// Для остальных типов - std::nullopt.
    std::optional<StringList> string_list() const;

    // -------------------------------------------------------------------------
    // Конверсия в RapidJSON
    // -------------------------------------------------------------------------

    /// Int64 -> число, String -> строка, Bytes -> hex-строка,
    /// Timestamp -> ISO 8601 строка, StringList -> массив строк
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }
};

/// Форматировать Timestamp как ISO 8601 ("2016-01-02T03:04:05Z")
std::string timestamp_to_iso8601(Timestamp ts);

/// Байты в строку hex (нижний регистр)
std::string bytes_to_hex(const Value::Bytes& bytes);

}  // namespace domaindump

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // DOMAINDUMP_VALUE_HPP
