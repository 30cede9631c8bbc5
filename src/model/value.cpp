// ==============================================================================
// value.cpp - Реализация Value и преобразований времени
// ==============================================================================

#include "domaindump/value.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace domaindump {

// ----------------------------------------------------------------------------
// Календарные преобразования
// ----------------------------------------------------------------------------

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;

// Дней от 1970-01-01 до заданной даты (алгоритм H. Hinnant)
std::int64_t days_from_civil(std::int64_t y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, int& m, int& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}

bool parse_digits(std::string_view text, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

}  // anonymous namespace

Timestamp timestamp_from_filetime(std::int64_t filetime) {
    // Деление с округлением вниз, чтобы отрицательные значения не съезжали на секунду
    std::int64_t secs = filetime / TICKS_PER_SECOND;
    if (filetime % TICKS_PER_SECOND < 0) {
        --secs;
    }
    return Timestamp{secs - FILETIME_EPOCH_OFFSET};
}

std::optional<Timestamp> parse_generalized_time(std::string_view text) {
    // YYYYMMDDHHMMSS[.f*]Z
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parse_digits(text, 0, 4, year) || !parse_digits(text, 4, 2, month) ||
        !parse_digits(text, 6, 2, day) || !parse_digits(text, 8, 2, hour) ||
        !parse_digits(text, 10, 2, minute) || !parse_digits(text, 12, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 14;
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }
    if (pos >= text.size() || text[pos] != 'Z' || pos + 1 != text.size()) {
        return std::nullopt;
    }

    std::int64_t days = days_from_civil(year, month, day);
    return Timestamp{days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second};
}

CivilTime to_civil(Timestamp ts) {
    std::int64_t days = ts.seconds / SECONDS_PER_DAY;
    std::int64_t rem = ts.seconds % SECONDS_PER_DAY;
    if (rem < 0) {
        rem += SECONDS_PER_DAY;
        --days;
    }

    CivilTime out;
    civil_from_days(days, out.year, out.month, out.day);
    out.hour = static_cast<int>(rem / 3600);
    out.minute = static_cast<int>((rem % 3600) / 60);
    out.second = static_cast<int>(rem % 60);
    return out;
}

std::string timestamp_to_iso8601(Timestamp ts) {
    CivilTime c = to_civil(ts);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02dT%02d:%02d:%02dZ",
                  static_cast<long long>(c.year), c.month, c.day, c.hour, c.minute, c.second);
    return buf;
}

std::string bytes_to_hex(const Value::Bytes& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

// ----------------------------------------------------------------------------
// Value
// ----------------------------------------------------------------------------

std::optional<std::string> Value::single_string() const {
    if (const auto* s = get_string()) {
        return *s;
    }
    if (const auto* list = get_list()) {
        if (!list->empty()) {
            return list->front();
        }
    }
    return std::nullopt;
}

std::optional<std::int64_t> Value::integer() const {
    if (const auto* i = get_int()) {
        return *i;
    }
    auto text = single_string();
    if (!text || text->empty()) {
        return std::nullopt;
    }
    std::int64_t out = 0;
    const char* first = text->data();
    const char* last = text->data() + text->size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return out;
}

std::optional<Value::StringList> Value::string_list() const {
    if (const auto* list = get_list()) {
        return *list;
    }
    if (const auto* s = get_string()) {
        return StringList{*s};
    }
    return std::nullopt;
}

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    switch (kind()) {
    case Kind::Int64:
        out.SetInt64(as_int());
        return;
    case Kind::String: {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }
    case Kind::Bytes: {
        std::string hex = bytes_to_hex(as_bytes());
        out.SetString(hex.c_str(), static_cast<rapidjson::SizeType>(hex.size()), alloc);
        return;
    }
    case Kind::Timestamp: {
        std::string iso = timestamp_to_iso8601(as_timestamp());
        out.SetString(iso.c_str(), static_cast<rapidjson::SizeType>(iso.size()), alloc);
        return;
    }
    case Kind::StringList: {
        out.SetArray();
        const auto& list = as_list();
        out.Reserve(static_cast<rapidjson::SizeType>(list.size()), alloc);
        for (const auto& item : list) {
            rapidjson::Value v;
            v.SetString(item.c_str(), static_cast<rapidjson::SizeType>(item.size()), alloc);
            out.PushBack(v, alloc);
        }
        return;
    }
    }
    out.SetNull();
}

}  // namespace domaindump
