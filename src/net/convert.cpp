// ==============================================================================
// convert.cpp - Типизация сырых значений атрибутов LDAP
// ==============================================================================
//
// LDAP возвращает значения как байтовые строки; схема на стороне клиента
// не читается, поэтому тип определяется по имени атрибута (таблицы ниже)
// с откатом: несколько значений -> StringList, не-UTF-8 -> Bytes.
//
// ==============================================================================

#include "domaindump/directory.hpp"

#include <array>
#include <charconv>
#include <cstdio>
#include <string_view>

namespace domaindump::directory {

namespace {

// Бинарные SID
constexpr std::array<std::string_view, 3> SID_ATTRIBUTES = {
    "objectsid", "sidhistory", "securityidentifier"};

// Бинарные GUID
constexpr std::array<std::string_view, 2> GUID_ATTRIBUTES = {"objectguid", "msexchmailboxguid"};

// Целые в формате FILETIME (100 нс от 1601-01-01)
constexpr std::array<std::string_view, 7> FILETIME_ATTRIBUTES = {
    "lastlogon",     "lastlogontimestamp", "pwdlastset", "accountexpires",
    "badpasswordtime", "lastlogoff",       "lockouttime"};

// GeneralizedTime
constexpr std::array<std::string_view, 2> GENERALIZED_TIME_ATTRIBUTES = {"whencreated",
                                                                         "whenchanged"};

// Целые (интервалы в тиках остаются целыми - их декодирует decode)
constexpr std::array<std::string_view, 22> INTEGER_ATTRIBUTES = {
    "useraccountcontrol",
    "primarygroupid",
    "pwdproperties",
    "lockoutthreshold",
    "minpwdlength",
    "pwdhistorylength",
    "maxpwdage",
    "minpwdage",
    "lockoutduration",
    "lockoutobservationwindow",
    "badpwdcount",
    "logoncount",
    "samaccounttype",
    "grouptype",
    "admincount",
    "instancetype",
    "usnchanged",
    "usncreated",
    "codepage",
    "countrycode",
    "systemflags",
    "msds-supportedencryptiontypes"};

// Многозначные даже при единственном значении
constexpr std::array<std::string_view, 8> MULTI_VALUED_ATTRIBUTES = {
    "memberof",          "member",         "objectclass",         "serviceprincipalname",
    "dscorepropagationdata", "proxyaddresses", "othermailbox",    "sidhistory"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& table, std::string_view name) {
    for (auto item : table) {
        if (item == name) {
            return true;
        }
    }
    return false;
}

bool is_valid_utf8(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        if (c < 0x80) {
            len = 1;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            len = 4;
        } else {
            return false;
        }
        if (i + len > s.size()) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

std::optional<std::int64_t> parse_int(std::string_view s) {
    std::int64_t out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return out;
}

Value::Bytes to_bytes(const std::string& s) {
    return Value::Bytes(s.begin(), s.end());
}

// Одно значение по таблицам типов; std::nullopt - тип не определён
std::optional<Value> convert_single(const std::string& lname, const std::string& raw) {
    if (contains(SID_ATTRIBUTES, lname)) {
        if (auto sid = format_sid(raw)) {
            return Value(*sid);
        }
        return Value::make_bytes(to_bytes(raw));
    }
    if (contains(GUID_ATTRIBUTES, lname)) {
        if (auto guid = format_guid(raw)) {
            return Value(*guid);
        }
        return Value::make_bytes(to_bytes(raw));
    }
    if (contains(FILETIME_ATTRIBUTES, lname)) {
        if (auto ft = parse_int(raw)) {
            return Value::make_timestamp(timestamp_from_filetime(*ft));
        }
    }
    if (contains(GENERALIZED_TIME_ATTRIBUTES, lname)) {
        if (auto ts = parse_generalized_time(raw)) {
            return Value::make_timestamp(*ts);
        }
    }
    if (contains(INTEGER_ATTRIBUTES, lname)) {
        if (auto v = parse_int(raw)) {
            return Value::make_int(*v);
        }
    }
    return std::nullopt;
}

// Строковое представление одного значения многозначного атрибута
std::string list_item(const std::string& lname, const std::string& raw) {
    if (contains(SID_ATTRIBUTES, lname)) {
        if (auto sid = format_sid(raw)) {
            return *sid;
        }
    }
    if (contains(GUID_ATTRIBUTES, lname)) {
        if (auto guid = format_guid(raw)) {
            return *guid;
        }
    }
    return raw;
}

}  // anonymous namespace

std::optional<std::string> format_sid(const std::string& binary) {
    if (binary.size() < 8) {
        return std::nullopt;
    }
    const auto* b = reinterpret_cast<const unsigned char*>(binary.data());
    std::size_t count = b[1];
    if (binary.size() != 8 + count * 4) {
        return std::nullopt;
    }

    std::uint64_t authority = 0;
    for (int i = 2; i < 8; ++i) {
        authority = (authority << 8) | b[i];
    }

    std::string out = "S-" + std::to_string(b[0]) + "-" + std::to_string(authority);
    for (std::size_t i = 0; i < count; ++i) {
        const unsigned char* p = b + 8 + i * 4;
        std::uint32_t sub = static_cast<std::uint32_t>(p[0]) |
                            (static_cast<std::uint32_t>(p[1]) << 8) |
                            (static_cast<std::uint32_t>(p[2]) << 16) |
                            (static_cast<std::uint32_t>(p[3]) << 24);
        out += "-" + std::to_string(sub);
    }
    return out;
}

std::optional<std::string> format_guid(const std::string& binary) {
    if (binary.size() != 16) {
        return std::nullopt;
    }
    const auto* b = reinterpret_cast<const unsigned char*>(binary.data());
    char buf[64];
    std::snprintf(buf, sizeof(buf),
                  "{%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x}", b[3],
                  b[2], b[1], b[0], b[5], b[4], b[7], b[6], b[8], b[9], b[10], b[11], b[12], b[13],
                  b[14], b[15]);
    return std::string(buf);
}

std::string make_ldap_uri(const std::string& host) {
    if (host.find("://") != std::string::npos) {
        return host;
    }
    return "ldap://" + host;
}

Value convert_attribute(const std::string& name, const std::vector<std::string>& raw_values) {
    std::string lname = to_lower(name);

    if (raw_values.size() > 1 || contains(MULTI_VALUED_ATTRIBUTES, lname)) {
        Value::StringList list;
        list.reserve(raw_values.size());
        for (const auto& raw : raw_values) {
            list.push_back(list_item(lname, raw));
        }
        return Value::make_list(std::move(list));
    }

    if (raw_values.empty()) {
        return Value(std::string());
    }

    const std::string& raw = raw_values.front();
    if (auto typed = convert_single(lname, raw)) {
        return *typed;
    }
    if (!is_valid_utf8(raw)) {
        return Value::make_bytes(to_bytes(raw));
    }
    return Value(raw);
}

}  // namespace domaindump::directory
