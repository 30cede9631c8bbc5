// ==============================================================================
// decode.cpp - Декодирование атрибутов
// ==============================================================================

#include "domaindump/decode.hpp"

#include "domaindump/identity.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>

namespace domaindump::decode {

namespace {

constexpr double TICK_SECONDS = 0.0000001;

// Имя группы из DN; DN, который не удалось разобрать, выводится как есть
std::string group_name(const std::string& dn) {
    try {
        return identity::cn_from_dn(dn);
    } catch (const identity::DnParseError&) {
        return dn;
    }
}

}  // anonymous namespace

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out.append(sep);
        }
        out += items[i];
    }
    return out;
}

// ----------------------------------------------------------------------------
// Интервалы
// ----------------------------------------------------------------------------

double ticks_to_days(std::int64_t ticks) {
    return std::fabs(static_cast<double>(ticks)) * TICK_SECONDS / 86400;
}

double ticks_to_minutes(std::int64_t ticks) {
    return std::fabs(static_cast<double>(ticks)) * TICK_SECONDS / 60;
}

std::string format_days(std::int64_t ticks) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f days", ticks_to_days(ticks));
    return buf;
}

std::string format_minutes(std::int64_t ticks) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f minutes", ticks_to_minutes(ticks));
    return buf;
}

// ----------------------------------------------------------------------------
// Скалярные значения
// ----------------------------------------------------------------------------

std::string format_timestamp(Timestamp ts) {
    CivilTime c = to_civil(ts);
    if (c.year < 1900 || c.year > 9999) {
        return "0";
    }

    std::tm tm{};
    tm.tm_year = static_cast<int>(c.year - 1900);
    tm.tm_mon = c.month - 1;
    tm.tm_mday = c.day;
    tm.tm_hour = c.hour;
    tm.tm_min = c.minute;
    tm.tm_sec = c.second;
    tm.tm_isdst = 0;

    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), "%x %X", &tm);
    if (n == 0) {
        return "0";
    }
    return std::string(buf, n);
}

std::string format_scalar(const Value& value) {
    switch (value.kind()) {
    case Value::Kind::String:
        return value.as_string();
    case Value::Kind::Int64:
        return std::to_string(value.as_int());
    case Value::Kind::Bytes:
        return bytes_to_hex(value.as_bytes());
    case Value::Kind::Timestamp:
        return format_timestamp(value.as_timestamp());
    case Value::Kind::StringList:
        return join(value.as_list());
    }
    return {};
}

// ----------------------------------------------------------------------------
// Таблица решений
// ----------------------------------------------------------------------------

AttributeClass classify_attribute(std::string_view name) {
    if (iequals(name, "userAccountControl")) {
        return AttributeClass::AccountControl;
    }
    if (iequals(name, "member") || iequals(name, "memberOf")) {
        return AttributeClass::GroupList;
    }
    if (iequals(name, "pwdProperties")) {
        return AttributeClass::PasswordProperties;
    }
    if (iequals(name, "minPwdAge") || iequals(name, "maxPwdAge")) {
        return AttributeClass::PasswordAge;
    }
    if (iequals(name, "lockOutObservationWindow") || iequals(name, "lockoutDuration")) {
        return AttributeClass::LockoutWindow;
    }
    return AttributeClass::Other;
}

std::string decode_flat(std::string_view name, const Value& value) {
    switch (classify_attribute(name)) {
    case AttributeClass::AccountControl:
        if (auto v = value.integer()) {
            return join(parse_flags(*v, UAC_FLAGS));
        }
        break;
    case AttributeClass::PasswordProperties:
        if (auto v = value.integer()) {
            return join(parse_flags(*v, PWD_FLAGS));
        }
        break;
    case AttributeClass::PasswordAge:
        if (auto v = value.integer()) {
            return format_days(*v);
        }
        break;
    case AttributeClass::LockoutWindow:
        if (auto v = value.integer()) {
            return format_minutes(*v);
        }
        break;
    case AttributeClass::GroupList:
        if (auto dns = value.string_list()) {
            std::vector<std::string> names;
            names.reserve(dns->size());
            for (const auto& dn : *dns) {
                names.push_back(group_name(dn));
            }
            return join(names);
        }
        break;
    case AttributeClass::Other:
        break;
    }
    return format_scalar(value);
}

RichCell decode_rich(std::string_view name, const Value& value, const DecodeContext& ctx) {
    if (classify_attribute(name) == AttributeClass::GroupList) {
        if (auto dns = value.string_list()) {
            RichCell cell;
            for (std::size_t i = 0; i < dns->size(); ++i) {
                const std::string& dn = (*dns)[i];
                if (i > 0) {
                    cell.push_back(RichPart{", ", {}, {}});
                }
                std::string cn = group_name(dn);
                RichPart link;
                link.href = ctx.users_by_group_file + ".html#cn_" +
                            identity::url_encode(identity::sanitize_id(cn));
                link.title = dn;
                link.text = std::move(cn);
                cell.push_back(std::move(link));
            }
            return cell;
        }
    }
    // Остальные классы совпадают с плоским представлением
    return RichCell{RichPart{decode_flat(name, value), {}, {}}};
}

std::string rich_to_text(const RichCell& cell) {
    std::string out;
    for (const auto& part : cell) {
        out += part.text;
    }
    return out;
}

// ----------------------------------------------------------------------------
// Декодированные записи
// ----------------------------------------------------------------------------

const DecodedAttribute* DecodedEntity::find(std::string_view name) const {
    for (const auto& attr : attributes) {
        if (iequals(attr.name, name)) {
            return &attr;
        }
    }
    return nullptr;
}

DecodedEntity decode_entity(const Entity& entity, const DecodeContext& ctx) {
    DecodedEntity out;
    out.dn = entity.dn();
    out.source = &entity;
    out.attributes.reserve(entity.size());
    for (const auto& attr : entity.attributes()) {
        DecodedAttribute decoded;
        decoded.name = attr.name;
        decoded.flat = decode_flat(attr.name, attr.value);
        decoded.rich = decode_rich(attr.name, attr.value, ctx);
        out.attributes.push_back(std::move(decoded));
    }
    return out;
}

std::vector<DecodedEntity> decode_entities(const std::vector<Entity>& entities,
                                           const DecodeContext& ctx) {
    std::vector<DecodedEntity> out;
    out.reserve(entities.size());
    for (const auto& entity : entities) {
        out.push_back(decode_entity(entity, ctx));
    }
    return out;
}

}  // namespace domaindump::decode
