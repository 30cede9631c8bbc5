// ==============================================================================
// identity.cpp - Разрешение идентичности групп
// ==============================================================================

#include "domaindump/identity.hpp"

#include <cctype>
#include <charconv>

namespace domaindump::identity {

using namespace std::string_view_literals;

const std::string_view DN_SPECIAL_CHARS = " \"#+,;<=>\\\0"sv;

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool is_special(char c) {
    return DN_SPECIAL_CHARS.find(c) != std::string_view::npos;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && s.front() == ' ') {
        s.remove_prefix(1);
    }
    // Завершающий пробел сохраняется, если он экранирован
    while (!s.empty() && s.back() == ' ') {
        std::size_t slashes = 0;
        for (std::size_t i = s.size() - 1; i > 0 && s[i - 1] == '\\'; --i) {
            ++slashes;
        }
        if (slashes % 2 == 1) {
            break;
        }
        s.remove_suffix(1);
    }
    return s;
}

// Разрезать по неэкранированному разделителю
std::vector<std::string_view> split_unescaped(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    bool quoted = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\') {
            ++i;  // следующий символ экранирован
        } else if (c == '"') {
            quoted = !quoted;
        } else if (c == sep && !quoted) {
            parts.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    parts.push_back(text.substr(start));
    return parts;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// DN
// ----------------------------------------------------------------------------

std::vector<Rdn> parse_dn(std::string_view dn) {
    std::vector<Rdn> out;
    for (std::string_view component : split_unescaped(dn, ',')) {
        // a=1+b=2: берём первую пару
        std::string_view first = trim(split_unescaped(component, '+').front());
        auto eq = first.find('=');
        if (first.empty() || eq == std::string_view::npos || eq == 0) {
            throw DnParseError(std::string(dn));
        }
        Rdn rdn;
        rdn.type = std::string(trim(first.substr(0, eq)));
        rdn.value = std::string(trim(first.substr(eq + 1)));
        out.push_back(std::move(rdn));
    }
    return out;
}

std::string unescape_dn_component(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c != '\\' || i + 1 >= value.size()) {
            out += c;
            continue;
        }
        char next = value[i + 1];
        if (is_special(next)) {
            out += next;
            ++i;
            continue;
        }
        // \XX - байт в hex (UTF-8 последовательности в DN, выданных сервером)
        if (i + 2 < value.size()) {
            int hi = hex_value(next);
            int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += c;
    }
    return out;
}

std::string cn_from_dn(std::string_view dn) {
    auto rdns = parse_dn(dn);
    return unescape_dn_component(rdns.front().value);
}

// ----------------------------------------------------------------------------
// Якоря
// ----------------------------------------------------------------------------

std::string sanitize_id(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    bool in_run = false;
    for (char c : name) {
        bool allowed = std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
        // isalnum зависит от локали только для не-ASCII байтов
        if (static_cast<unsigned char>(c) >= 0x80) {
            allowed = false;
        }
        if (allowed) {
            out += c;
            in_run = false;
        } else if (!in_run) {
            out += '_';
            in_run = true;
        }
    }
    return out;
}

std::string url_encode(std::string_view text) {
    static const char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '_' || c == '.' || c == '-' || c == '~') {
            out += ch;
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += digits[c >> 4];
            out += digits[c & 0x0F];
        }
    }
    return out;
}

// ----------------------------------------------------------------------------
// SID / RID
// ----------------------------------------------------------------------------

std::optional<std::uint32_t> rid_from_sid(std::string_view sid) {
    auto dash = sid.rfind('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view token = sid.substr(dash + 1);
    if (token.empty()) {
        return std::nullopt;
    }
    std::uint32_t rid = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), rid);
    if (ec != std::errc() || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return rid;
}

std::string IdentityFault::message() const {
    switch (kind) {
    case FaultKind::MissingSid:
        return "group '" + dn + "' has no objectSid, left out of the RID map";
    case FaultKind::MalformedSid:
        return "group '" + dn + "' has a malformed SID '" + detail + "', left out of the RID map";
    case FaultKind::MissingName:
        return "group '" + dn + "' has no cn, left out of the RID map";
    }
    return "group '" + dn + "': " + detail;
}

std::optional<std::string> RidMap::lookup(std::uint32_t rid) const {
    auto it = names.find(rid);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

RidMap build_rid_map(const std::vector<Entity>& groups) {
    RidMap map;
    for (const auto& group : groups) {
        auto sid = group.first_string("objectSid");
        if (!sid) {
            map.faults.push_back({FaultKind::MissingSid, group.dn(), {}});
            continue;
        }
        auto rid = rid_from_sid(*sid);
        if (!rid) {
            map.faults.push_back({FaultKind::MalformedSid, group.dn(), *sid});
            continue;
        }
        auto cn = group.first_string("cn");
        if (!cn) {
            map.faults.push_back({FaultKind::MissingName, group.dn(), *sid});
            continue;
        }
        map.names[*rid] = *cn;
    }
    return map;
}

}  // namespace domaindump::identity
