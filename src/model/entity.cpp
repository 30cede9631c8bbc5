// ==============================================================================
// entity.cpp - Реализация Entity
// ==============================================================================

#include "domaindump/entity.hpp"

#include <cctype>

namespace domaindump {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

const Value* Entity::find(std::string_view name) const {
    // Записи содержат десятки атрибутов - линейный поиск достаточен
    for (const auto& attr : attributes_) {
        if (iequals(attr.name, name)) {
            return &attr.value;
        }
    }
    return nullptr;
}

std::optional<std::string> Entity::first_string(std::string_view name) const {
    const Value* v = find(name);
    if (v == nullptr) {
        return std::nullopt;
    }
    return v->single_string();
}

std::optional<std::vector<std::string>> Entity::strings(std::string_view name) const {
    const Value* v = find(name);
    if (v == nullptr) {
        return std::nullopt;
    }
    return v->string_list();
}

std::optional<std::int64_t> Entity::integer(std::string_view name) const {
    const Value* v = find(name);
    if (v == nullptr) {
        return std::nullopt;
    }
    return v->integer();
}

void Entity::set(std::string name, Value value) {
    for (auto& attr : attributes_) {
        if (iequals(attr.name, name)) {
            attr.value = std::move(value);
            return;
        }
    }
    attributes_.push_back(Attribute{std::move(name), std::move(value)});
}

}  // namespace domaindump
