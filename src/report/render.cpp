// ==============================================================================
// render.cpp - Форматы отчётов (HTML / JSON / grep)
// ==============================================================================

#include "domaindump/render.hpp"

#include "domaindump/identity.hpp"

#include <array>
#include <sstream>
#include <utility>

#include <pugixml.hpp>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace domaindump::render {

namespace {

// Человекочитаемые заголовки столбцов
constexpr std::array<std::pair<std::string_view, std::string_view>, 18> ATTRIBUTE_ALIASES = {{
    {"sAMAccountName", "SAM Name"},
    {"cn", "CN"},
    {"operatingSystem", "Operating System"},
    {"operatingSystemServicePack", "Service Pack"},
    {"operatingSystemVersion", "OS Version"},
    {"userAccountControl", "Flags"},
    {"objectSid", "SID"},
    {"memberOf", "Member of groups"},
    {"dNSHostName", "DNS Hostname"},
    {"whenCreated", "Created on"},
    {"whenChanged", "Changed on"},
    {"IPv4", "IPv4 Address"},
    {"lockOutObservationWindow", "Lockout time window"},
    {"lockoutDuration", "Lockout Duration"},
    {"lockoutThreshold", "Lockout Threshold"},
    {"maxPwdAge", "Max password age"},
    {"minPwdAge", "Min password age"},
    {"minPwdLength", "Min password length"},
}};

// Без пустых <td/>: в HTML такой тег не закрывает элемент
constexpr unsigned int HTML_FORMAT = pugi::format_raw | pugi::format_no_empty_element_tags;

void set_json_string(rapidjson::Value& out, const std::string& s,
                     rapidjson::Document::AllocatorType& alloc) {
    out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

// XML не допускает NUL даже ссылкой на символ; c_str() обрезал бы значение.
// NUL записывается в DN-форме "\\00", остальной текст без изменений.
std::string xml_text(const std::string& s) {
    if (s.find('\0') == std::string::npos) {
        return s;
    }
    std::string out;
    out.reserve(s.size() + 4);
    for (char c : s) {
        if (c == '\0') {
            out += "\\00";
        } else {
            out += c;
        }
    }
    return out;
}

void set_text(pugi::xml_node parent, const std::string& text) {
    parent.append_child(pugi::node_pcdata).set_value(xml_text(text).c_str());
}

void append_cell(pugi::xml_node row, const decode::DecodedAttribute* attr) {
    pugi::xml_node td = row.append_child("td");
    if (attr == nullptr) {
        td.append_child(pugi::node_pcdata).set_value(BLANK_CELL);
        return;
    }
    for (const auto& part : attr->rich) {
        if (part.is_link()) {
            pugi::xml_node a = td.append_child("a");
            a.append_attribute("href") = xml_text(part.href).c_str();
            a.append_attribute("title") = xml_text(part.title).c_str();
            set_text(a, part.text);
        } else {
            set_text(td, part.text);
        }
    }
}

}  // anonymous namespace

EntityRefs all_of(const std::vector<decode::DecodedEntity>& entities) {
    EntityRefs out;
    out.reserve(entities.size());
    for (const auto& e : entities) {
        out.push_back(&e);
    }
    return out;
}

EntityRefs select(const std::vector<decode::DecodedEntity>& entities,
                  const std::vector<std::size_t>& rows) {
    EntityRefs out;
    out.reserve(rows.size());
    for (std::size_t row : rows) {
        if (row < entities.size()) {
            out.push_back(&entities[row]);
        }
    }
    return out;
}

std::string column_title(std::string_view attribute) {
    for (const auto& [name, alias] : ATTRIBUTE_ALIASES) {
        if (name == attribute) {
            return std::string(alias);
        }
    }
    return std::string(attribute);
}

// ----------------------------------------------------------------------------
// HTML
// ----------------------------------------------------------------------------

HtmlTable::HtmlTable() : doc_(std::make_unique<pugi::xml_document>()) {
    doc_->append_child("table");
}

HtmlTable::~HtmlTable() = default;
HtmlTable::HtmlTable(HtmlTable&&) noexcept = default;
HtmlTable& HtmlTable::operator=(HtmlTable&&) noexcept = default;

void HtmlTable::append_section(const EntityRefs& entities,
                               const std::vector<std::string>& attributes,
                               const std::string& header) {
    pugi::xml_node table = doc_->child("table");

    if (!header.empty()) {
        pugi::xml_node td = table.append_child("thead").append_child("tr").append_child("td");
        td.append_attribute("colspan") = static_cast<unsigned int>(attributes.size());
        std::string anchor = "cn_" + identity::sanitize_id(header);
        td.append_attribute("id") = anchor.c_str();
        set_text(td, header);
    }

    pugi::xml_node body = table.append_child("tbody");
    pugi::xml_node titles = body.append_child("tr");
    for (const auto& attr : attributes) {
        set_text(titles.append_child("th"), column_title(attr));
    }

    for (const auto* entity : entities) {
        pugi::xml_node row = body.append_child("tr");
        for (const auto& attr : attributes) {
            append_cell(row, entity->find(attr));
        }
    }

    ++sections_;
}

std::string HtmlTable::to_string() const {
    std::ostringstream os;
    doc_->child("table").print(os, "", HTML_FORMAT);
    return os.str();
}

HtmlTable grouped_html_table(const std::vector<decode::DecodedEntity>& entities,
                             const index::GroupedEntities& grouped,
                             const std::vector<std::string>& attributes) {
    HtmlTable table;
    for (const auto& group : grouped.groups()) {
        table.append_section(select(entities, group.members), attributes, group.key);
    }
    return table;
}

std::string render_html_page(const std::string& body, const std::string& stylesheet) {
    std::string page = "<!DOCTYPE html>\n<html>\n<head><meta charset=\"UTF-8\">";
    if (!stylesheet.empty()) {
        page += "<style type=\"text/css\">";
        page += stylesheet;
        page += "</style>";
    }
    page += "</head><body>";
    page += body;
    page += "</body></html>";
    return page;
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

void append_entity_json(rapidjson::Value& array, const decode::DecodedEntity& entity,
                        rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);

    rapidjson::Value dn;
    set_json_string(dn, entity.dn, alloc);
    obj.AddMember("dn", dn, alloc);

    rapidjson::Value decoded(rapidjson::kObjectType);
    for (const auto& attr : entity.attributes) {
        rapidjson::Value key;
        set_json_string(key, attr.name, alloc);
        rapidjson::Value val;
        set_json_string(val, attr.flat, alloc);
        decoded.AddMember(key, val, alloc);
    }
    obj.AddMember("attributes", decoded, alloc);

    rapidjson::Value raw(rapidjson::kObjectType);
    if (entity.source != nullptr) {
        for (const auto& attr : entity.source->attributes()) {
            rapidjson::Value key;
            set_json_string(key, attr.name, alloc);
            rapidjson::Value val;
            attr.value.to_rapidjson(val, alloc);
            raw.AddMember(key, val, alloc);
        }
    }
    obj.AddMember("raw", raw, alloc);

    array.PushBack(obj, alloc);
}

rapidjson::Document json_entity_list(const EntityRefs& entities) {
    rapidjson::Document doc;
    doc.SetArray();
    for (const auto* entity : entities) {
        append_entity_json(doc, *entity, doc.GetAllocator());
    }
    return doc;
}

rapidjson::Document json_grouped_list(const std::vector<decode::DecodedEntity>& entities,
                                      const index::GroupedEntities& grouped) {
    rapidjson::Document doc;
    doc.SetArray();
    auto& alloc = doc.GetAllocator();

    for (const auto& group : grouped.groups()) {
        rapidjson::Value members(rapidjson::kArrayType);
        for (const auto* entity : select(entities, group.members)) {
            append_entity_json(members, *entity, alloc);
        }
        rapidjson::Value key;
        set_json_string(key, group.key, alloc);
        rapidjson::Value pair(rapidjson::kObjectType);
        pair.AddMember(key, members, alloc);
        doc.PushBack(pair, alloc);
    }
    return doc;
}

std::string serialize_json(const rapidjson::Value& value, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        value.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

// ----------------------------------------------------------------------------
// grep
// ----------------------------------------------------------------------------

std::string grep_field(std::string_view value, const std::string& delimiter) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size();) {
        if (!delimiter.empty() && value.compare(i, delimiter.size(), delimiter) == 0) {
            out += ' ';
            i += delimiter.size();
            continue;
        }
        char c = value[i];
        out += (c == '\n' || c == '\r') ? ' ' : c;
        ++i;
    }
    return out;
}

std::string grep_list(const EntityRefs& entities, const std::vector<std::string>& attributes,
                      const std::string& delimiter) {
    std::string out;
    for (std::size_t i = 0; i < attributes.size(); ++i) {
        if (i > 0) {
            out += delimiter;
        }
        out += attributes[i];
    }

    for (const auto* entity : entities) {
        out += '\n';
        for (std::size_t i = 0; i < attributes.size(); ++i) {
            if (i > 0) {
                out += delimiter;
            }
            if (const auto* attr = entity->find(attributes[i])) {
                out += grep_field(attr->flat, delimiter);
            }
        }
    }
    return out;
}

}  // namespace domaindump::render
