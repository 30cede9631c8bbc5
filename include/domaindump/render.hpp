// ==============================================================================
// domaindump/render.hpp - Форматы отчётов (HTML / JSON / grep)
// ==============================================================================
//
// Назначение:
// - HTML: одна таблица на отчёт, в которую секции (заголовок + тело)
//   добавляются последовательно; DOM строится через pugixml, экранирование
//   выполняет сериализатор
// - JSON: дерево RapidJSON, строится целиком и сериализуется один раз
// - grep: строка заголовка + строка на запись, разделитель настраивается
//
// Все три формата читают уже декодированные записи (decode::DecodedEntity),
// поэтому значения в них совпадают.
//
// ==============================================================================

#ifndef DOMAINDUMP_RENDER_HPP
#define DOMAINDUMP_RENDER_HPP

#include "domaindump/decode.hpp"
#include "domaindump/index.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace pugi {
class xml_document;
}  // namespace pugi

namespace domaindump::render {

/// Ссылки на декодированные записи одного раздела отчёта
using EntityRefs = std::vector<const decode::DecodedEntity*>;

/// Все записи списка по порядку
EntityRefs all_of(const std::vector<decode::DecodedEntity>& entities);

/// Записи по индексам (индексы из index::Group::members)
EntityRefs select(const std::vector<decode::DecodedEntity>& entities,
                  const std::vector<std::size_t>& rows);

/// Заголовок столбца: псевдоним атрибута, если он есть, иначе имя атрибута
std::string column_title(std::string_view attribute);

// ----------------------------------------------------------------------------
// HTML
// ----------------------------------------------------------------------------

/// Заполнитель ячейки отсутствующего атрибута (U+00A0, неразрывный пробел)
constexpr const char* BLANK_CELL = "\xc2\xa0";

class HtmlTable {
public:
    HtmlTable();
    ~HtmlTable();

    HtmlTable(const HtmlTable&) = delete;
    HtmlTable& operator=(const HtmlTable&) = delete;
    HtmlTable(HtmlTable&&) noexcept;
    HtmlTable& operator=(HtmlTable&&) noexcept;

    /// Добавить секцию: необязательная строка-заголовок (с якорем cn_<id>),
    /// строка заголовков столбцов и строки записей.
    /// Все секции попадают в один элемент <table>.
    void append_section(const EntityRefs& entities, const std::vector<std::string>& attributes,
                        const std::string& header = "");

    /// Количество добавленных секций
    std::size_t sections() const { return sections_; }

    /// Сериализовать таблицу: ровно один <table> ... </table>
    std::string to_string() const;

private:
    std::unique_ptr<pugi::xml_document> doc_;
    std::size_t sections_ = 0;
};

/// Таблица для сгруппированного отчёта: секция на каждый ключ, в порядке ключей
HtmlTable grouped_html_table(const std::vector<decode::DecodedEntity>& entities,
                             const index::GroupedEntities& grouped,
                             const std::vector<std::string>& attributes);

/// Полная HTML-страница. Пустой stylesheet - страница без блока <style>.
std::string render_html_page(const std::string& body, const std::string& stylesheet);

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

/// Объект записи:
///   {"dn": "...", "attributes": {name: flat-значение}, "raw": {name: исходное значение}}
void append_entity_json(rapidjson::Value& array, const decode::DecodedEntity& entity,
                        rapidjson::Document::AllocatorType& alloc);

/// Массив объектов записей
rapidjson::Document json_entity_list(const EntityRefs& entities);

/// Массив пар [{key: [записи]}, ...] в порядке ключей
rapidjson::Document json_grouped_list(const std::vector<decode::DecodedEntity>& entities,
                                      const index::GroupedEntities& grouped);

/// Сериализация (pretty - с отступом в 2 пробела)
std::string serialize_json(const rapidjson::Value& value, bool pretty = false);

// ----------------------------------------------------------------------------
// grep
// ----------------------------------------------------------------------------

/// Значение поля: переводы строк и вхождения разделителя заменяются пробелом,
/// чтобы число полей в строке не менялось
std::string grep_field(std::string_view value, const std::string& delimiter);

/// Заголовок (имена атрибутов) и строка на запись; отсутствующий атрибут -
/// пустое поле. Строки разделены '\n'.
std::string grep_list(const EntityRefs& entities, const std::vector<std::string>& attributes,
                      const std::string& delimiter);

}  // namespace domaindump::render

#endif  // DOMAINDUMP_RENDER_HPP
