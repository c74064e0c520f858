// SPDX-License-Identifier: MIT

#include "dataport/codec/html_codec.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>

#include "libxml_handles.hpp"

namespace dataport::codec {

namespace {

constexpr int kReadFlags = HTML_PARSE_NONET | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING;

bool IsElement(const xmlNode* node, std::string_view name) {
    return node->type == XML_ELEMENT_NODE && FromXmlChar(node->name) == name;
}

std::string Trim(std::string text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    text.erase(text.begin(), std::find_if(text.begin(), text.end(), not_space));
    text.erase(std::find_if(text.rbegin(), text.rend(), not_space).base(), text.end());
    return text;
}

void CollectTables(xmlNode* node, std::vector<xmlNode*>& out) {
    for (xmlNode* child = node; child != nullptr; child = child->next) {
        if (IsElement(child, "table")) {
            out.push_back(child);
        }
        if (child->children != nullptr) {
            CollectTables(child->children, out);
        }
    }
}

// Rows of @p table, descending into row groups but not into nested tables
void CollectRows(const xmlNode* parent, std::vector<const xmlNode*>& out) {
    for (const xmlNode* child = parent->children; child != nullptr; child = child->next) {
        if (IsElement(child, "tr")) {
            out.push_back(child);
        } else if (IsElement(child, "thead") || IsElement(child, "tbody") ||
                   IsElement(child, "tfoot")) {
            CollectRows(child, out);
        }
    }
}

struct Cell {
    std::string text;
    bool header = false;
};

std::vector<Cell> RowCells(const xmlNode* row) {
    std::vector<Cell> cells;
    for (const xmlNode* child = row->children; child != nullptr; child = child->next) {
        if (IsElement(child, "td") || IsElement(child, "th")) {
            cells.push_back(Cell{Trim(NodeText(child)), IsElement(child, "th")});
        }
    }
    return cells;
}

// Repeated names get ".1", ".2", ... appended, skipping any name already taken
std::string UniqueName(std::string name, std::unordered_set<std::string>& taken) {
    if (!taken.contains(name)) {
        taken.insert(name);
        return name;
    }
    for (size_t n = 1;; ++n) {
        std::string candidate = fmt::format("{}.{}", name, n);
        if (!taken.contains(candidate)) {
            taken.insert(candidate);
            return candidate;
        }
    }
}

std::expected<DataFrame, std::string> ParseTable(const xmlNode* table,
                                                 const std::vector<std::string>& na_values) {
    std::vector<const xmlNode*> rows;
    CollectRows(table, rows);

    std::vector<std::vector<Cell>> cells;
    for (const xmlNode* row : rows) {
        auto row_cells = RowCells(row);
        if (!row_cells.empty()) cells.push_back(std::move(row_cells));
    }

    std::vector<std::string> names;
    std::unordered_set<std::string> taken;
    size_t first_data = 0;
    if (!cells.empty() &&
        std::ranges::all_of(cells.front(), [](const Cell& c) { return c.header; })) {
        for (auto& cell : cells.front()) names.push_back(UniqueName(std::move(cell.text), taken));
        first_data = 1;
    }

    size_t width = names.size();
    for (size_t r = first_data; r < cells.size(); ++r) {
        width = std::max(width, cells[r].size());
    }
    for (size_t c = names.size(); c < width; ++c) {
        names.push_back(UniqueName(std::to_string(c), taken));
    }

    std::vector<std::pair<std::string, std::vector<Value>>> columns;
    columns.reserve(width);
    for (auto& name : names) {
        columns.emplace_back(std::move(name), std::vector<Value>{});
    }
    for (size_t r = first_data; r < cells.size(); ++r) {
        for (size_t c = 0; c < width; ++c) {
            Value value;
            if (c < cells[r].size() &&
                std::ranges::find(na_values, cells[r][c].text) == na_values.end()) {
                value = ParseScalar(cells[r][c].text);
            }
            columns[c].second.push_back(std::move(value));
        }
    }
    return DataFrame::FromValues(std::move(columns));
}

xmlNode* AddElement(xmlNode* parent, const char* name, const std::string* text = nullptr) {
    return xmlNewTextChild(parent, nullptr, reinterpret_cast<const xmlChar*>(name),
                           text ? ToXmlChar(*text) : nullptr);
}

}  // namespace

std::expected<DataFrame, std::string> ReadHtml(const std::string& path,
                                               const OptionMap& options) {
    OptionReader opts(options);
    auto table_index = opts.GetOr<int64_t>("table_index", 0);
    auto match = opts.Get<std::string>("match");
    auto na_values = opts.GetOr<std::vector<std::string>>("na_values", kDefaultHtmlNaValues);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    if (table_index < 0) {
        return std::unexpected(fmt::format("table_index must be non-negative, got {}",
                                           table_index));
    }

    XmlDocPtr doc(htmlReadFile(path.c_str(), nullptr, kReadFlags));
    if (!doc) {
        return std::unexpected(
            fmt::format("cannot parse '{}': {}", path, LastXmlError("malformed document")));
    }

    std::vector<xmlNode*> tables;
    if (xmlNode* root = xmlDocGetRootElement(doc.get()); root != nullptr) {
        CollectTables(root, tables);
    }
    if (match) {
        std::erase_if(tables, [&](const xmlNode* t) {
            return NodeText(t).find(*match) == std::string::npos;
        });
    }
    if (tables.empty()) {
        return std::unexpected(match ? fmt::format("no table matching '{}' in '{}'", *match, path)
                                     : fmt::format("no tables found in '{}'", path));
    }
    if (static_cast<size_t>(table_index) >= tables.size()) {
        return std::unexpected(fmt::format("table_index {} out of range ({} tables found)",
                                           table_index, tables.size()));
    }
    return ParseTable(tables[static_cast<size_t>(table_index)], na_values);
}

std::expected<void, std::string> WriteHtml(const DataFrame& frame, const std::string& path,
                                           const OptionMap& options) {
    OptionReader opts(options);
    auto border = opts.GetOr<int64_t>("border", 1);
    auto header = opts.GetOr<bool>("header", true);
    auto na_rep = opts.GetOr<std::string>("na_rep", "NaN");
    auto table_id = opts.Get<std::string>("table_id");
    auto classes = opts.Get<std::vector<std::string>>("classes");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    std::string class_attr = "dataframe";
    if (classes) {
        for (const auto& cls : *classes) class_attr += " " + cls;
    }

    XmlDocPtr doc(htmlNewDocNoDtD(nullptr, nullptr));
    if (!doc) {
        return std::unexpected(std::string("failed to create HTML document"));
    }
    xmlNode* table = xmlNewNode(nullptr, reinterpret_cast<const xmlChar*>("table"));
    xmlDocSetRootElement(doc.get(), table);
    xmlNewProp(table, reinterpret_cast<const xmlChar*>("border"),
               ToXmlChar(std::to_string(border)));
    xmlNewProp(table, reinterpret_cast<const xmlChar*>("class"), ToXmlChar(class_attr));
    if (table_id) {
        xmlNewProp(table, reinterpret_cast<const xmlChar*>("id"), ToXmlChar(*table_id));
    }

    if (header) {
        xmlNode* tr = AddElement(AddElement(table, "thead"), "tr");
        for (const auto& col : frame.columns()) {
            AddElement(tr, "th", &col.name);
        }
    }
    xmlNode* tbody = AddElement(table, "tbody");
    for (size_t row = 0; row < frame.RowCount(); ++row) {
        xmlNode* tr = AddElement(tbody, "tr");
        for (const auto& col : frame.columns()) {
            const Value& value = col.values[row];
            std::string text = IsNull(value) ? na_rep : ValueToString(value);
            AddElement(tr, "td", &text);
        }
    }

    if (htmlSaveFileFormat(path.c_str(), doc.get(), "UTF-8", 1) < 0) {
        return std::unexpected(fmt::format("error writing '{}': {}", path,
                                           LastXmlError("save failed")));
    }
    return {};
}

}  // namespace dataport::codec
