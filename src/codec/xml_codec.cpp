// SPDX-License-Identifier: MIT

#include "dataport/codec/xml_codec.hpp"

#include <optional>
#include <utility>

#include <fmt/format.h>
#include <libxml/parser.h>
#include <libxml/xmlsave.h>

#include "dataport/dataset.hpp"
#include "libxml_handles.hpp"

namespace dataport::codec {

namespace {

constexpr int kReadFlags = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

// Fields of one row element: attributes first, then child elements
Record ElementRecord(const xmlNode* node) {
    Record record;
    for (const xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
        std::string text;
        if (attr->children != nullptr) {
            text = NodeText(attr->children);
        }
        record.emplace_back(std::string(FromXmlChar(attr->name)), ParseScalar(text));
    }
    for (const xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        record.emplace_back(std::string(FromXmlChar(child->name)), ParseScalar(NodeText(child)));
    }
    return record;
}

}  // namespace

bool IsValidXmlName(std::string_view name) {
    std::string copy(name);
    return !copy.empty() && xmlValidateNCName(ToXmlChar(copy), 0) == 0;
}

std::expected<DataFrame, std::string> ReadXml(const std::string& path,
                                              const OptionMap& options) {
    OptionReader opts(options);
    auto xpath = opts.GetOr<std::string>("xpath", std::string(kDefaultRowXPath));
    auto encoding = opts.Get<std::string>("encoding");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    XmlDocPtr doc(xmlReadFile(path.c_str(), encoding ? encoding->c_str() : nullptr, kReadFlags));
    if (!doc) {
        return std::unexpected(
            fmt::format("cannot parse '{}': {}", path, LastXmlError("malformed document")));
    }

    XPathContextPtr ctx(xmlXPathNewContext(doc.get()));
    if (!ctx) {
        return std::unexpected(std::string("failed to create XPath context"));
    }
    XPathObjectPtr result(xmlXPathEvalExpression(ToXmlChar(xpath), ctx.get()));
    if (!result) {
        return std::unexpected(fmt::format("invalid xpath '{}': {}", xpath,
                                           LastXmlError("evaluation failed")));
    }

    const xmlNodeSet* nodes = result->nodesetval;
    RecordList records;
    if (nodes != nullptr) {
        for (int i = 0; i < nodes->nodeNr; ++i) {
            const xmlNode* node = nodes->nodeTab[i];
            if (node->type != XML_ELEMENT_NODE) continue;
            records.push_back(ElementRecord(node));
        }
    }
    if (records.empty()) {
        return std::unexpected(fmt::format("xpath '{}' matched no elements in '{}'", xpath, path));
    }
    return FromRecords(records);
}

std::expected<void, std::string> WriteXml(const DataFrame& frame, const std::string& path,
                                          const OptionMap& options) {
    OptionReader opts(options);
    auto root_name = opts.GetOr<std::string>("root_name", "data");
    auto row_name = opts.GetOr<std::string>("row_name", "row");
    auto xml_declaration = opts.GetOr<bool>("xml_declaration", true);
    auto pretty_print = opts.GetOr<bool>("pretty_print", true);
    auto encoding = opts.GetOr<std::string>("encoding", "utf-8");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    for (const auto& name : {root_name, row_name}) {
        if (!IsValidXmlName(name)) {
            return std::unexpected(fmt::format("'{}' is not a valid element name", name));
        }
    }
    for (const auto& col : frame.columns()) {
        if (!IsValidXmlName(col.name)) {
            return std::unexpected(
                fmt::format("column '{}' is not a valid element name", col.name));
        }
    }

    XmlDocPtr doc(xmlNewDoc(reinterpret_cast<const xmlChar*>("1.0")));
    xmlNode* root = xmlNewNode(nullptr, ToXmlChar(root_name));
    xmlDocSetRootElement(doc.get(), root);

    for (size_t row = 0; row < frame.RowCount(); ++row) {
        xmlNode* row_node = xmlNewChild(root, nullptr, ToXmlChar(row_name), nullptr);
        for (const auto& col : frame.columns()) {
            const Value& value = col.values[row];
            if (IsNull(value)) {
                xmlNewChild(row_node, nullptr, ToXmlChar(col.name), nullptr);
            } else {
                // xmlNewTextChild escapes the content
                xmlNewTextChild(row_node, nullptr, ToXmlChar(col.name),
                                ToXmlChar(ValueToString(value)));
            }
        }
    }

    int save_flags = (pretty_print ? XML_SAVE_FORMAT : 0) | (xml_declaration ? 0 : XML_SAVE_NO_DECL);
    xmlSaveCtxt* save = xmlSaveToFilename(path.c_str(), encoding.c_str(), save_flags);
    if (save == nullptr) {
        return std::unexpected(fmt::format("cannot open '{}' for writing with encoding '{}'",
                                           path, encoding));
    }
    long written = xmlSaveDoc(save, doc.get());
    int closed = xmlSaveClose(save);
    if (written < 0 || closed < 0) {
        return std::unexpected(fmt::format("error writing '{}': {}", path,
                                           LastXmlError("save failed")));
    }
    return {};
}

}  // namespace dataport::codec
