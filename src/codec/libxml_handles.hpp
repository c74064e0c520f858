// SPDX-License-Identifier: MIT

// src/codec/libxml_handles.hpp
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xpath.h>

namespace dataport::codec {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XPathContextDeleter {
    void operator()(xmlXPathContext* ctx) const { xmlXPathFreeContext(ctx); }
};

struct XPathObjectDeleter {
    void operator()(xmlXPathObject* obj) const { xmlXPathFreeObject(obj); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* str) const { xmlFree(str); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XPathContextPtr = std::unique_ptr<xmlXPathContext, XPathContextDeleter>;
using XPathObjectPtr = std::unique_ptr<xmlXPathObject, XPathObjectDeleter>;
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

inline const xmlChar* ToXmlChar(const std::string& s) {
    return reinterpret_cast<const xmlChar*>(s.c_str());
}

inline std::string_view FromXmlChar(const xmlChar* s) {
    return s ? std::string_view(reinterpret_cast<const char*>(s)) : std::string_view{};
}

/// Concatenated text content of @p node and its descendants.
inline std::string NodeText(const xmlNode* node) {
    XmlCharPtr content(xmlNodeGetContent(node));
    return std::string(FromXmlChar(content.get()));
}

/// Message of the last libxml2 error on this thread, or @p fallback.
inline std::string LastXmlError(std::string_view fallback) {
    const xmlError* err = xmlGetLastError();
    if (err == nullptr || err->message == nullptr) {
        return std::string(fallback);
    }
    std::string message(err->message);
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    return message;
}

}  // namespace dataport::codec
