#pragma once

// Internal header — not installed.
// unique_ptr wrappers and small read helpers for libxml2 objects.

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/tree.h>
#include <libxml/xmlIO.h>

#include <memory>
#include <string>
#include <string_view>

namespace redline_cpp::detail {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const noexcept { ::xmlFreeDoc(doc); }
};

struct XmlNodeDeleter {
    void operator()(xmlNode* node) const noexcept { ::xmlFreeNode(node); }
};

struct XmlBufferDeleter {
    void operator()(xmlBuffer* buffer) const noexcept { ::xmlBufferFree(buffer); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* s) const noexcept { ::xmlFree(s); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlNodePtr = std::unique_ptr<xmlNode, XmlNodeDeleter>;
using XmlBufferPtr = std::unique_ptr<xmlBuffer, XmlBufferDeleter>;
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

inline auto is_element(const xmlNode* node) -> bool {
    return node != nullptr && node->type == XML_ELEMENT_NODE;
}

// Element name as the HTML parser stored it (already lower-case).
inline auto element_name(const xmlNode* node) -> std::string_view {
    if (node == nullptr || node->name == nullptr) return {};
    return reinterpret_cast<const char*>(node->name);
}

// Concatenated text of a subtree, entities decoded.
inline auto text_of(const xmlNode* node) -> std::string {
    auto content = XmlCharPtr{::xmlNodeGetContent(node)};
    if (!content) return {};
    return reinterpret_cast<const char*>(content.get());
}

// Serialized HTML of a node's children, without the node's own tags.
inline auto inner_markup(xmlNode* node) -> std::string {
    if (node == nullptr || node->children == nullptr) return {};
    auto buffer = XmlBufferPtr{::xmlBufferCreate()};
    if (!buffer) return {};
    auto* out = ::xmlOutputBufferCreateBuffer(buffer.get(), nullptr);
    if (out == nullptr) return {};
    for (auto* child = node->children; child != nullptr; child = child->next) {
        ::htmlNodeDumpFormatOutput(out, node->doc, child, nullptr, 0);
    }
    // Flushes into `buffer`; the xmlBuffer itself stays alive.
    if (::xmlOutputBufferClose(out) < 0) return {};
    const auto* content = ::xmlBufferContent(buffer.get());
    if (content == nullptr) return {};
    return reinterpret_cast<const char*>(content);
}

}  // namespace redline_cpp::detail
