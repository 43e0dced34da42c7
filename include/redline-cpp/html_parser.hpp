/// @file html_parser.hpp
/// @brief Parse an HTML fragment into the simplified document tree.

#pragma once

#include <redline-cpp/node.hpp>

#include <cstddef>
#include <limits>
#include <optional>
#include <string_view>

namespace redline_cpp {

/// Options for parse_html().
struct ParseOptions {
    /// Trim leading/trailing whitespace from list item content. Cutting
    /// nested lists out of an `<li>` otherwise leaves their indentation behind.
    bool trim_item_content{true};

    /// Inputs longer than this many bytes are not parsed. Limits above
    /// INT_MAX are clamped to it.
    std::size_t max_input_size{static_cast<std::size_t>(std::numeric_limits<int>::max())};
};

/// Parse an HTML string into a RootNode tree.
///
/// Recognized elements:
/// - `p`, `h1`..`h6` become BlockNodes holding their inner markup verbatim.
/// - `ul`, `ol` become ListNodes; each direct `li` becomes a ListItemNode
///   whose content is the item's markup minus nested lists and blocks, which
///   are parsed into the item's children. Empty items are skipped.
/// - `div`, `section`, `article` are walked; if nothing inside them is
///   recognized, their whole inner markup becomes one paragraph.
/// - Every other element is walked transparently.
///
/// If nothing is recognized, the document's text becomes a single
/// paragraph. Malformed markup is repaired by libxml2's HTML parser.
///
/// @param html The HTML fragment or document.
/// @return The root node, or nullopt if the input has no content at all or
///   is longer than ParseOptions::max_input_size.
auto parse_html(std::string_view html, const ParseOptions& options = {}) -> std::optional<Node>;

}  // namespace redline_cpp
