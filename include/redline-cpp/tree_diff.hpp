/// @file tree_diff.hpp
/// @brief Align two parsed trees into one annotated tree.

#pragma once

#include <redline-cpp/inline_diff.hpp>
#include <redline-cpp/node.hpp>

#include <optional>
#include <string_view>

namespace redline_cpp {

/// Diff two trees produced by parse_html().
///
/// Children of roots and lists are aligned by index. A node present on one
/// side only is copied with every Block/ListItem in it marked added or
/// removed. Nodes of the same shape (list/list, item/item, block/block with
/// the same tag) are compared structurally; anything else falls back to one
/// paragraph-or-heading Block diffing the flattened text of both sides.
///
/// The output carries fresh positional ids (`block-N`, `li-N`) in document
/// order. A non-root argument is treated as a root with that single child.
///
/// @param a The original tree.
/// @param b The modified tree.
/// @return An annotated RootNode.
auto diff_trees(const Node& a, const Node& b, const DiffOptions& options = {}) -> Node;

/// Parse and diff two HTML strings.
/// @return The annotated tree, or nullopt if either side has nothing to diff.
auto diff_html(std::string_view original, std::string_view modified,
               const DiffOptions& options = {}) -> std::optional<Node>;

}  // namespace redline_cpp
