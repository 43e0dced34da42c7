/// @file node.hpp
/// @brief The document tree: RootNode, ListNode, ListItemNode, BlockNode.

#pragma once

#include <redline-cpp/types.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace redline_cpp {

struct Node;

/// Document root. Always the top of a parsed or diffed tree.
struct RootNode {
    std::vector<Node> children;  ///< Top-level nodes in document order.

    auto operator==(const RootNode& other) const -> bool;
};

/// A `<ul>` or `<ol>`. Children are expected to be ListItemNodes.
struct ListNode {
    ListKind kind{ListKind::unordered};
    std::vector<Node> children;

    auto operator==(const ListNode& other) const -> bool;
};

/// One `<li>`.
///
/// `content` holds the item's own markup with nested lists and blocks cut
/// out; those nested structures live in `children` (empty when absent).
struct ListItemNode {
    NodeId id;
    Status status{Status::unchanged};
    std::vector<InlinePart> content;
    std::vector<Node> children;

    auto operator==(const ListItemNode& other) const -> bool;
};

/// A paragraph or heading.
struct BlockNode {
    BlockTag tag{BlockTag::paragraph};
    NodeId id;
    Status status{Status::unchanged};
    std::vector<InlinePart> content;

    auto operator==(const BlockNode& other) const -> bool;
};

/// A node in the simplified document tree.
///
/// Trees are plain values: every parse or diff builds a fresh one, and
/// nothing in the library mutates a tree after returning it.
struct Node {
    std::variant<RootNode, ListNode, ListItemNode, BlockNode> inner;  ///< The node kind.

    /// Default-constructs an empty root.
    Node() : inner{RootNode{}} {}

    explicit Node(RootNode n) : inner{std::move(n)} {}
    explicit Node(ListNode n) : inner{std::move(n)} {}
    explicit Node(ListItemNode n) : inner{std::move(n)} {}
    explicit Node(BlockNode n) : inner{std::move(n)} {}

    auto is_root() const -> bool { return std::holds_alternative<RootNode>(inner); }
    auto is_list() const -> bool { return std::holds_alternative<ListNode>(inner); }
    auto is_list_item() const -> bool { return std::holds_alternative<ListItemNode>(inner); }
    auto is_block() const -> bool { return std::holds_alternative<BlockNode>(inner); }

    /// The id of a Block or ListItem, nullopt for containers.
    auto id() const -> std::optional<NodeId>;

    /// The status of a Block or ListItem, nullopt for containers.
    auto status() const -> std::optional<Status>;

    /// Child nodes of a Root, List or ListItem; empty for Blocks.
    auto children() const -> const std::vector<Node>&;

    auto operator==(const Node&) const -> bool = default;
};

/// Flatten a subtree to one string of its content markup.
///
/// Blocks and items contribute their content in the given reading; an item
/// with nested children and the members of a container are joined with a
/// single space.
auto text_content(const Node& node, Reading reading = Reading::original) -> std::string;

}  // namespace redline_cpp
