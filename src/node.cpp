#include <redline-cpp/node.hpp>

#include <string>
#include <vector>

namespace redline_cpp {

// -- InlinePart helpers -------------------------------------------------------

auto join_parts(const std::vector<InlinePart>& parts, Reading reading) -> std::string {
    auto result = std::string{};
    for (const auto& part : parts) {
        if (reading == Reading::original && part.added) continue;
        if (reading == Reading::modified && part.removed) continue;
        result += part.text;
    }
    return result;
}

auto has_changes(const std::vector<InlinePart>& parts) -> bool {
    for (const auto& part : parts) {
        if (part.added || part.removed) return true;
    }
    return false;
}

// -- Equality -----------------------------------------------------------------

auto RootNode::operator==(const RootNode& other) const -> bool {
    return children == other.children;
}

auto ListNode::operator==(const ListNode& other) const -> bool {
    return kind == other.kind && children == other.children;
}

auto ListItemNode::operator==(const ListItemNode& other) const -> bool {
    return id == other.id && status == other.status &&
           content == other.content && children == other.children;
}

auto BlockNode::operator==(const BlockNode& other) const -> bool {
    return tag == other.tag && id == other.id && status == other.status &&
           content == other.content;
}

// -- Node accessors -----------------------------------------------------------

auto Node::id() const -> std::optional<NodeId> {
    return std::visit(overload{
        [](const ListItemNode& item) -> std::optional<NodeId> { return item.id; },
        [](const BlockNode& block) -> std::optional<NodeId> { return block.id; },
        [](const auto&) -> std::optional<NodeId> { return std::nullopt; },
    }, inner);
}

auto Node::status() const -> std::optional<Status> {
    return std::visit(overload{
        [](const ListItemNode& item) -> std::optional<Status> { return item.status; },
        [](const BlockNode& block) -> std::optional<Status> { return block.status; },
        [](const auto&) -> std::optional<Status> { return std::nullopt; },
    }, inner);
}

auto Node::children() const -> const std::vector<Node>& {
    static const auto no_children = std::vector<Node>{};
    return std::visit(overload{
        [](const RootNode& root) -> const std::vector<Node>& { return root.children; },
        [](const ListNode& list) -> const std::vector<Node>& { return list.children; },
        [](const ListItemNode& item) -> const std::vector<Node>& { return item.children; },
        [](const BlockNode&) -> const std::vector<Node>& { return no_children; },
    }, inner);
}

// -- Flattening ---------------------------------------------------------------

namespace {

void append_spaced(std::string& out, const std::string& piece) {
    if (piece.empty()) return;
    if (!out.empty()) out.push_back(' ');
    out += piece;
}

}  // anonymous namespace

auto text_content(const Node& node, Reading reading) -> std::string {
    return std::visit(overload{
        [&](const BlockNode& block) {
            return join_parts(block.content, reading);
        },
        [&](const ListItemNode& item) {
            auto text = join_parts(item.content, reading);
            for (const auto& child : item.children) {
                append_spaced(text, text_content(child, reading));
            }
            return text;
        },
        [&](const auto& container) {
            auto text = std::string{};
            for (const auto& child : container.children) {
                append_spaced(text, text_content(child, reading));
            }
            return text;
        },
    }, node.inner);
}

}  // namespace redline_cpp
