#include <redline-cpp/tree_diff.hpp>

#include <redline-cpp/html_parser.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace redline_cpp {

namespace {

auto status_of(const std::vector<InlinePart>& parts) -> Status {
    return has_changes(parts) ? Status::changed : Status::unchanged;
}

class TreeDiffer {
public:
    explicit TreeDiffer(const DiffOptions& options) : options_{options} {}

    // Pair up children by index.
    auto align(const std::vector<Node>& a, const std::vector<Node>& b) -> std::vector<Node> {
        auto out = std::vector<Node>{};
        const auto count = std::max(a.size(), b.size());
        out.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            if (i >= a.size()) {
                out.push_back(mark(b[i], Status::added));
            } else if (i >= b.size()) {
                out.push_back(mark(a[i], Status::removed));
            } else {
                out.push_back(diff_pair(a[i], b[i]));
            }
        }
        return out;
    }

private:
    auto diff_pair(const Node& a, const Node& b) -> Node {
        if (a.is_root() && b.is_root()) {
            return Node{RootNode{align(a.children(), b.children())}};
        }
        if (const auto* la = std::get_if<ListNode>(&a.inner)) {
            if (const auto* lb = std::get_if<ListNode>(&b.inner)) {
                auto list = ListNode{};
                list.kind = lb->kind;
                list.children = align(la->children, lb->children);
                return Node{std::move(list)};
            }
        }
        if (const auto* ia = std::get_if<ListItemNode>(&a.inner)) {
            if (const auto* ib = std::get_if<ListItemNode>(&b.inner)) {
                auto item = ListItemNode{};
                item.id = next_item_id();
                item.content = inline_diff(join_parts(ia->content), join_parts(ib->content), options_);
                item.status = status_of(item.content);
                item.children = align(ia->children, ib->children);
                return Node{std::move(item)};
            }
        }
        if (const auto* ba = std::get_if<BlockNode>(&a.inner)) {
            if (const auto* bb = std::get_if<BlockNode>(&b.inner); bb && ba->tag == bb->tag) {
                auto block = BlockNode{};
                block.tag = bb->tag;
                block.id = next_block_id();
                block.content = inline_diff(join_parts(ba->content), join_parts(bb->content), options_);
                block.status = status_of(block.content);
                return Node{std::move(block)};
            }
        }
        return fallback(a, b);
    }

    // Shapes differ: compare the flattened text of both sides as one block.
    auto fallback(const Node& a, const Node& b) -> Node {
        auto block = BlockNode{};
        if (const auto* bb = std::get_if<BlockNode>(&b.inner)) {
            block.tag = bb->tag;
        } else if (const auto* ba = std::get_if<BlockNode>(&a.inner)) {
            block.tag = ba->tag;
        }
        block.id = next_block_id();
        block.content = inline_diff(text_content(a), text_content(b), options_);
        block.status = status_of(block.content);
        return Node{std::move(block)};
    }

    // Copy a one-sided subtree, marking every Block/ListItem in it.
    auto mark(const Node& node, Status status) -> Node {
        const auto side_only = [status](const std::vector<InlinePart>& content) {
            auto parts = std::vector<InlinePart>{};
            auto text = join_parts(content);
            if (!text.empty()) {
                parts.push_back(InlinePart{std::move(text), status == Status::added,
                                           status == Status::removed});
            }
            return parts;
        };
        const auto mark_all = [&](const std::vector<Node>& children) {
            auto out = std::vector<Node>{};
            out.reserve(children.size());
            for (const auto& child : children) out.push_back(mark(child, status));
            return out;
        };

        return std::visit(overload{
            [&](const RootNode& root) {
                return Node{RootNode{mark_all(root.children)}};
            },
            [&](const ListNode& list) {
                return Node{ListNode{list.kind, mark_all(list.children)}};
            },
            [&](const ListItemNode& source) {
                auto item = ListItemNode{};
                item.id = next_item_id();
                item.status = status;
                item.content = side_only(source.content);
                item.children = mark_all(source.children);
                return Node{std::move(item)};
            },
            [&](const BlockNode& source) {
                auto block = BlockNode{};
                block.tag = source.tag;
                block.id = next_block_id();
                block.status = status;
                block.content = side_only(source.content);
                return Node{std::move(block)};
            },
        }, node.inner);
    }

    auto next_block_id() -> NodeId { return "block-" + std::to_string(next_block_++); }
    auto next_item_id() -> NodeId { return "li-" + std::to_string(next_item_++); }

    const DiffOptions& options_;
    std::size_t next_block_{0};
    std::size_t next_item_{0};
};

// Roots contribute their children; anything else stands alone.
auto top_level(const Node& node) -> std::vector<Node> {
    if (node.is_root()) return node.children();
    return {node};
}

}  // anonymous namespace

auto diff_trees(const Node& a, const Node& b, const DiffOptions& options) -> Node {
    auto differ = TreeDiffer{options};
    return Node{RootNode{differ.align(top_level(a), top_level(b))}};
}

auto diff_html(std::string_view original, std::string_view modified,
               const DiffOptions& options) -> std::optional<Node> {
    const auto tree_a = parse_html(original);
    const auto tree_b = parse_html(modified);
    if (!tree_a || !tree_b) return std::nullopt;
    return diff_trees(*tree_a, *tree_b, options);
}

}  // namespace redline_cpp
