#include <redline-cpp/html_parser.hpp>

#include "libxml_handles.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace redline_cpp {

namespace {

using detail::element_name;
using detail::inner_markup;
using detail::is_element;

auto is_blank(std::string_view s) -> bool {
    return s.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

auto trim(std::string_view s) -> std::string {
    const auto first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n\f\v");
    return std::string{s.substr(first, last - first + 1)};
}

// Plain text becomes markup when it is stored as block content.
auto escape_text(std::string_view text) -> std::string {
    auto out = std::string{};
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:  out.push_back(c); break;
        }
    }
    return out;
}

auto is_container(std::string_view name) -> bool {
    return name == "div" || name == "section" || name == "article";
}

// Elements cut out of an item's own content and parsed as its children.
auto is_nested_structure(std::string_view name) -> bool {
    return parse_list_kind(name).has_value() || parse_block_tag(name).has_value();
}

// Detach and free every nested list or block below `node`.
void strip_nested_structures(xmlNode* node) {
    auto* child = node->children;
    while (child != nullptr) {
        auto* next = child->next;
        if (is_element(child) && is_nested_structure(element_name(child))) {
            ::xmlUnlinkNode(child);
            ::xmlFreeNode(child);
        } else if (child->children != nullptr) {
            strip_nested_structures(child);
        }
        child = next;
    }
}

// Walks the libxml2 element tree and collects recognized nodes in document
// order. NodeIds come from one counter per node kind.
class TreeBuilder {
public:
    explicit TreeBuilder(const ParseOptions& options) : options_{options} {}

    // Dispatch one element and append whatever it produces to `out`.
    void visit(xmlNode* element, std::vector<Node>& out) {
        const auto name = element_name(element);

        if (const auto tag = parse_block_tag(name)) {
            out.emplace_back(make_block(*tag, inner_markup(element)));
            return;
        }
        if (const auto kind = parse_list_kind(name)) {
            out.emplace_back(parse_list(element, *kind));
            return;
        }
        if (is_container(name)) {
            auto nested = collect(element);
            if (!nested.empty()) {
                for (auto& node : nested) out.push_back(std::move(node));
                return;
            }
            auto markup = inner_markup(element);
            if (!is_blank(markup)) {
                out.emplace_back(make_block(BlockTag::paragraph, std::move(markup)));
            }
            return;
        }
        for (auto& node : collect(element)) out.push_back(std::move(node));
    }

    // Visit every element child of `parent`.
    auto collect(xmlNode* parent) -> std::vector<Node> {
        auto nodes = std::vector<Node>{};
        for (auto* child = parent->children; child != nullptr; child = child->next) {
            if (is_element(child)) visit(child, nodes);
        }
        return nodes;
    }

    auto make_block(BlockTag tag, std::string markup) -> BlockNode {
        auto block = BlockNode{};
        block.tag = tag;
        block.id = "block-" + std::to_string(next_block_++);
        block.content.push_back(InlinePart{std::move(markup)});
        return block;
    }

private:
    auto parse_list(xmlNode* element, ListKind kind) -> ListNode {
        auto list = ListNode{};
        list.kind = kind;
        for (auto* child = element->children; child != nullptr; child = child->next) {
            if (!is_element(child) || element_name(child) != "li") continue;
            if (auto item = parse_item(child)) {
                list.children.emplace_back(std::move(*item));
            }
        }
        return list;
    }

    auto parse_item(xmlNode* li) -> std::optional<ListItemNode> {
        auto item = ListItemNode{};
        item.id = "li-" + std::to_string(next_item_++);

        auto top = top_content(li);
        item.children = collect(li);
        if (is_blank(top) && item.children.empty()) {
            // Nothing below consumed an id, so the counter can be reused.
            --next_item_;
            return std::nullopt;
        }
        if (!top.empty()) item.content.push_back(InlinePart{std::move(top)});
        return item;
    }

    // The item's markup with nested lists and blocks removed.
    auto top_content(xmlNode* li) const -> std::string {
        auto copy = detail::XmlNodePtr{::xmlDocCopyNode(li, li->doc, 1)};
        if (!copy) return {};
        strip_nested_structures(copy.get());
        auto markup = inner_markup(copy.get());
        return options_.trim_item_content ? trim(markup) : markup;
    }

    const ParseOptions& options_;
    std::size_t next_block_{0};
    std::size_t next_item_{0};
};

}  // anonymous namespace

auto parse_html(std::string_view html, const ParseOptions& options) -> std::optional<Node> {
    // libxml2 takes the input length as an int.
    const auto limit = std::min<std::size_t>(options.max_input_size,
                                             static_cast<std::size_t>(std::numeric_limits<int>::max()));
    if (html.size() > limit || is_blank(html)) return std::nullopt;

    auto doc = detail::XmlDocPtr{::htmlReadMemory(
        html.data(), static_cast<int>(html.size()), nullptr, "UTF-8",
        HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET)};
    if (!doc) return std::nullopt;

    auto* root_element = ::xmlDocGetRootElement(doc.get());
    if (root_element == nullptr) return std::nullopt;

    auto builder = TreeBuilder{options};
    auto root = RootNode{};
    builder.visit(root_element, root.children);

    if (root.children.empty()) {
        auto text = trim(detail::text_of(root_element));
        if (text.empty()) return std::nullopt;
        root.children.emplace_back(builder.make_block(BlockTag::paragraph, escape_text(text)));
    }
    return Node{std::move(root)};
}

}  // namespace redline_cpp
