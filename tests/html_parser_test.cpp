#include <redline-cpp/html_parser.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

using namespace redline_cpp;

namespace {

auto parse(const std::string& html) -> Node {
    auto tree = parse_html(html);
    EXPECT_TRUE(tree.has_value()) << html;
    return tree.value_or(Node{});
}

auto as_block(const Node& node) -> const BlockNode& {
    return std::get<BlockNode>(node.inner);
}

auto as_list(const Node& node) -> const ListNode& {
    return std::get<ListNode>(node.inner);
}

auto as_item(const Node& node) -> const ListItemNode& {
    return std::get<ListItemNode>(node.inner);
}

}  // namespace

// -- Blocks -------------------------------------------------------------------

TEST(ParseHtml, paragraph_becomes_block) {
    const auto tree = parse("<p>Hard hat (Class G)</p>");
    ASSERT_TRUE(tree.is_root());
    ASSERT_EQ(tree.children().size(), 1u);

    const auto& block = as_block(tree.children()[0]);
    EXPECT_EQ(block.tag, BlockTag::paragraph);
    EXPECT_EQ(block.id, "block-0");
    EXPECT_EQ(block.status, Status::unchanged);
    EXPECT_EQ(block.content, (std::vector<InlinePart>{{"Hard hat (Class G)"}}));
}

TEST(ParseHtml, headings_keep_their_level) {
    const auto tree = parse("<h1>Title</h1><h3>Section</h3>");
    ASSERT_EQ(tree.children().size(), 2u);
    EXPECT_EQ(as_block(tree.children()[0]).tag, BlockTag::heading1);
    EXPECT_EQ(as_block(tree.children()[1]).tag, BlockTag::heading3);
    EXPECT_EQ(as_block(tree.children()[1]).id, "block-1");
}

TEST(ParseHtml, inline_markup_is_kept_verbatim) {
    const auto tree = parse("<p><strong>Workers</strong> must wear PPE.</p>");
    ASSERT_EQ(tree.children().size(), 1u);
    EXPECT_EQ(join_parts(as_block(tree.children()[0]).content),
              "<strong>Workers</strong> must wear PPE.");
}

TEST(ParseHtml, entities_stay_escaped) {
    const auto tree = parse("<p>Fish &amp; chips</p>");
    ASSERT_EQ(tree.children().size(), 1u);
    EXPECT_EQ(join_parts(as_block(tree.children()[0]).content), "Fish &amp; chips");
}

TEST(ParseHtml, unclosed_paragraphs_are_repaired) {
    const auto tree = parse("<p>Unclosed<p>Second");
    ASSERT_EQ(tree.children().size(), 2u);
    EXPECT_EQ(join_parts(as_block(tree.children()[0]).content), "Unclosed");
    EXPECT_EQ(join_parts(as_block(tree.children()[1]).content), "Second");
}

// -- Lists --------------------------------------------------------------------

TEST(ParseHtml, unordered_list_items) {
    const auto tree = parse("<ul><li>One</li><li>Two</li></ul>");
    ASSERT_EQ(tree.children().size(), 1u);

    const auto& list = as_list(tree.children()[0]);
    EXPECT_EQ(list.kind, ListKind::unordered);
    ASSERT_EQ(list.children.size(), 2u);
    EXPECT_EQ(as_item(list.children[0]).id, "li-0");
    EXPECT_EQ(as_item(list.children[1]).id, "li-1");
    EXPECT_EQ(join_parts(as_item(list.children[1]).content), "Two");
}

TEST(ParseHtml, ordered_list_kind) {
    const auto tree = parse("<ol><li>First</li></ol>");
    ASSERT_EQ(tree.children().size(), 1u);
    EXPECT_EQ(as_list(tree.children()[0]).kind, ListKind::ordered);
}

TEST(ParseHtml, item_content_is_trimmed) {
    const auto tree = parse("<ul>\n  <li>\n    Padded item\n  </li>\n</ul>");
    const auto& list = as_list(tree.children()[0]);
    ASSERT_EQ(list.children.size(), 1u);
    EXPECT_EQ(join_parts(as_item(list.children[0]).content), "Padded item");
}

TEST(ParseHtml, item_content_keeps_non_ascii_text) {
    const auto tree = parse("<ul><li>Caf\xC3\xA9 \xC2\xB1 20mm<ul><li>na\xC3\xAFve</li></ul></li></ul>"
                            "<p>Caf\xC3\xA9</p>");
    ASSERT_EQ(tree.children().size(), 2u);
    const auto& item = as_item(as_list(tree.children()[0]).children[0]);
    EXPECT_EQ(join_parts(item.content), "Caf\xC3\xA9 \xC2\xB1 20mm");
    ASSERT_EQ(item.children.size(), 1u);
    const auto& nested = as_item(as_list(item.children[0]).children[0]);
    EXPECT_EQ(join_parts(nested.content), "na\xC3\xAFve");
    EXPECT_EQ(join_parts(as_block(tree.children()[1]).content), "Caf\xC3\xA9");
}

TEST(ParseHtml, nested_list_becomes_item_children) {
    const auto tree = parse("<ul><li>Parent<ul><li>Child</li></ul></li></ul>");
    const auto& outer = as_list(tree.children()[0]);
    ASSERT_EQ(outer.children.size(), 1u);

    const auto& parent = as_item(outer.children[0]);
    EXPECT_EQ(parent.id, "li-0");
    EXPECT_EQ(join_parts(parent.content), "Parent");
    ASSERT_EQ(parent.children.size(), 1u);

    const auto& inner = as_list(parent.children[0]);
    ASSERT_EQ(inner.children.size(), 1u);
    EXPECT_EQ(as_item(inner.children[0]).id, "li-1");
    EXPECT_EQ(join_parts(as_item(inner.children[0]).content), "Child");
}

TEST(ParseHtml, block_inside_item_becomes_child) {
    const auto tree = parse("<ul><li><p>Paragraph in item</p></li></ul>");
    const auto& item = as_item(as_list(tree.children()[0]).children[0]);
    EXPECT_TRUE(item.content.empty());
    ASSERT_EQ(item.children.size(), 1u);
    EXPECT_EQ(as_block(item.children[0]).id, "block-0");
}

TEST(ParseHtml, empty_items_are_skipped_without_consuming_ids) {
    const auto tree = parse("<ul><li>One</li><li>   </li><li>Three</li></ul>");
    const auto& list = as_list(tree.children()[0]);
    ASSERT_EQ(list.children.size(), 2u);
    EXPECT_EQ(as_item(list.children[1]).id, "li-1");
    EXPECT_EQ(join_parts(as_item(list.children[1]).content), "Three");
}

TEST(ParseHtml, ids_count_per_kind_in_document_order) {
    const auto tree = parse("<p>A</p><ul><li>x</li></ul><p>B</p>");
    ASSERT_EQ(tree.children().size(), 3u);
    EXPECT_EQ(tree.children()[0].id(), "block-0");
    EXPECT_EQ(tree.children()[1].children()[0].id(), "li-0");
    EXPECT_EQ(tree.children()[2].id(), "block-1");
}

// -- Containers ---------------------------------------------------------------

TEST(ParseHtml, div_with_structure_is_transparent) {
    const auto tree = parse("<div><h2>Safety</h2><p>Body</p></div>");
    ASSERT_EQ(tree.children().size(), 2u);
    EXPECT_EQ(as_block(tree.children()[0]).tag, BlockTag::heading2);
    EXPECT_EQ(as_block(tree.children()[1]).tag, BlockTag::paragraph);
}

TEST(ParseHtml, div_without_structure_becomes_paragraph) {
    const auto tree = parse("<div>Just some <em>text</em></div>");
    ASSERT_EQ(tree.children().size(), 1u);
    const auto& block = as_block(tree.children()[0]);
    EXPECT_EQ(block.tag, BlockTag::paragraph);
    EXPECT_EQ(join_parts(block.content), "Just some <em>text</em>");
}

TEST(ParseHtml, empty_containers_produce_nothing) {
    const auto tree = parse("<div> </div><p>Kept</p>");
    ASSERT_EQ(tree.children().size(), 1u);
    EXPECT_EQ(tree.children()[0].id(), "block-0");
}

TEST(ParseHtml, other_elements_are_walked) {
    const auto tree = parse("<blockquote><p>Quoted</p></blockquote>");
    ASSERT_EQ(tree.children().size(), 1u);
    EXPECT_EQ(join_parts(as_block(tree.children()[0]).content), "Quoted");
}

// -- Fallbacks ----------------------------------------------------------------

TEST(ParseHtml, plain_text_becomes_paragraph) {
    const auto tree = parse("Just text");
    ASSERT_EQ(tree.children().size(), 1u);
    const auto& block = as_block(tree.children()[0]);
    EXPECT_EQ(block.tag, BlockTag::paragraph);
    EXPECT_EQ(join_parts(block.content), "Just text");
}

TEST(ParseHtml, unrecognized_markup_keeps_its_text) {
    const auto tree = parse("<span>Only inline</span>");
    ASSERT_EQ(tree.children().size(), 1u);
    const auto& block = as_block(tree.children()[0]);
    EXPECT_EQ(block.tag, BlockTag::paragraph);
    EXPECT_NE(join_parts(block.content).find("Only inline"), std::string::npos);
}

TEST(ParseHtml, empty_input_has_no_tree) {
    EXPECT_FALSE(parse_html("").has_value());
    EXPECT_FALSE(parse_html("  \n\t ").has_value());
    EXPECT_FALSE(parse_html("<div></div>").has_value());
}

// -- Options ------------------------------------------------------------------

TEST(ParseOptions, untrimmed_item_content_keeps_whitespace) {
    auto options = ParseOptions{};
    options.trim_item_content = false;
    const auto tree = parse_html("<ul><li> spaced </li></ul>", options);
    ASSERT_TRUE(tree.has_value());
    const auto& item = as_item(as_list(tree->children()[0]).children[0]);
    EXPECT_EQ(join_parts(item.content), " spaced ");
}

TEST(ParseOptions, inputs_over_the_size_limit_are_not_parsed) {
    auto options = ParseOptions{};
    options.max_input_size = 8;
    EXPECT_FALSE(parse_html("<p>too long</p>", options).has_value());

    const auto tree = parse_html("<p>x</p>", options);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(join_parts(as_block(tree->children()[0]).content), "x");
}

TEST(ParseOptions, default_limit_fits_libxml2) {
    EXPECT_EQ(ParseOptions{}.max_input_size, static_cast<std::size_t>(std::numeric_limits<int>::max()));
}
