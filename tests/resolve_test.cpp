#include <redline-cpp/resolve.hpp>
#include <redline-cpp/tree_diff.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace redline_cpp;

namespace {

auto diff(const std::string& a, const std::string& b) -> Node {
    auto tree = diff_html(a, b);
    EXPECT_TRUE(tree.has_value());
    return tree.value_or(Node{});
}

const auto ppe_original = std::string{
    "<ul><li>Hard hat (Class G)</li><li>Safety goggles</li><li>Steel-toed boots</li></ul>"};
const auto ppe_modified = std::string{
    "<ul><li>Hard hat (Class G)</li><li>Safety goggles</li></ul>"};

}  // namespace

// -- Changed blocks -----------------------------------------------------------

TEST(Resolve, accepted_change_uses_modified_text) {
    const auto tree = diff("<p>Hard hat (Class G)</p>", "<p>Hard hat (Class E or G)</p>");
    EXPECT_EQ(resolve(tree, {{"block-0", Decision::accept}}), "<p>Hard hat (Class E or G)</p>");
}

TEST(Resolve, rejected_change_uses_original_text) {
    const auto tree = diff("<p>Hard hat (Class G)</p>", "<p>Hard hat (Class E or G)</p>");
    EXPECT_EQ(resolve(tree, {{"block-0", Decision::reject}}), "<p>Hard hat (Class G)</p>");
}

TEST(Resolve, undecided_change_uses_original_text) {
    const auto tree = diff("<p>Hard hat (Class G)</p>", "<p>Hard hat (Class E or G)</p>");
    EXPECT_EQ(resolve(tree, {}), "<p>Hard hat (Class G)</p>");
    EXPECT_EQ(resolve(tree, {{"block-0", Decision::undecided}}), "<p>Hard hat (Class G)</p>");
}

TEST(Resolve, headings_keep_their_tag) {
    const auto tree = diff("<h2>Fire exit</h2>", "<h2>Fire exit procedure</h2>");
    EXPECT_EQ(resolve(tree, {{"block-0", Decision::accept}}), "<h2>Fire exit procedure</h2>");
}

// -- Removed and added nodes --------------------------------------------------

TEST(Resolve, undecided_removal_keeps_item) {
    const auto tree = diff(ppe_original, ppe_modified);
    EXPECT_EQ(resolve(tree, {}), ppe_original);
}

TEST(Resolve, accepted_removal_drops_item) {
    const auto tree = diff(ppe_original, ppe_modified);
    EXPECT_EQ(resolve(tree, {{"li-2", Decision::accept}}), ppe_modified);
}

TEST(Resolve, rejected_removal_keeps_item) {
    const auto tree = diff(ppe_original, ppe_modified);
    EXPECT_EQ(resolve(tree, {{"li-2", Decision::reject}}), ppe_original);
}

TEST(Resolve, addition_needs_acceptance) {
    const auto tree = diff("<ol><li>Stay calm</li></ol>", "<ol><li>Stay calm</li><li>Walk</li></ol>");
    EXPECT_EQ(resolve(tree, {}), "<ol><li>Stay calm</li></ol>");
    EXPECT_EQ(resolve(tree, {{"li-1", Decision::reject}}), "<ol><li>Stay calm</li></ol>");
    EXPECT_EQ(resolve(tree, {{"li-1", Decision::accept}}), "<ol><li>Stay calm</li><li>Walk</li></ol>");
}

TEST(Resolve, accepted_block_removal_drops_block) {
    const auto tree = diff("<p>Keep</p><p>Drop</p>", "<p>Keep</p>");
    EXPECT_EQ(resolve(tree, {{"block-1", Decision::accept}}), "<p>Keep</p>");
}

TEST(Resolve, list_without_surviving_items_is_omitted) {
    const auto tree = diff("<p>Intro</p>", "<p>Intro</p><ul><li>New</li></ul>");
    EXPECT_EQ(resolve(tree, {}), "<p>Intro</p>");
    EXPECT_EQ(resolve(tree, {{"li-0", Decision::accept}}), "<p>Intro</p><ul><li>New</li></ul>");
}

// -- Nested items -------------------------------------------------------------

TEST(Resolve, nested_items_follow_their_own_decisions) {
    const auto tree = diff("<ul><li>Parent<ul><li>Child</li></ul></li></ul>",
                           "<ul><li>Parent<ul><li>Child</li><li>New child</li></ul></li></ul>");
    EXPECT_EQ(resolve(tree, {}), "<ul><li>Parent<ul><li>Child</li></ul></li></ul>");
    EXPECT_EQ(resolve(tree, {{"li-2", Decision::accept}}),
              "<ul><li>Parent<ul><li>Child</li><li>New child</li></ul></li></ul>");
}

TEST(Resolve, dropped_item_still_emits_its_children) {
    auto child = ListItemNode{};
    child.id = "li-1";
    child.content = {{"Child"}};

    auto parent = ListItemNode{};
    parent.id = "li-0";
    parent.status = Status::removed;
    parent.content = {{"Parent", false, true}};
    parent.children = {Node{ListNode{ListKind::unordered, {Node{child}}}}};

    const auto tree = Node{RootNode{{Node{ListNode{ListKind::unordered, {Node{parent}}}}}}};
    EXPECT_EQ(resolve(tree, {}), "<ul><li>Parent<ul><li>Child</li></ul></li></ul>");
    EXPECT_EQ(resolve(tree, {{"li-0", Decision::accept}}), "<ul><ul><li>Child</li></ul></ul>");
}

// -- Decision map handling ----------------------------------------------------

TEST(Resolve, unknown_ids_are_ignored) {
    const auto tree = diff("<p>Same</p>", "<p>Same</p>");
    EXPECT_EQ(resolve(tree, {{"block-99", Decision::accept}, {"li-7", Decision::reject}}),
              "<p>Same</p>");
}

TEST(Resolve, decisions_on_unchanged_nodes_have_no_effect) {
    const auto tree = diff("<p>Same</p>", "<p>Same</p>");
    EXPECT_EQ(resolve(tree, {{"block-0", Decision::accept}}), "<p>Same</p>");
    EXPECT_EQ(resolve(tree, {{"block-0", Decision::reject}}), "<p>Same</p>");
}

TEST(Resolve, empty_tree_resolves_to_nothing) {
    EXPECT_EQ(resolve(Node{}, {}), "");
}
