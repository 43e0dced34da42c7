// basic_usage — demonstrates the core redline-cpp pipeline
//
// Parses two versions of a document, diffs them into an annotated tree,
// prints every node with its inline changes, then merges the result under
// a few different sets of reviewer decisions.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <redline-cpp/redline.hpp>

#include "samples.hpp"

#include <cstdio>
#include <string>

namespace rl = redline_cpp;

// Render inline parts as [-removed-]{+added+} markers.
static auto render_parts(const std::vector<rl::InlinePart>& parts) -> std::string {
    auto out = std::string{};
    for (const auto& p : parts) {
        if (p.removed) {
            out += "[-" + p.text + "-]";
        } else if (p.added) {
            out += "{+" + p.text + "+}";
        } else {
            out += p.text;
        }
    }
    return out;
}

static void print_tree(const rl::Node& node, int depth) {
    const auto indent = std::string(static_cast<std::size_t>(depth) * 2, ' ');
    std::visit(rl::overload{
        [&](const rl::RootNode& root) {
            for (const auto& child : root.children) print_tree(child, depth);
        },
        [&](const rl::ListNode& list) {
            std::printf("%s<%.*s>\n", indent.c_str(),
                        static_cast<int>(rl::to_string_view(list.kind).size()),
                        rl::to_string_view(list.kind).data());
            for (const auto& child : list.children) print_tree(child, depth + 1);
        },
        [&](const rl::ListItemNode& item) {
            const auto status = rl::to_string_view(item.status);
            std::printf("%s%-6s %-9.*s %s\n", indent.c_str(), item.id.c_str(),
                        static_cast<int>(status.size()), status.data(),
                        render_parts(item.content).c_str());
            for (const auto& child : item.children) print_tree(child, depth + 1);
        },
        [&](const rl::BlockNode& block) {
            const auto status = rl::to_string_view(block.status);
            std::printf("%s%-6s %-9.*s %s\n", indent.c_str(), block.id.c_str(),
                        static_cast<int>(status.size()), status.data(),
                        render_parts(block.content).c_str());
        },
    }, node.inner);
}

int main() {
    // -- Inline word diff -----------------------------------------------------
    auto parts = rl::inline_diff("Hard hat (Class G)", "Hard hat (Class E or G)");
    std::printf("Inline diff: %s\n\n", render_parts(parts).c_str());

    // -- Tree diff ------------------------------------------------------------
    const auto& sample = rl::samples::safety_equipment;
    auto tree = rl::diff_html(sample.original, sample.modified);
    if (!tree) {
        std::fprintf(stderr, "Nothing to diff\n");
        return 1;
    }
    std::printf("Annotated tree:\n");
    print_tree(*tree, 1);

    const auto summary = rl::summarize(*tree);
    std::printf("\n%zu unchanged, %zu changed, %zu added, %zu removed\n\n",
                summary.unchanged, summary.changed, summary.added, summary.removed);

    // -- Merge under different decisions --------------------------------------
    std::printf("Nothing decided:\n  %s\n",
                rl::resolve(*tree, {}).c_str());
    std::printf("Accept everything:\n  %s\n",
                rl::resolve(*tree, rl::uniform_decisions(*tree, rl::Decision::accept)).c_str());
    std::printf("Accept li-0, reject li-2:\n  %s\n",
                rl::resolve(*tree, {{"li-0", rl::Decision::accept},
                                    {"li-2", rl::Decision::reject}}).c_str());

    // -- Shape mismatch -------------------------------------------------------
    const auto& hybrid = rl::samples::paragraph_to_list;
    if (auto fallback = rl::diff_html(hybrid.original, hybrid.modified)) {
        std::printf("\nParagraph vs list:\n");
        print_tree(*fallback, 1);
    }

    std::printf("Done.\n");
    return 0;
}
