// review_session — a reviewer working through every sample document
//
// Demonstrates:
//   - Diffing each sample pair and exporting the tree as JSON
//   - Toggling accept/reject decisions the way a review UI would
//   - Saving decisions as JSON and loading them back
//   - Merging with the loaded decisions
//
// Build: cmake --build build -DREDLINE_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/review_session [sample-name]

#include <redline-cpp/json.hpp>
#include <redline-cpp/redline.hpp>

#include "samples.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

namespace rl = redline_cpp;
using json = nlohmann::json;

// Accept changes and additions, reject removals.
static auto review(const rl::Node& tree) -> rl::DecisionMap {
    auto decisions = rl::DecisionMap{};
    for (const auto& id : rl::reviewable_ids(tree)) {
        decisions = rl::toggle_decision(decisions, id, rl::Decision::accept);
    }
    const auto removed = [&](const rl::Node& node, const auto& self) -> void {
        if (node.status() == rl::Status::removed) {
            decisions = rl::toggle_decision(decisions, *node.id(), rl::Decision::reject);
        }
        for (const auto& child : node.children()) self(child, self);
    };
    removed(tree, removed);
    return decisions;
}

static auto run(const rl::samples::Sample& sample) -> bool {
    std::printf("== %.*s ==\n", static_cast<int>(sample.label.size()), sample.label.data());

    auto tree = rl::diff_html(sample.original, sample.modified);
    if (!tree) {
        std::fprintf(stderr, "  nothing to diff\n");
        return false;
    }

    std::printf("  summary:   %s\n", json(rl::summarize(*tree)).dump().c_str());
    std::printf("  tree:      %zu bytes of JSON\n", rl::export_json(*tree).dump().size());

    // -- Save and reload decisions --------------------------------------------
    const auto saved = rl::export_decisions(review(*tree)).dump();
    std::printf("  decisions: %s\n", saved.c_str());

    try {
        const auto loaded = rl::import_decisions(json::parse(saved));
        std::printf("  merged:    %s\n\n", rl::resolve(*tree, loaded).c_str());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "  failed to load decisions: %s\n", e.what());
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    auto ok = true;
    auto matched = false;
    for (const auto& sample : rl::samples::all) {
        if (argc > 1 && sample.name != argv[1]) continue;
        matched = true;
        ok = run(sample) && ok;
    }
    if (!matched) {
        std::fprintf(stderr, "Unknown sample: %s\n", argv[1]);
        return 1;
    }
    return ok ? 0 : 1;
}
