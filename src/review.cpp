#include <redline-cpp/review.hpp>

#include <functional>
#include <utility>

namespace redline_cpp {

namespace {

// Visit every Block/ListItem in document order as (id, status).
void for_each_reviewable(const Node& node,
                         const std::function<void(const NodeId&, Status)>& fn) {
    if (auto id = node.id()) {
        fn(*id, node.status().value_or(Status::unchanged));
    }
    for (const auto& child : node.children()) {
        for_each_reviewable(child, fn);
    }
}

}  // anonymous namespace

auto summarize(const Node& tree) -> ReviewSummary {
    auto summary = ReviewSummary{};
    for_each_reviewable(tree, [&](const NodeId&, Status status) {
        switch (status) {
            case Status::unchanged: ++summary.unchanged; break;
            case Status::added:     ++summary.added; break;
            case Status::removed:   ++summary.removed; break;
            case Status::changed:   ++summary.changed; break;
        }
    });
    return summary;
}

auto reviewable_ids(const Node& tree) -> std::vector<NodeId> {
    auto ids = std::vector<NodeId>{};
    for_each_reviewable(tree, [&](const NodeId& id, Status status) {
        if (status != Status::unchanged) ids.push_back(id);
    });
    return ids;
}

auto uniform_decisions(const Node& tree, Decision decision) -> DecisionMap {
    auto decisions = DecisionMap{};
    for (auto& id : reviewable_ids(tree)) {
        decisions.emplace(std::move(id), decision);
    }
    return decisions;
}

auto toggle_decision(const DecisionMap& decisions, const NodeId& id,
                     Decision decision) -> DecisionMap {
    auto next = decisions;
    const auto it = next.find(id);
    const auto current = (it == next.end()) ? Decision::undecided : it->second;
    if (current == decision || decision == Decision::undecided) {
        next.erase(id);
    } else {
        next[id] = decision;
    }
    return next;
}

}  // namespace redline_cpp
