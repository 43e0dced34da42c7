/// @file review.hpp
/// @brief Helpers for building decision maps and summarizing a review.

#pragma once

#include <redline-cpp/node.hpp>
#include <redline-cpp/types.hpp>

#include <cstddef>
#include <vector>

namespace redline_cpp {

/// Status counts over every Block and ListItem of a tree.
struct ReviewSummary {
    std::size_t unchanged{0};
    std::size_t added{0};
    std::size_t removed{0};
    std::size_t changed{0};

    /// Nodes that need a reviewer decision.
    auto pending() const -> std::size_t { return added + removed + changed; }

    auto operator==(const ReviewSummary&) const -> bool = default;
};

/// Count node statuses in an annotated tree.
auto summarize(const Node& tree) -> ReviewSummary;

/// Ids of every Block/ListItem whose status is not unchanged, in document order.
auto reviewable_ids(const Node& tree) -> std::vector<NodeId>;

/// A decision map assigning `decision` to every reviewable node.
///
/// @code
/// auto merged = resolve(tree, uniform_decisions(tree, Decision::accept));
/// @endcode
auto uniform_decisions(const Node& tree, Decision decision) -> DecisionMap;

/// Return a copy of `decisions` with `id` set to `decision`, or reset to
/// undecided (erased) if `decision` is already the active one.
///
/// Mirrors an accept/reject button pair where pressing the active button
/// clears it. The input map is not modified.
auto toggle_decision(const DecisionMap& decisions, const NodeId& id,
                     Decision decision) -> DecisionMap;

}  // namespace redline_cpp
