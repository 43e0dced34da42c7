/// @file resolve.hpp
/// @brief Rebuild markup from an annotated tree and reviewer decisions.

#pragma once

#include <redline-cpp/node.hpp>
#include <redline-cpp/types.hpp>

#include <string>

namespace redline_cpp {

/// Produce the merged markup for an annotated tree.
///
/// Each Block/ListItem is looked up in `decisions` (missing ids count as
/// Decision::undecided). Accepted nodes emit their modified reading;
/// rejected and undecided nodes emit their original reading, so nothing
/// the reviewer has not approved is applied.
///
/// Blocks are wrapped in their tag, items in `<li>`, lists in `<ul>`/`<ol>`.
/// A node whose chosen reading does not exist (an accepted removal, an
/// unaccepted addition) emits nothing; an item's nested children are still
/// resolved on their own decisions. Lists with no remaining output are
/// dropped.
///
/// `decisions` is only read.
auto resolve(const Node& tree, const DecisionMap& decisions) -> std::string;

}  // namespace redline_cpp
