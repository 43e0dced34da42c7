/// @file json.hpp
/// @brief nlohmann/json interoperability for redline-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the enums, InlinePart
/// and Node, plus tree and decision-map export/import. This is the shape a
/// presentation layer consumes.

#pragma once

#include <redline-cpp/inline_diff.hpp>
#include <redline-cpp/node.hpp>
#include <redline-cpp/review.hpp>
#include <redline-cpp/types.hpp>

#include <nlohmann/json.hpp>

namespace redline_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Enums (string names) -----------------------------------------------------

void to_json(nlohmann::json& j, Status status);
void from_json(const nlohmann::json& j, Status& status);

void to_json(nlohmann::json& j, BlockTag tag);
void from_json(const nlohmann::json& j, BlockTag& tag);

void to_json(nlohmann::json& j, ListKind kind);
void from_json(const nlohmann::json& j, ListKind& kind);

void to_json(nlohmann::json& j, Decision decision);
void from_json(const nlohmann::json& j, Decision& decision);

void to_json(nlohmann::json& j, Granularity granularity);
void from_json(const nlohmann::json& j, Granularity& granularity);

// -- Compound types -----------------------------------------------------------

void to_json(nlohmann::json& j, const InlinePart& part);
void from_json(const nlohmann::json& j, InlinePart& part);

/// Nodes serialize as objects tagged by "type": "root", "ul", "ol", "li"
/// or "block".
void to_json(nlohmann::json& j, const Node& node);
void from_json(const nlohmann::json& j, Node& node);

void to_json(nlohmann::json& j, const ReviewSummary& summary);
void to_json(nlohmann::json& j, const DiffOptions& options);
void from_json(const nlohmann::json& j, DiffOptions& options);

// =============================================================================
// Tree and decision export / import
// =============================================================================

/// Export an annotated tree as JSON.
auto export_json(const Node& tree) -> nlohmann::json;

/// Import a tree previously produced by export_json().
/// @throws std::runtime_error on an unknown node type or malformed field.
auto import_json(const nlohmann::json& j) -> Node;

/// Export a decision map as an object of id -> decision name.
auto export_decisions(const DecisionMap& decisions) -> nlohmann::json;

/// Import a decision map from an object of id -> decision name.
///
/// A null value means undecided and is skipped, as are explicit
/// "undecided" entries.
/// @throws std::runtime_error if `j` is not an object or a value is not a
///   known decision name.
auto import_decisions(const nlohmann::json& j) -> DecisionMap;

}  // namespace redline_cpp
