/// @file types.hpp
/// @brief Core value types: NodeId, Status, BlockTag, ListKind, InlinePart, Decision.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace redline_cpp {

/// Identifies a reviewable node (Block or ListItem) within one tree.
///
/// Ids are assigned positionally in document order, one counter per node
/// kind (`block-0`, `block-1`, `li-0`, ...). They are unique within a tree
/// but not stable across edits: inserting an item shifts every later id.
using NodeId = std::string;

// -- Status -------------------------------------------------------------------

/// Classification of a Block or ListItem after diffing.
enum class Status : std::uint8_t {
    unchanged,  ///< Same text on both sides.
    added,      ///< Present only in the modified document.
    removed,    ///< Present only in the original document.
    changed,    ///< Present on both sides with textual edits.
};

/// Convert a Status to its string representation.
constexpr auto to_string_view(Status status) noexcept -> std::string_view {
    switch (status) {
        case Status::unchanged: return "unchanged";
        case Status::added:     return "added";
        case Status::removed:   return "removed";
        case Status::changed:   return "changed";
    }
    return "unknown";
}

/// Parse a Status from its string representation.
constexpr auto parse_status(std::string_view s) noexcept -> std::optional<Status> {
    if (s == "unchanged") return Status::unchanged;
    if (s == "added")     return Status::added;
    if (s == "removed")   return Status::removed;
    if (s == "changed")   return Status::changed;
    return std::nullopt;
}

// -- BlockTag -----------------------------------------------------------------

/// The block-level elements that become diffable units.
enum class BlockTag : std::uint8_t {
    paragraph,
    heading1,
    heading2,
    heading3,
    heading4,
    heading5,
    heading6,
};

/// Convert a BlockTag to its HTML tag name ("p", "h1", ... "h6").
constexpr auto to_string_view(BlockTag tag) noexcept -> std::string_view {
    switch (tag) {
        case BlockTag::paragraph: return "p";
        case BlockTag::heading1:  return "h1";
        case BlockTag::heading2:  return "h2";
        case BlockTag::heading3:  return "h3";
        case BlockTag::heading4:  return "h4";
        case BlockTag::heading5:  return "h5";
        case BlockTag::heading6:  return "h6";
    }
    return "p";
}

/// Parse a lower-case HTML tag name into a BlockTag.
constexpr auto parse_block_tag(std::string_view name) noexcept -> std::optional<BlockTag> {
    if (name == "p")  return BlockTag::paragraph;
    if (name == "h1") return BlockTag::heading1;
    if (name == "h2") return BlockTag::heading2;
    if (name == "h3") return BlockTag::heading3;
    if (name == "h4") return BlockTag::heading4;
    if (name == "h5") return BlockTag::heading5;
    if (name == "h6") return BlockTag::heading6;
    return std::nullopt;
}

// -- ListKind -----------------------------------------------------------------

/// The two list flavours.
enum class ListKind : std::uint8_t {
    unordered,  ///< `<ul>`
    ordered,    ///< `<ol>`
};

/// Convert a ListKind to its HTML tag name.
constexpr auto to_string_view(ListKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ListKind::unordered: return "ul";
        case ListKind::ordered:   return "ol";
    }
    return "ul";
}

/// Parse a lower-case HTML tag name into a ListKind.
constexpr auto parse_list_kind(std::string_view name) noexcept -> std::optional<ListKind> {
    if (name == "ul") return ListKind::unordered;
    if (name == "ol") return ListKind::ordered;
    return std::nullopt;
}

// -- InlinePart ---------------------------------------------------------------

/// A run of markup-bearing text tagged by which side it belongs to.
///
/// At most one of `added` / `removed` is set. A part with neither flag is
/// common to both documents.
struct InlinePart {
    std::string text;      ///< The markup of this run.
    bool added{false};     ///< Only in the modified document.
    bool removed{false};   ///< Only in the original document.

    auto operator==(const InlinePart&) const -> bool = default;
};

/// Which side of an annotated text to reconstruct.
enum class Reading : std::uint8_t {
    original,  ///< Skip added parts.
    modified,  ///< Skip removed parts.
};

/// Concatenate the parts belonging to one reading.
auto join_parts(const std::vector<InlinePart>& parts,
                Reading reading = Reading::original) -> std::string;

/// Text of the original document (parts with `added` excluded).
inline auto original_text(const std::vector<InlinePart>& parts) -> std::string {
    return join_parts(parts, Reading::original);
}

/// Text of the modified document (parts with `removed` excluded).
inline auto modified_text(const std::vector<InlinePart>& parts) -> std::string {
    return join_parts(parts, Reading::modified);
}

/// True if any part is added or removed.
auto has_changes(const std::vector<InlinePart>& parts) -> bool;

// -- Decision -----------------------------------------------------------------

/// A reviewer's choice for one node.
enum class Decision : std::uint8_t {
    undecided,  ///< No choice yet; resolves like reject.
    accept,     ///< Keep the modified reading.
    reject,     ///< Keep the original reading.
};

/// Convert a Decision to its string representation.
constexpr auto to_string_view(Decision decision) noexcept -> std::string_view {
    switch (decision) {
        case Decision::undecided: return "undecided";
        case Decision::accept:    return "accept";
        case Decision::reject:    return "reject";
    }
    return "undecided";
}

/// Parse a Decision from its string representation.
constexpr auto parse_decision(std::string_view s) noexcept -> std::optional<Decision> {
    if (s == "undecided") return Decision::undecided;
    if (s == "accept")    return Decision::accept;
    if (s == "reject")    return Decision::reject;
    return std::nullopt;
}

/// Per-node reviewer decisions. Owned by the caller; the library only reads it.
using DecisionMap = std::unordered_map<NodeId, Decision>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const BlockNode& b) { ... },
///     [](const auto&) { ... },
/// }, node.inner);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace redline_cpp
