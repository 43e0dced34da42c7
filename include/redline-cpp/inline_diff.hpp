/// @file inline_diff.hpp
/// @brief Token-level diff of two text spans into InlineParts.

#pragma once

#include <redline-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redline_cpp {

/// The unit that inline_diff() compares.
enum class Granularity : std::uint8_t {
    word,       ///< Words, whitespace runs and punctuation (default).
    character,  ///< UTF-8 code points.
    line,       ///< Lines, each keeping its trailing newline.
};

/// Convert a Granularity to its string representation.
constexpr auto to_string_view(Granularity g) noexcept -> std::string_view {
    switch (g) {
        case Granularity::word:      return "word";
        case Granularity::character: return "character";
        case Granularity::line:      return "line";
    }
    return "word";
}

/// Parse a Granularity from its string representation.
constexpr auto parse_granularity(std::string_view s) noexcept -> std::optional<Granularity> {
    if (s == "word")      return Granularity::word;
    if (s == "character") return Granularity::character;
    if (s == "line")      return Granularity::line;
    return std::nullopt;
}

/// Options shared by inline_diff() and the tree differ.
struct DiffOptions {
    Granularity granularity{Granularity::word};  ///< Tokenization unit.
};

/// Split text into tokens at the given granularity.
///
/// The returned views point into `text`. Concatenating them reproduces
/// `text` exactly.
///
/// Word mode keeps every separator as its own token: runs of non-newline
/// whitespace, each of `( ) [ ] { } ' "` and `\r` / `\n`, runs of word
/// characters (ASCII alphanumerics, `_`, and extended Latin letters), and
/// runs of everything else.
auto tokenize(std::string_view text, Granularity granularity = Granularity::word)
    -> std::vector<std::string_view>;

/// Compute the minimal token-level edit script between `a` and `b`.
///
/// The common token prefix and suffix are matched first; the remainder is
/// aligned with the Myers O(ND) algorithm. Consecutive tokens of the same
/// kind are coalesced, and within a change hunk the removed run comes before
/// the added run. No empty parts are produced.
///
/// Guarantees: original_text(result) == a and modified_text(result) == b.
///
/// @code
/// auto parts = inline_diff("Hard hat (Class G)", "Hard hat (Class E or G)");
/// // {"Hard hat (Class "}, {"E or ", added}, {"G)"}
/// @endcode
auto inline_diff(std::string_view a, std::string_view b,
                 const DiffOptions& options = {}) -> std::vector<InlinePart>;

}  // namespace redline_cpp
