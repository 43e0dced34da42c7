#include <redline-cpp/inline_diff.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace redline_cpp {

namespace {

// =============================================================================
// Tokenization
// =============================================================================

enum class CharClass : std::uint8_t { space, special, word, other };

struct CodePoint {
    std::uint32_t value;
    std::size_t length;
};

// Decode one UTF-8 sequence. Malformed input decodes byte by byte.
auto decode_utf8(std::string_view text, std::size_t pos) -> CodePoint {
    const auto lead = static_cast<unsigned char>(text[pos]);
    auto length = std::size_t{1};
    auto value = std::uint32_t{lead};
    if (lead >= 0xF0 && lead < 0xF8) {
        length = 4;
        value = lead & 0x07u;
    } else if (lead >= 0xE0) {
        length = 3;
        value = lead & 0x0Fu;
    } else if (lead >= 0xC0) {
        length = 2;
        value = lead & 0x1Fu;
    } else {
        return {value, 1};
    }
    if (lead >= 0xF8 || pos + length > text.size()) return {lead, 1};
    for (std::size_t i = 1; i < length; ++i) {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0u) != 0x80u) return {lead, 1};
        value = (value << 6) | (cont & 0x3Fu);
    }
    return {value, length};
}

// Latin letters with diacritics that should not split a word.
constexpr auto is_extended_letter(std::uint32_t cp) -> bool {
    if (cp == 0xD7 || cp == 0xF7) return false;
    return (cp >= 0xC0 && cp <= 0x2C6) || (cp >= 0x2C8 && cp <= 0x2D7) ||
           (cp >= 0x2DE && cp <= 0x2FF) || (cp >= 0x1E00 && cp <= 0x1EFF);
}

auto classify(std::string_view text, std::size_t pos) -> std::pair<CharClass, std::size_t> {
    const auto c = static_cast<unsigned char>(text[pos]);
    if (c >= 0x80) {
        const auto cp = decode_utf8(text, pos);
        return {is_extended_letter(cp.value) ? CharClass::word : CharClass::other, cp.length};
    }
    switch (c) {
        case '(': case ')': case '[': case ']': case '{': case '}':
        case '\'': case '"': case '\r': case '\n':
            return {CharClass::special, 1};
        case ' ': case '\t': case '\f': case '\v':
            return {CharClass::space, 1};
        default:
            break;
    }
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
        (c >= '0' && c <= '9') || c == '_') {
        return {CharClass::word, 1};
    }
    return {CharClass::other, 1};
}

auto tokenize_words(std::string_view text) -> std::vector<std::string_view> {
    auto tokens = std::vector<std::string_view>{};
    auto pos = std::size_t{0};
    while (pos < text.size()) {
        const auto [cls, len] = classify(text, pos);
        auto end = pos + len;
        if (cls != CharClass::special) {
            while (end < text.size()) {
                const auto [next_cls, next_len] = classify(text, end);
                if (next_cls != cls) break;
                end += next_len;
            }
        }
        tokens.push_back(text.substr(pos, end - pos));
        pos = end;
    }
    return tokens;
}

auto tokenize_characters(std::string_view text) -> std::vector<std::string_view> {
    auto tokens = std::vector<std::string_view>{};
    tokens.reserve(text.size());
    auto pos = std::size_t{0};
    while (pos < text.size()) {
        const auto len = static_cast<unsigned char>(text[pos]) >= 0x80
            ? decode_utf8(text, pos).length
            : std::size_t{1};
        tokens.push_back(text.substr(pos, len));
        pos += len;
    }
    return tokens;
}

auto tokenize_lines(std::string_view text) -> std::vector<std::string_view> {
    auto tokens = std::vector<std::string_view>{};
    auto pos = std::size_t{0};
    while (pos < text.size()) {
        const auto nl = text.find('\n', pos);
        const auto end = (nl == std::string_view::npos) ? text.size() : nl + 1;
        tokens.push_back(text.substr(pos, end - pos));
        pos = end;
    }
    return tokens;
}

// =============================================================================
// Myers O(ND) alignment
// =============================================================================

enum class EditOp : char { keep = '=', remove = '-', insert = '+' };

using Tokens = std::span<const std::string_view>;

// Shortest edit script turning `a` into `b`, in linear space.
//
// Common leading and trailing runs are kept directly. What remains is split
// where a forward and a reverse furthest-reaching path first overlap, and
// both halves are solved the same way.
class MyersDiff {
public:
    MyersDiff(Tokens a, Tokens b) : a_{a}, b_{b} {}

    auto run() -> std::vector<EditOp> {
        ops_.reserve(a_.size() + b_.size());
        solve(0, static_cast<Index>(a_.size()), 0, static_cast<Index>(b_.size()));
        return std::move(ops_);
    }

private:
    using Index = std::ptrdiff_t;

    auto same(Index i, Index j) const -> bool {
        return a_[static_cast<std::size_t>(i)] == b_[static_cast<std::size_t>(j)];
    }

    void emit(EditOp op, Index count) {
        ops_.insert(ops_.end(), static_cast<std::size_t>(count), op);
    }

    void solve(Index a_lo, Index a_hi, Index b_lo, Index b_hi) {
        auto head = Index{0};
        while (a_lo < a_hi && b_lo < b_hi && same(a_lo, b_lo)) {
            ++a_lo;
            ++b_lo;
            ++head;
        }
        auto tail = Index{0};
        while (a_lo < a_hi && b_lo < b_hi && same(a_hi - 1, b_hi - 1)) {
            --a_hi;
            --b_hi;
            ++tail;
        }
        emit(EditOp::keep, head);

        if (a_lo == a_hi || b_lo == b_hi) {
            emit(EditOp::remove, a_hi - a_lo);
            emit(EditOp::insert, b_hi - b_lo);
        } else if (const auto split = split_point(a_lo, a_hi, b_lo, b_hi);
                   split && *split != std::pair{a_lo, b_lo} && *split != std::pair{a_hi, b_hi}) {
            solve(a_lo, split->first, b_lo, split->second);
            solve(split->first, a_hi, split->second, b_hi);
        } else {
            // Nothing in common to split on.
            emit(EditOp::remove, a_hi - a_lo);
            emit(EditOp::insert, b_hi - b_lo);
        }

        emit(EditOp::keep, tail);
    }

    // Point on a shortest path through the box, or nullopt if the two ranges
    // share nothing. `forward_` and `reverse_` hold the furthest x reached
    // on each diagonal, -1 where a diagonal has not been reached yet.
    auto split_point(Index a_lo, Index a_hi, Index b_lo, Index b_hi)
        -> std::optional<std::pair<Index, Index>> {
        const auto n = a_hi - a_lo;
        const auto m = b_hi - b_lo;
        const auto max_d = (n + m + 1) / 2;
        const auto offset = max_d;
        const auto length = 2 * max_d + 2;
        forward_.assign(static_cast<std::size_t>(length), -1);
        reverse_.assign(static_cast<std::size_t>(length), -1);

        const auto in_range = [&](Index k) { return offset + k >= 0 && offset + k < length; };
        const auto fwd = [&](Index k) -> Index& { return forward_[static_cast<std::size_t>(offset + k)]; };
        const auto rev = [&](Index k) -> Index& { return reverse_[static_cast<std::size_t>(offset + k)]; };

        fwd(1) = 0;
        rev(1) = 0;
        const auto delta = n - m;
        // With an odd delta the forward walk detects the overlap.
        const bool front = (delta % 2) != 0;

        // Diagonals that ran off the grid are skipped on later steps.
        auto f_start = Index{0};
        auto f_end = Index{0};
        auto r_start = Index{0};
        auto r_end = Index{0};

        for (Index d = 0; d < max_d; ++d) {
            for (auto k = -d + f_start; k <= d - f_end; k += 2) {
                auto x = (k == -d || (k != d && fwd(k - 1) < fwd(k + 1))) ? fwd(k + 1) : fwd(k - 1) + 1;
                auto y = x - k;
                while (x >= 0 && y >= 0 && x < n && y < m && same(a_lo + x, b_lo + y)) {
                    ++x;
                    ++y;
                }
                fwd(k) = x;
                if (x > n) {
                    f_end += 2;
                } else if (y > m) {
                    f_start += 2;
                } else if (front && in_range(delta - k) && rev(delta - k) != -1) {
                    if (x >= 0 && y >= 0 && x >= n - rev(delta - k)) {
                        return std::pair{a_lo + x, b_lo + y};
                    }
                }
            }

            for (auto k = -d + r_start; k <= d - r_end; k += 2) {
                auto x = (k == -d || (k != d && rev(k - 1) < rev(k + 1))) ? rev(k + 1) : rev(k - 1) + 1;
                auto y = x - k;
                while (x >= 0 && y >= 0 && x < n && y < m && same(a_hi - 1 - x, b_hi - 1 - y)) {
                    ++x;
                    ++y;
                }
                rev(k) = x;
                if (x > n) {
                    r_end += 2;
                } else if (y > m) {
                    r_start += 2;
                } else if (!front && in_range(delta - k) && fwd(delta - k) != -1) {
                    const auto fx = fwd(delta - k);
                    const auto fy = fx - (delta - k);
                    if (fx >= n - x && fx <= n && fy >= 0 && fy <= m) {
                        return std::pair{a_lo + fx, b_lo + fy};
                    }
                }
            }
        }
        return std::nullopt;
    }

    Tokens a_;
    Tokens b_;
    std::vector<EditOp> ops_;
    std::vector<Index> forward_;
    std::vector<Index> reverse_;
};

// =============================================================================
// Part assembly
// =============================================================================

class PartBuilder {
public:
    void equal(std::string_view text) { append(text, false, false); }

    void removed(std::string_view text) { pending_removed_ += text; }

    void added(std::string_view text) { pending_added_ += text; }

    // Emit the current change hunk: removed run first, then added run.
    void flush() {
        append(pending_removed_, false, true);
        append(pending_added_, true, false);
        pending_removed_.clear();
        pending_added_.clear();
    }

    auto finish() -> std::vector<InlinePart> {
        flush();
        return std::move(parts_);
    }

private:
    void append(std::string_view text, bool added, bool removed) {
        if (text.empty()) return;
        if (!parts_.empty() && parts_.back().added == added && parts_.back().removed == removed) {
            parts_.back().text += text;
            return;
        }
        parts_.push_back(InlinePart{std::string{text}, added, removed});
    }

    std::vector<InlinePart> parts_;
    std::string pending_removed_;
    std::string pending_added_;
};

}  // anonymous namespace

auto tokenize(std::string_view text, Granularity granularity) -> std::vector<std::string_view> {
    switch (granularity) {
        case Granularity::word:      return tokenize_words(text);
        case Granularity::character: return tokenize_characters(text);
        case Granularity::line:      return tokenize_lines(text);
    }
    return tokenize_words(text);
}

auto inline_diff(std::string_view a, std::string_view b,
                 const DiffOptions& options) -> std::vector<InlinePart> {
    const auto tokens_a = tokenize(a, options.granularity);
    const auto tokens_b = tokenize(b, options.granularity);

    auto prefix = std::size_t{0};
    while (prefix < tokens_a.size() && prefix < tokens_b.size() &&
           tokens_a[prefix] == tokens_b[prefix]) {
        ++prefix;
    }
    auto suffix = std::size_t{0};
    while (suffix < tokens_a.size() - prefix && suffix < tokens_b.size() - prefix &&
           tokens_a[tokens_a.size() - 1 - suffix] == tokens_b[tokens_b.size() - 1 - suffix]) {
        ++suffix;
    }

    const auto middle_a = Tokens{tokens_a}.subspan(prefix, tokens_a.size() - prefix - suffix);
    const auto middle_b = Tokens{tokens_b}.subspan(prefix, tokens_b.size() - prefix - suffix);

    auto builder = PartBuilder{};
    for (std::size_t i = 0; i < prefix; ++i) builder.equal(tokens_a[i]);

    auto ia = std::size_t{0};
    auto ib = std::size_t{0};
    for (const auto op : MyersDiff{middle_a, middle_b}.run()) {
        switch (op) {
            case EditOp::keep:
                builder.flush();
                builder.equal(middle_a[ia++]);
                ++ib;
                break;
            case EditOp::remove:
                builder.removed(middle_a[ia++]);
                break;
            case EditOp::insert:
                builder.added(middle_b[ib++]);
                break;
        }
    }
    builder.flush();

    for (auto i = tokens_a.size() - suffix; i < tokens_a.size(); ++i) builder.equal(tokens_a[i]);
    return builder.finish();
}

}  // namespace redline_cpp
