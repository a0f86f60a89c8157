#pragma once

#include "core/error.hpp"

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace piishield {

struct TextRange {
    size_t start;
    size_t end;
};

/**
 * @brief INVALID_RANGE if a range is empty, runs past text_size, or overlaps another
 * Ranges may arrive in any order.
 */
[[nodiscard]] Status check_ranges(size_t text_size, const std::vector<TextRange>& ranges);

/**
 * @brief Substitute replacements[i] for ranges[i], right to left
 *
 * INVALID_RANGE if the counts differ or check_ranges rejects the ranges.
 */
[[nodiscard]] Result<std::string> replace_ranges(std::string_view text,
                                                 const std::vector<TextRange>& ranges,
                                                 const std::vector<std::string>& replacements);

template<typename S>
concept TextSpan = requires(const S& s) {
    { s.start } -> std::convertible_to<size_t>;
    { s.end } -> std::convertible_to<size_t>;
};

template<TextSpan S>
[[nodiscard]] std::vector<TextRange> to_ranges(const std::vector<S>& spans) {
    std::vector<TextRange> ranges;
    ranges.reserve(spans.size());
    for (const auto& s : spans) {
        ranges.push_back({static_cast<size_t>(s.start), static_cast<size_t>(s.end)});
    }
    return ranges;
}

/// check_ranges over anything with start/end offsets (EntityMatch, Placeholder)
template<TextSpan S>
[[nodiscard]] Status check_spans(std::string_view text, const std::vector<S>& spans) {
    return check_ranges(text.size(), to_ranges(spans));
}

/// replace_ranges over anything with start/end offsets
template<TextSpan S>
[[nodiscard]] Result<std::string> replace_spans(std::string_view text,
                                                const std::vector<S>& spans,
                                                const std::vector<std::string>& replacements) {
    return replace_ranges(text, to_ranges(spans), replacements);
}

} // namespace piishield
