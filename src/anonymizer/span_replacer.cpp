#include "anonymizer/span_replacer.hpp"

#include <algorithm>
#include <format>
#include <numeric>

namespace piishield {

namespace {

std::vector<size_t> start_order(const std::vector<TextRange>& ranges) {
    std::vector<size_t> order(ranges.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
        [&ranges](size_t a, size_t b) { return ranges[a].start < ranges[b].start; });
    return order;
}

Status check_ordered(size_t text_size, const std::vector<TextRange>& ranges,
                     const std::vector<size_t>& order) {
    for (const auto& r : ranges) {
        if (r.start >= r.end) {
            return Status::error(ErrorCategory::INVALID_RANGE,
                std::format("Invalid span range: {}..{}", r.start, r.end));
        }
        if (r.end > text_size) {
            return Status::error(ErrorCategory::INVALID_RANGE,
                std::format("Span end ({}) exceeds text length ({})", r.end, text_size));
        }
    }

    for (size_t i = 1; i < order.size(); ++i) {
        const auto& prev = ranges[order[i - 1]];
        const auto& cur = ranges[order[i]];
        if (cur.start < prev.end) {
            return Status::error(ErrorCategory::INVALID_RANGE,
                std::format("Overlapping spans: {}..{} and {}..{}",
                            prev.start, prev.end, cur.start, cur.end));
        }
    }
    return Status::ok();
}

} // anonymous namespace

Status check_ranges(size_t text_size, const std::vector<TextRange>& ranges) {
    return check_ordered(text_size, ranges, start_order(ranges));
}

Result<std::string> replace_ranges(std::string_view text,
                                   const std::vector<TextRange>& ranges,
                                   const std::vector<std::string>& replacements) {
    if (ranges.size() != replacements.size()) {
        return Result<std::string>::error(ErrorCategory::INVALID_RANGE,
            std::format("Span count ({}) must match replacement count ({})",
                        ranges.size(), replacements.size()));
    }

    // Process in start order without reordering the caller's pairs
    const auto order = start_order(ranges);
    const auto valid = check_ordered(text.size(), ranges, order);
    if (!valid.is_ok()) {
        return Result<std::string>::propagate(valid);
    }

    std::string result(text);
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const auto& r = ranges[*it];
        result.replace(r.start, r.end - r.start, replacements[*it]);
    }

    return Result<std::string>::ok(std::move(result));
}

} // namespace piishield
