#include "placeholder/placeholder_scanner.hpp"
#include "core/utils.hpp"

#include <regex>
#include <string>

namespace piishield {

namespace {

const std::regex& surface_regex(PlaceholderFormat format) {
    // Group 1 = prefix, group 2 = body. The prefix class backtracks so
    // multi-word prefixes like AWS_KEY and DATE_OF_BIRTH resolve correctly.
    // Repeats are bounded: longest prefix is 14 chars, a uint64 counter 20 digits.
    static const std::regex numbered(R"(\[([A-Z_]{1,32})_(\d{1,20})\])");
    static const std::regex uuid(
        R"(\[([A-Z_]{1,32})_([0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12})\])");
    static const std::regex hashed(R"(\[([A-Z_]{1,32})_([0-9a-f]{16})\])");

    switch (format) {
        case PlaceholderFormat::NUMBERED: return numbered;
        case PlaceholderFormat::UUID:     return uuid;
        case PlaceholderFormat::HASHED:   return hashed;
    }
    return numbered;
}

} // anonymous namespace

std::vector<Placeholder> find_placeholders(std::string_view text, PlaceholderFormat format) {
    std::vector<Placeholder> found;
    if (text.empty()) return found;

    const auto& re = surface_regex(format);
    using Iter = std::regex_iterator<std::string_view::const_iterator>;
    for (Iter it(text.begin(), text.end(), re), end; it != end; ++it) {
        const auto& m = *it;
        const auto kind = entity_kind_from_prefix(
            std::string_view(&*m[1].first, static_cast<size_t>(m[1].length())));
        if (!kind) continue;

        const auto start = static_cast<size_t>(m[0].first - text.begin());
        const auto len = static_cast<size_t>(m[0].length());
        found.emplace_back(std::string(text.substr(start, len)), start, start + len, *kind);
    }
    return found;
}

std::optional<std::pair<EntityKind, uint64_t>> parse_numbered_counter(
    std::string_view placeholder) {

    if (placeholder.size() < 4 || placeholder.front() != '[' || placeholder.back() != ']') {
        return std::nullopt;
    }
    const std::string_view inner = placeholder.substr(1, placeholder.size() - 2);
    const size_t sep = inner.rfind('_');
    if (sep == std::string_view::npos || sep == 0 || sep + 1 >= inner.size()) {
        return std::nullopt;
    }

    const auto kind = entity_kind_from_prefix(inner.substr(0, sep));
    if (!kind) return std::nullopt;

    const auto n = utils::try_parse_int<uint64_t>(inner.substr(sep + 1));
    if (!n) return std::nullopt;

    return std::make_pair(*kind, *n);
}

} // namespace piishield
