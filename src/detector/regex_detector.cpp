#include "detector/regex_detector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <regex>

namespace piishield {

RegexDetector::RegexDetector(const Config& config)
    : RegexDetector(config, PatternLibrary::build_default()) {}

RegexDetector::RegexDetector(const Config& config, PatternLibrary library)
    : config_(config), library_(std::move(library)) {}

bool RegexDetector::kind_enabled(EntityKind kind) const {
    return config_.enabled_kinds.empty() || config_.enabled_kinds.contains(kind);
}

Result<std::vector<EntityMatch>> RegexDetector::detect(std::string_view text) const {
    total_scans_.fetch_add(1, std::memory_order_relaxed);

    if (text.empty()) {
        return Result<std::vector<EntityMatch>>::ok({});
    }

    if (text.size() > config_.max_input_bytes) {
        return Result<std::vector<EntityMatch>>::error(ErrorCategory::DETECTOR_ERROR,
            std::format("Input of {} bytes exceeds detector limit of {} bytes",
                        text.size(), config_.max_input_bytes));
    }

    std::vector<EntityMatch> candidates;
    uint64_t rejected = 0;

    for (const auto& entry : library_.entries()) {
        if (!kind_enabled(entry.kind)) continue;
        if (entry.confidence < config_.min_confidence) continue;

        try {
            using Iter = std::regex_iterator<std::string_view::const_iterator>;
            for (Iter it(text.begin(), text.end(), entry.pattern), end; it != end; ++it) {
                const auto& m = *it;
                if (entry.capture_group >= m.size() || !m[entry.capture_group].matched) {
                    continue;
                }
                const auto& sub = m[entry.capture_group];
                const auto start = static_cast<size_t>(sub.first - text.begin());
                const auto stop = static_cast<size_t>(sub.second - text.begin());
                if (start >= stop) continue;

                const std::string_view span = text.substr(start, stop - start);
                if (entry.validator && !entry.validator(span)) {
                    ++rejected;
                    continue;
                }

                candidates.emplace_back(entry.kind, start, stop, std::string(span),
                                        entry.confidence);
            }
        } catch (const std::regex_error& e) {
            utils::log::error(std::format("Detector rule '{}' failed: {}", entry.name, e.what()));
            return Result<std::vector<EntityMatch>>::error(ErrorCategory::DETECTOR_ERROR,
                std::format("Pattern engine failure in rule '{}': {}", entry.name, e.what()));
        }
    }

    if (rejected > 0) {
        total_rejected_.fetch_add(rejected, std::memory_order_relaxed);
    }

    return Result<std::vector<EntityMatch>>::ok(resolve_overlaps(std::move(candidates)));
}

std::vector<EntityMatch> RegexDetector::resolve_overlaps(std::vector<EntityMatch> matches) {
    if (matches.size() < 2) {
        return matches;
    }

    std::stable_sort(matches.begin(), matches.end(),
        [](const EntityMatch& a, const EntityMatch& b) { return a.start < b.start; });

    std::vector<EntityMatch> resolved;
    resolved.reserve(matches.size());

    size_t i = 0;
    while (i < matches.size()) {
        size_t best = i;
        size_t j = i + 1;
        while (j < matches.size() && matches[j].start < matches[best].end) {
            if (matches[j].confidence > matches[best].confidence) {
                best = j;
            }
            ++j;
        }
        resolved.push_back(std::move(matches[best]));
        i = j;
    }

    return resolved;
}

} // namespace piishield
