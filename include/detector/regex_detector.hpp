#pragma once

#include "detector/ientity_detector.hpp"
#include "detector/pattern_library.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace piishield {

/**
 * @brief Multi-pattern regex detector with validation and overlap resolution
 *
 * 1. Run every library rule whose kind is enabled
 * 2. Drop candidates rejected by the rule's validator
 * 3. Drop candidates below min_confidence
 * 4. Resolve overlaps (highest confidence wins within a cluster)
 */
class RegexDetector final : public IEntityDetector {
public:
    struct Config {
        EntityKindSet enabled_kinds;            // Empty = every kind in the library
        size_t max_input_bytes = 1024 * 1024;
        double min_confidence = 0.0;
    };

    RegexDetector() : RegexDetector(Config{}) {}
    explicit RegexDetector(const Config& config);
    RegexDetector(const Config& config, PatternLibrary library);

    [[nodiscard]] Result<std::vector<EntityMatch>> detect(std::string_view text) const override;

    [[nodiscard]] std::string name() const override { return "regex"; }

    /**
     * @brief Reduce candidates to a non-overlapping set
     *
     * Stable-sorts by start, then sweeps: every candidate starting before the
     * current best's end joins its cluster; a strictly higher confidence
     * replaces the best (ties keep the first). One span per cluster survives.
     */
    [[nodiscard]] static std::vector<EntityMatch> resolve_overlaps(std::vector<EntityMatch> matches);

    [[nodiscard]] const PatternLibrary& library() const { return library_; }
    [[nodiscard]] const Config& config() const { return config_; }

    [[nodiscard]] uint64_t total_scans() const {
        return total_scans_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t total_rejected_by_validator() const {
        return total_rejected_.load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] bool kind_enabled(EntityKind kind) const;

    Config config_;
    PatternLibrary library_;

    mutable std::atomic<uint64_t> total_scans_{0};
    mutable std::atomic<uint64_t> total_rejected_{0};
};

} // namespace piishield
