#pragma once

#include "core/types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace piishield {

/**
 * @brief One detection rule: a precompiled regex plus its base confidence
 * and an optional algorithmic validator run on each candidate span.
 */
struct PatternEntry {
    using Validator = bool (*)(std::string_view);

    EntityKind kind;
    std::string name;
    std::regex pattern;
    double confidence;
    Validator validator = nullptr;
    size_t capture_group = 0;       // Sub-match used as the entity span (0 = whole match)
};

/**
 * @brief Table of detection rules, compiled once and read-only afterwards
 *
 * Kinds without an entry (LOCATION, DATE, ACCOUNT_NUMBER, LICENSE_PLATE)
 * are left to model-based detectors behind IEntityDetector.
 */
class PatternLibrary {
public:
    /**
     * @brief Library with the built-in rules for every pattern-detectable kind
     * @throws std::regex_error if a built-in pattern fails to compile
     */
    [[nodiscard]] static PatternLibrary build_default();

    /**
     * @brief Compile and register an extra rule
     * @throws std::regex_error on an invalid pattern
     */
    void add(EntityKind kind, std::string name, std::string_view regex,
             double confidence, PatternEntry::Validator validator = nullptr,
             size_t capture_group = 0);

    void add(PatternEntry entry);

    [[nodiscard]] const std::vector<PatternEntry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool covers(EntityKind kind) const;

private:
    std::vector<PatternEntry> entries_;
};

} // namespace piishield
