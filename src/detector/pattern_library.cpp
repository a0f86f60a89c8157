#include "detector/pattern_library.hpp"
#include "detector/validators.hpp"

#include <algorithm>

namespace piishield {

PatternLibrary PatternLibrary::build_default() {
    PatternLibrary lib;

    // Compile regex patterns once; detection only reads them afterwards.
    // Every repeat carries an explicit upper bound: std::regex matches
    // recursively, one stack frame per repetition, so an unbounded run
    // over a long token overflows the stack.

    lib.add(EntityKind::EMAIL, "email",
        R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24}\b)",
        0.95);

    // Optional country code, then 3-3-4 with optional separators
    lib.add(EntityKind::PHONE, "phone",
        R"((?:\+\d{1,3}[-.\s]?)?(?:\(\d{3}\)|\b\d{3})[-.\s]?\d{3}[-.\s]?\d{4}\b)",
        0.90);

    lib.add(EntityKind::SSN, "ssn",
        R"(\b\d{3}-\d{2}-\d{4}\b)",
        0.95, validators::validate_ssn);

    // 16 digits in groups of four, or 15 contiguous (Amex); Luhn checked
    lib.add(EntityKind::CREDIT_CARD, "credit_card",
        R"(\b(?:\d{4}[-\s]?){3}\d{4}\b|\b\d{15}\b)",
        0.95, validators::luhn_validate);

    lib.add(EntityKind::IP_ADDRESS, "ipv4",
        R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)",
        0.90, validators::validate_ipv4);

    lib.add(EntityKind::URL, "url",
        R"(https?://[^\s<>"]{1,2048}|www\.[^\s<>"]{1,2048})",
        0.85);

    // Provider-style secret keys: sk-/pk-/rk- prefixed, GitHub and Slack tokens
    lib.add(EntityKind::API_KEY, "api_key",
        R"(\b(?:sk|pk|rk)[-_][A-Za-z0-9_-]{16,128}|\bgh[pousr]_[A-Za-z0-9]{36}\b|\bxox[abpr]-[A-Za-z0-9-]{10,128})",
        0.90);

    lib.add(EntityKind::AWS_ACCESS_KEY, "aws_access_key",
        R"(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)",
        0.95);

    lib.add(EntityKind::DATE_OF_BIRTH, "date_of_birth",
        R"(\b(?:\d{1,2}[-/]\d{1,2}[-/]\d{4}|\d{4}[-/]\d{1,2}[-/]\d{1,2})\b)",
        0.75);

    lib.add(EntityKind::BANK_ACCOUNT, "bank_account",
        R"(\b\d{8,17}\b)",
        0.70);

    lib.add(EntityKind::DRIVER_LICENSE, "driver_license",
        R"(\b[A-Z]\d{7}\b|\b\d{8,12}\b)",
        0.75);

    lib.add(EntityKind::PASSPORT, "passport",
        R"(\b[A-Z]{1,2}\d{7,8}\b)",
        0.75);

    lib.add(EntityKind::MEDICAL_RECORD_NUMBER, "medical_record_number",
        R"(\bMRN[-:]?\d{6,10}\b|\b\d{6,10}\b)",
        0.80);

    lib.add(EntityKind::POSTAL_CODE, "postal_code",
        R"(\b\d{5}(?:-\d{4})?\b)",
        0.85);

    // Heuristics: two capitalized words; street number + name + suffix;
    // capitalized words ending in a corporate suffix
    lib.add(EntityKind::PERSON, "person_name",
        R"(\b[A-Z][a-z]{1,40}\s{1,4}[A-Z][a-z]{1,40}\b)",
        0.60);

    lib.add(EntityKind::ADDRESS, "street_address",
        R"(\b\d{1,6}\s{1,4}[A-Z][a-z]{1,40}\s{1,4}(?:Street|St|Avenue|Ave|Road|Rd|Drive|Dr|Lane|Ln|Boulevard|Blvd)\b)",
        0.65);

    lib.add(EntityKind::ORGANIZATION, "organization",
        R"(\b[A-Z][A-Za-z]{0,40}(?:\s[A-Z][A-Za-z]{0,40}){0,4}\s(?:Inc|Corp|LLC|Ltd|Company|Co)\b)",
        0.65);

    return lib;
}

void PatternLibrary::add(EntityKind kind, std::string name, std::string_view regex,
                         double confidence, PatternEntry::Validator validator,
                         size_t capture_group) {
    PatternEntry entry;
    entry.kind = kind;
    entry.name = std::move(name);
    entry.pattern = std::regex(regex.begin(), regex.end(), std::regex::ECMAScript);
    entry.confidence = confidence;
    entry.validator = validator;
    entry.capture_group = capture_group;
    entries_.push_back(std::move(entry));
}

void PatternLibrary::add(PatternEntry entry) {
    entries_.push_back(std::move(entry));
}

bool PatternLibrary::covers(EntityKind kind) const {
    return std::any_of(entries_.begin(), entries_.end(),
        [kind](const PatternEntry& e) { return e.kind == kind; });
}

} // namespace piishield
