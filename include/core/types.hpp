#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace piishield {

// ============================================================================
// Entity Kinds
// ============================================================================

enum class EntityKind {
    PERSON,
    EMAIL,
    CREDIT_CARD,
    SSN,
    PHONE,
    IP_ADDRESS,
    URL,
    API_KEY,
    AWS_ACCESS_KEY,
    LOCATION,
    ORGANIZATION,
    DATE,
    MEDICAL_RECORD_NUMBER,
    ACCOUNT_NUMBER,
    LICENSE_PLATE,
    DATE_OF_BIRTH,
    BANK_ACCOUNT,
    DRIVER_LICENSE,
    PASSPORT,
    ADDRESS,
    POSTAL_CODE
};

inline constexpr size_t kEntityKindCount = 21;

namespace detail {

struct KindInfo {
    EntityKind kind;
    std::string_view prefix;    // Placeholder prefix, e.g. "EMAIL" in [EMAIL_1]
    std::string_view name;      // Enum name as written in config files
};

// Prefixes are pairwise distinct: a prefix identifies exactly one kind.
inline constexpr std::array<KindInfo, kEntityKindCount> kKindTable = {{
    {EntityKind::PERSON,                "PERSON",         "PERSON"},
    {EntityKind::EMAIL,                 "EMAIL",          "EMAIL"},
    {EntityKind::CREDIT_CARD,           "CREDIT_CARD",    "CREDIT_CARD"},
    {EntityKind::SSN,                   "SSN",            "SSN"},
    {EntityKind::PHONE,                 "PHONE",          "PHONE"},
    {EntityKind::IP_ADDRESS,            "IP_ADDRESS",     "IP_ADDRESS"},
    {EntityKind::URL,                   "URL",            "URL"},
    {EntityKind::API_KEY,               "API_KEY",        "API_KEY"},
    {EntityKind::AWS_ACCESS_KEY,        "AWS_KEY",        "AWS_ACCESS_KEY"},
    {EntityKind::LOCATION,              "LOCATION",       "LOCATION"},
    {EntityKind::ORGANIZATION,          "ORGANIZATION",   "ORGANIZATION"},
    {EntityKind::DATE,                  "DATE",           "DATE"},
    {EntityKind::MEDICAL_RECORD_NUMBER, "MRN",            "MEDICAL_RECORD_NUMBER"},
    {EntityKind::ACCOUNT_NUMBER,        "ACCOUNT",        "ACCOUNT_NUMBER"},
    {EntityKind::LICENSE_PLATE,         "LICENSE_PLATE",  "LICENSE_PLATE"},
    {EntityKind::DATE_OF_BIRTH,         "DATE_OF_BIRTH",  "DATE_OF_BIRTH"},
    {EntityKind::BANK_ACCOUNT,          "BANK_ACCOUNT",   "BANK_ACCOUNT"},
    {EntityKind::DRIVER_LICENSE,        "DRIVER_LICENSE", "DRIVER_LICENSE"},
    {EntityKind::PASSPORT,              "PASSPORT",       "PASSPORT"},
    {EntityKind::ADDRESS,               "ADDRESS",        "ADDRESS"},
    {EntityKind::POSTAL_CODE,           "POSTAL_CODE",    "POSTAL_CODE"},
}};

} // namespace detail

/**
 * @brief Placeholder prefix for an entity kind (e.g. EMAIL -> "EMAIL", AWS_ACCESS_KEY -> "AWS_KEY")
 */
[[nodiscard]] inline constexpr std::string_view entity_kind_to_prefix(EntityKind kind) noexcept {
    return detail::kKindTable[static_cast<size_t>(kind)].prefix;
}

[[nodiscard]] inline constexpr std::string_view entity_kind_to_string(EntityKind kind) noexcept {
    return detail::kKindTable[static_cast<size_t>(kind)].name;
}

/**
 * @brief Reverse lookup used when scanning anonymized text
 */
[[nodiscard]] inline std::optional<EntityKind> entity_kind_from_prefix(std::string_view prefix) noexcept {
    for (const auto& info : detail::kKindTable) {
        if (info.prefix == prefix) return info.kind;
    }
    return std::nullopt;
}

/**
 * @brief Parse a kind from configuration: accepts the enum name or the prefix,
 * case-insensitive ("email", "AWS_KEY", "aws_access_key").
 */
[[nodiscard]] std::optional<EntityKind> entity_kind_from_string(std::string_view name);

[[nodiscard]] inline std::vector<EntityKind> all_entity_kinds() {
    std::vector<EntityKind> kinds;
    kinds.reserve(kEntityKindCount);
    for (const auto& info : detail::kKindTable) {
        kinds.push_back(info.kind);
    }
    return kinds;
}

struct EntityKindHash {
    size_t operator()(EntityKind kind) const noexcept {
        return static_cast<size_t>(kind);
    }
};

using EntityKindSet = std::unordered_set<EntityKind, EntityKindHash>;

// ============================================================================
// Detection Results
// ============================================================================

/**
 * @brief A detected entity: byte range [start, end) into the original text
 */
struct EntityMatch {
    EntityKind kind;
    size_t start;
    size_t end;
    std::string text;
    double confidence;              // 0.0 - 1.0

    EntityMatch() : kind(EntityKind::PERSON), start(0), end(0), confidence(0.0) {}
    EntityMatch(EntityKind k, size_t s, size_t e, std::string t, double c)
        : kind(k), start(s), end(e), text(std::move(t)), confidence(c) {}

    [[nodiscard]] size_t length() const { return end - start; }
};

// ============================================================================
// Placeholders
// ============================================================================

enum class PlaceholderFormat {
    NUMBERED,   // [EMAIL_1]
    UUID,       // [EMAIL_0b7c9e3a-6f1d-4c52-9a8e-2f4d61c0b9aa]
    HASHED      // [EMAIL_5f2b9c0e4d1a7b36]
};

inline const char* placeholder_format_to_string(PlaceholderFormat format) {
    switch (format) {
        case PlaceholderFormat::NUMBERED: return "numbered";
        case PlaceholderFormat::UUID:     return "uuid";
        case PlaceholderFormat::HASHED:   return "hashed";
    }
    return "numbered";
}

/**
 * @brief Caller-supplied anonymization settings
 */
struct AnonymizerConfig {
    EntityKindSet entity_types;
    PlaceholderFormat placeholder_format = PlaceholderFormat::NUMBERED;
    std::optional<std::chrono::seconds> vault_ttl = std::chrono::seconds{3600};  // nullopt = never

    AnonymizerConfig() {
        for (const auto kind : all_entity_kinds()) {
            entity_types.insert(kind);
        }
    }
};

/**
 * @brief Placeholder token found while scanning anonymized text
 */
struct Placeholder {
    std::string text;
    size_t start;
    size_t end;
    EntityKind kind;

    Placeholder() : start(0), end(0), kind(EntityKind::PERSON) {}
    Placeholder(std::string t, size_t s, size_t e, EntityKind k)
        : text(std::move(t)), start(s), end(e), kind(k) {}
};

// ============================================================================
// Vault Records
// ============================================================================

/**
 * @brief Durable record mapping a placeholder back to the original value
 */
struct EntityMapping {
    EntityKind kind;
    std::string original_value;
    std::string placeholder;
    double confidence;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> expires_at;  // nullopt = never

    EntityMapping() : kind(EntityKind::PERSON), confidence(0.0) {}

    [[nodiscard]] bool is_expired(std::chrono::system_clock::time_point now) const {
        return expires_at.has_value() && now >= *expires_at;
    }
};

/**
 * @brief Point-in-time copy of a vault session
 */
struct AnonymizationSession {
    std::string session_id;
    std::optional<std::string> owner;                             // nullopt = anyone holding the id
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_accessed_at;
    std::optional<std::chrono::seconds> ttl;                      // nullopt = never
    std::unordered_map<std::string, EntityMapping> mappings;       // placeholder -> mapping
};

// ============================================================================
// Audit Types
// ============================================================================

enum class AuditEventKind {
    CREATED,
    ACCESSED,
    EXPIRED,
    DELETED
};

enum class AuditOutcome {
    SUCCESS,
    DENIED,
    NOT_FOUND
};

/**
 * @brief Vault audit record. Carries metadata only: never the original value
 * and never the placeholder token.
 */
struct AuditEvent {
    uint64_t sequence_num;
    std::chrono::system_clock::time_point timestamp;
    std::string session_id;
    AuditEventKind kind;
    std::optional<EntityKind> entity_kind;
    AuditOutcome outcome;

    // Integrity (hash chain)
    std::string previous_hash;
    std::string record_hash;

    AuditEvent()
        : sequence_num(0),
          kind(AuditEventKind::ACCESSED),
          outcome(AuditOutcome::SUCCESS) {}
};

inline const char* audit_event_kind_to_string(AuditEventKind kind) {
    switch (kind) {
        case AuditEventKind::CREATED:  return "CREATED";
        case AuditEventKind::ACCESSED: return "ACCESSED";
        case AuditEventKind::EXPIRED:  return "EXPIRED";
        case AuditEventKind::DELETED:  return "DELETED";
    }
    return "UNKNOWN";
}

inline const char* audit_outcome_to_string(AuditOutcome outcome) {
    switch (outcome) {
        case AuditOutcome::SUCCESS:   return "SUCCESS";
        case AuditOutcome::DENIED:    return "DENIED";
        case AuditOutcome::NOT_FOUND: return "NOT_FOUND";
    }
    return "UNKNOWN";
}

} // namespace piishield
