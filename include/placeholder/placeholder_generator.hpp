#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace piishield {

/**
 * @brief Session-scoped placeholder minting
 *
 * NUMBERED: [EMAIL_1], [EMAIL_2], ... one monotonic counter per kind
 * UUID:     [EMAIL_<uuid-v4>] from OpenSSL RAND_bytes
 * HASHED:   [EMAIL_<16 hex>] = HMAC-SHA256(session_id, original value), first 8 bytes
 *
 * Counters are instance state; two generators never share them.
 * Thread-safe: the lock covers only the counter increment-and-read.
 */
class PlaceholderGenerator {
public:
    PlaceholderGenerator(std::string session_id, PlaceholderFormat format);

    PlaceholderGenerator(const PlaceholderGenerator&) = delete;
    PlaceholderGenerator& operator=(const PlaceholderGenerator&) = delete;

    [[nodiscard]] Result<std::string> generate(const EntityMatch& match);

    /**
     * @brief Generate placeholders for every match, preserving order
     * Any failure fails the whole batch.
     */
    [[nodiscard]] Result<std::vector<std::string>> generate_batch(
        const std::vector<EntityMatch>& matches);

    /**
     * @brief Raise the counter for a kind to at least n
     * Used when resuming a session whose mappings already hold [KIND_1..n].
     */
    void reserve(EntityKind kind, uint64_t n);

    [[nodiscard]] uint64_t counter(EntityKind kind) const;

    [[nodiscard]] const std::string& session_id() const { return session_id_; }
    [[nodiscard]] PlaceholderFormat format() const { return format_; }

private:
    [[nodiscard]] uint64_t next_counter(EntityKind kind);

    [[nodiscard]] static Result<std::string> random_uuid();
    [[nodiscard]] Result<std::string> keyed_digest(std::string_view value) const;

    const std::string session_id_;
    const PlaceholderFormat format_;

    mutable std::mutex mutex_;
    std::unordered_map<EntityKind, uint64_t, EntityKindHash> counters_;
};

} // namespace piishield
