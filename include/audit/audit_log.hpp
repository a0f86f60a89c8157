#pragma once

#include "audit/audit_sink.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace piishield {

/**
 * @brief Tamper-evident vault audit trail
 *
 * record() runs synchronously inside the vault operation it describes:
 * assigns the next sequence number, chains the event to its predecessor
 * with SHA-256, keeps it in a bounded in-memory history and writes one
 * JSON line to each sink.
 */
class AuditLog {
public:
    struct Config {
        size_t max_history = 10000;
        bool sinks_enabled = true;      // false = history only, sinks are skipped
    };

    struct ChainVerification {
        bool valid = true;
        std::optional<uint64_t> first_broken_sequence;
        std::string message;
    };

    AuditLog() : AuditLog(Config{}) {}
    explicit AuditLog(const Config& config);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void add_sink(std::shared_ptr<IAuditSink> sink);

    /**
     * @brief Finalize and store an event
     * sequence_num, previous_hash and record_hash are assigned here.
     * @return The stored event
     */
    AuditEvent record(AuditEvent event);

    /// Retained history, oldest first
    [[nodiscard]] std::vector<AuditEvent> events() const;
    [[nodiscard]] std::vector<AuditEvent> events_for_session(const std::string& session_id) const;

    [[nodiscard]] uint64_t total_recorded() const {
        return total_recorded_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t sink_write_failures() const {
        return sink_write_failures_.load(std::memory_order_relaxed);
    }

    void flush();
    void shutdown();

    /**
     * @brief Recompute every hash and check each link to the previous event
     * The first event's previous_hash is trusted as the chain anchor.
     */
    [[nodiscard]] static ChainVerification verify_chain(const std::vector<AuditEvent>& events);

    /// SHA-256 over sequence|timestamp|session|kind|entity_kind|outcome|previous_hash
    [[nodiscard]] static std::string compute_record_hash(const AuditEvent& event,
                                                         const std::string& prev_hash);

    /// One JSONL line (newline-terminated)
    [[nodiscard]] static std::string to_json(const AuditEvent& event);

private:
    Config config_;

    mutable std::mutex mutex_;
    uint64_t next_sequence_ = 1;
    std::string previous_hash_;
    std::deque<AuditEvent> history_;
    std::vector<std::shared_ptr<IAuditSink>> sinks_;

    std::atomic<uint64_t> total_recorded_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
};

} // namespace piishield
