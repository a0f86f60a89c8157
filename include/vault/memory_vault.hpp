#pragma once

#include "audit/audit_log.hpp"
#include "core/clock.hpp"
#include "vault/ivault_storage.hpp"

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace piishield {

/**
 * @brief In-memory vault
 *
 * Lookups (get_mapping, touch_session, get_session, list_sessions) take a shared lock;
 * every mutation takes the unique lock. last_accessed_at is atomic so a
 * lookup can refresh it without becoming a writer. Audit events are
 * recorded after the lock is released, before the call returns.
 *
 * The vault never runs background work: expiry only happens when a caller
 * invokes sweep_expired().
 */
class MemoryVault final : public IVaultStorage {
public:
    struct Config {
        size_t max_sessions = 100000;   // Cap on stored sessions
    };

    MemoryVault() : MemoryVault(Config{}) {}
    explicit MemoryVault(const Config& config,
                         std::shared_ptr<IClock> clock = nullptr,
                         std::shared_ptr<AuditLog> audit = nullptr);

    [[nodiscard]] Result<std::string> create_session(
        std::optional<std::chrono::seconds> ttl,
        const std::optional<std::string>& owner = std::nullopt) override;

    [[nodiscard]] Status put_mapping(const std::string& session_id,
                                     const EntityMapping& mapping) override;

    [[nodiscard]] Status put_mappings(const std::string& session_id,
                                      const std::vector<EntityMapping>& mappings,
                                      std::chrono::system_clock::time_point as_of) override;

    [[nodiscard]] Result<EntityMapping> get_mapping(
        const std::string& session_id,
        const std::string& placeholder,
        const std::optional<std::string>& owner = std::nullopt) override;

    Status delete_session(const std::string& session_id,
                          const std::optional<std::string>& owner = std::nullopt) override;

    [[nodiscard]] Status touch_session(
        const std::string& session_id,
        const std::optional<std::string>& owner = std::nullopt) override;

    size_t sweep_expired() override;

    [[nodiscard]] Result<AnonymizationSession> get_session(
        const std::string& session_id) const override;

    [[nodiscard]] std::vector<std::string> list_sessions() const override;

    [[nodiscard]] size_t session_count() const override;

    [[nodiscard]] const std::shared_ptr<AuditLog>& audit_log() const { return audit_; }
    [[nodiscard]] const std::shared_ptr<IClock>& clock() const { return clock_; }

private:
    using TimePoint = std::chrono::system_clock::time_point;

    struct SessionEntry {
        std::string session_id;
        TimePoint created_at;
        std::atomic<TimePoint::rep> last_accessed{0};   // time_since_epoch().count()
        std::optional<std::chrono::seconds> ttl;
        std::optional<std::string> owner;
        std::unordered_map<std::string, EntityMapping> mappings;

        [[nodiscard]] TimePoint last_accessed_at() const {
            return TimePoint(TimePoint::duration(last_accessed.load(std::memory_order_relaxed)));
        }
        void touch(TimePoint now) {
            last_accessed.store(now.time_since_epoch().count(), std::memory_order_relaxed);
        }
        [[nodiscard]] bool admits(const std::optional<std::string>& requester) const {
            return !owner.has_value() || owner == requester;
        }
        [[nodiscard]] bool is_expired(TimePoint now) const {
            return ttl.has_value() && now > last_accessed_at() + *ttl;
        }
    };

    [[nodiscard]] static Result<std::string> random_session_id();

    void audit(const std::string& session_id, AuditEventKind kind,
               std::optional<EntityKind> entity_kind, AuditOutcome outcome, TimePoint when);

    Config config_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<AuditLog> audit_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<SessionEntry>> sessions_;
};

} // namespace piishield
