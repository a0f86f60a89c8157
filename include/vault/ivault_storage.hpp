#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace piishield {

/**
 * @brief Abstract session vault: placeholder -> original value, per session
 *
 * The one backend seam of the library. Any implementation must keep the
 * failure semantics below so the Anonymizer works unchanged on top of it.
 *
 * Audit contract: every create, lookup, expiry and delete produces an
 * AuditEvent synchronously, before the call returns.
 *
 * Ownership: a session created with an owner answers get_mapping,
 * touch_session and delete_session only for that same owner. Writes are not
 * owner-checked; callers continuing a session go through touch_session first.
 */
class IVaultStorage {
public:
    virtual ~IVaultStorage() = default;

    /**
     * @brief Create an empty session
     * @param ttl Idle timeout; nullopt = never expires
     * @param owner Identity required to read or end the session; nullopt = anyone holding the id
     * @return New session id ("sess_" + 12 hex)
     */
    [[nodiscard]] virtual Result<std::string> create_session(
        std::optional<std::chrono::seconds> ttl,
        const std::optional<std::string>& owner = std::nullopt) = 0;

    /// SESSION_NOT_FOUND if the session is absent or expired
    [[nodiscard]] virtual Status put_mapping(const std::string& session_id,
                                             const EntityMapping& mapping) = 0;

    /**
     * @brief Store several mappings, all or none
     *
     * Liveness is judged at as_of, the instant the caller's operation began,
     * so a session created by that same operation is never lost to its own
     * idle timeout. The idle timer never moves past as_of, so an old as_of
     * cannot revive an expired session.
     *
     * SESSION_NOT_FOUND if the session was absent or expired at as_of;
     * VAULT_ERROR on a placeholder collision, with nothing stored.
     */
    [[nodiscard]] virtual Status put_mappings(const std::string& session_id,
                                              const std::vector<EntityMapping>& mappings,
                                              std::chrono::system_clock::time_point as_of) = 0;

    /**
     * @brief Resolve a placeholder within a session
     *
     * SESSION_NOT_FOUND: session absent or expired
     * ACCESS_DENIED:     the session has an owner and owner does not match
     * NOT_FOUND:         placeholder not in this session
     * MAPPING_EXPIRED:   the mapping's own TTL lapsed
     *
     * Records exactly one ACCESSED event, on success and on failure.
     */
    [[nodiscard]] virtual Result<EntityMapping> get_mapping(
        const std::string& session_id,
        const std::string& placeholder,
        const std::optional<std::string>& owner = std::nullopt) = 0;

    /**
     * Idempotent: deleting an unknown session succeeds (audited as NOT_FOUND).
     * ACCESS_DENIED (audited as DENIED) if owner does not match the session's.
     */
    virtual Status delete_session(const std::string& session_id,
                                  const std::optional<std::string>& owner = std::nullopt) = 0;

    /// Refresh the idle timer. SESSION_NOT_FOUND if absent or expired, ACCESS_DENIED on owner mismatch.
    [[nodiscard]] virtual Status touch_session(
        const std::string& session_id,
        const std::optional<std::string>& owner = std::nullopt) = 0;

    /**
     * @brief Evict expired sessions and expired mappings of live sessions
     * @return Number of evictions (one EXPIRED event each)
     */
    virtual size_t sweep_expired() = 0;

    /// Snapshot of a live session with its non-expired mappings
    [[nodiscard]] virtual Result<AnonymizationSession> get_session(
        const std::string& session_id) const = 0;

    [[nodiscard]] virtual std::vector<std::string> list_sessions() const = 0;

    /// Stored sessions, including expired ones not yet swept
    [[nodiscard]] virtual size_t session_count() const = 0;
};

} // namespace piishield
