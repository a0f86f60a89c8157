#include "vault/memory_vault.hpp"
#include "core/utils.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <format>
#include <mutex>
#include <string_view>
#include <unordered_map>

namespace piishield {

namespace {

constexpr int kSessionIdAttempts = 8;

} // anonymous namespace

MemoryVault::MemoryVault(const Config& config,
                         std::shared_ptr<IClock> clock,
                         std::shared_ptr<AuditLog> audit)
    : config_(config),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      audit_(audit ? std::move(audit) : std::make_shared<AuditLog>()) {}

Result<std::string> MemoryVault::random_session_id() {
    std::array<unsigned char, 6> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return Result<std::string>::error(ErrorCategory::VAULT_ERROR,
            "RAND_bytes failed while generating session id");
    }
    return Result<std::string>::ok("sess_" + utils::bytes_to_hex(bytes.data(), bytes.size()));
}

void MemoryVault::audit(const std::string& session_id, AuditEventKind kind,
                        std::optional<EntityKind> entity_kind, AuditOutcome outcome,
                        TimePoint when) {
    AuditEvent event;
    event.timestamp = when;
    event.session_id = session_id;
    event.kind = kind;
    event.entity_kind = entity_kind;
    event.outcome = outcome;
    audit_->record(std::move(event));
}

// ============================================================================
// Session lifecycle
// ============================================================================

Result<std::string> MemoryVault::create_session(std::optional<std::chrono::seconds> ttl,
                                                const std::optional<std::string>& owner) {
    if (ttl && ttl->count() < 0) {
        return Result<std::string>::error(ErrorCategory::VAULT_ERROR,
            "Session TTL must not be negative");
    }

    const auto now = clock_->now();
    std::string session_id;
    {
        std::unique_lock lock(mutex_);

        if (sessions_.size() >= config_.max_sessions) {
            utils::log::warn(std::format("Vault at capacity ({} sessions), rejecting new session",
                                         config_.max_sessions));
            return Result<std::string>::error(ErrorCategory::VAULT_ERROR,
                std::format("Vault session limit reached ({})", config_.max_sessions));
        }

        for (int attempt = 0; attempt < kSessionIdAttempts && session_id.empty(); ++attempt) {
            auto candidate = random_session_id();
            if (!candidate.is_ok()) return candidate;
            if (!sessions_.contains(candidate.value())) {
                session_id = std::move(candidate.value());
            }
        }
        if (session_id.empty()) {
            return Result<std::string>::error(ErrorCategory::VAULT_ERROR,
                "Could not allocate a unique session id");
        }

        auto entry = std::make_unique<SessionEntry>();
        entry->session_id = session_id;
        entry->created_at = now;
        entry->ttl = ttl;
        entry->owner = owner;
        entry->touch(now);
        sessions_.emplace(session_id, std::move(entry));
    }

    audit(session_id, AuditEventKind::CREATED, std::nullopt, AuditOutcome::SUCCESS, now);
    utils::log::debug(std::format("Vault session {} created (ttl={}{})",
        utils::redact_session_id(session_id),
        ttl ? std::format("{}s", ttl->count()) : std::string("none"),
        owner ? ", owned" : ""));
    return Result<std::string>::ok(std::move(session_id));
}

Status MemoryVault::put_mapping(const std::string& session_id, const EntityMapping& mapping) {
    return put_mappings(session_id, {mapping}, clock_->now());
}

Status MemoryVault::put_mappings(const std::string& session_id,
                                 const std::vector<EntityMapping>& mappings,
                                 TimePoint as_of) {
    for (const auto& mapping : mappings) {
        if (mapping.placeholder.empty()) {
            return Status::error(ErrorCategory::VAULT_ERROR, "Mapping has an empty placeholder");
        }
    }

    std::unique_lock lock(mutex_);

    const auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second->is_expired(as_of)) {
        return Status::error(ErrorCategory::SESSION_NOT_FOUND,
            std::format("Session {} not found or expired", utils::redact_session_id(session_id)));
    }

    // Validate the whole batch before storing any of it
    auto& entry = *it->second;
    std::unordered_map<std::string_view, std::string_view> staged;
    for (const auto& mapping : mappings) {
        std::string_view held;
        if (const auto s = staged.find(mapping.placeholder); s != staged.end()) {
            held = s->second;
        } else if (const auto e = entry.mappings.find(mapping.placeholder);
                   e != entry.mappings.end() && !e->second.is_expired(as_of)) {
            held = e->second.original_value;
        } else {
            staged.emplace(mapping.placeholder, mapping.original_value);
            continue;
        }
        if (held != mapping.original_value) {
            return Status::error(ErrorCategory::VAULT_ERROR,
                std::format("Placeholder collision in session {} for kind {}",
                            utils::redact_session_id(session_id), entity_kind_to_string(mapping.kind)));
        }
    }

    for (const auto& mapping : mappings) {
        entry.mappings.insert_or_assign(mapping.placeholder, mapping);
    }
    if (entry.last_accessed_at() < as_of) {
        entry.touch(as_of);
    }
    return Status::ok();
}

Result<EntityMapping> MemoryVault::get_mapping(const std::string& session_id,
                                               const std::string& placeholder,
                                               const std::optional<std::string>& owner) {
    const auto now = clock_->now();
    ErrorCategory failure = ErrorCategory::NONE;
    std::optional<EntityKind> kind;
    EntityMapping found;

    {
        std::shared_lock lock(mutex_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end() || it->second->is_expired(now)) {
            failure = ErrorCategory::SESSION_NOT_FOUND;
        } else if (!it->second->admits(owner)) {
            failure = ErrorCategory::ACCESS_DENIED;
        } else {
            auto& entry = *it->second;
            entry.touch(now);
            const auto m = entry.mappings.find(placeholder);
            if (m == entry.mappings.end()) {
                failure = ErrorCategory::NOT_FOUND;
            } else {
                kind = m->second.kind;
                if (m->second.is_expired(now)) {
                    failure = ErrorCategory::MAPPING_EXPIRED;
                } else {
                    found = m->second;
                }
            }
        }
    }

    switch (failure) {
        case ErrorCategory::NONE:
            audit(session_id, AuditEventKind::ACCESSED, kind, AuditOutcome::SUCCESS, now);
            return Result<EntityMapping>::ok(std::move(found));

        case ErrorCategory::SESSION_NOT_FOUND:
            audit(session_id, AuditEventKind::ACCESSED, std::nullopt, AuditOutcome::NOT_FOUND, now);
            return Result<EntityMapping>::error(failure,
                std::format("Session {} not found or expired", utils::redact_session_id(session_id)));

        case ErrorCategory::ACCESS_DENIED:
            audit(session_id, AuditEventKind::ACCESSED, std::nullopt, AuditOutcome::DENIED, now);
            utils::log::warn(std::format("Vault lookup denied in session {}: owner mismatch",
                                         utils::redact_session_id(session_id)));
            return Result<EntityMapping>::error(failure,
                std::format("Session {} belongs to another owner", utils::redact_session_id(session_id)));

        case ErrorCategory::MAPPING_EXPIRED:
            audit(session_id, AuditEventKind::ACCESSED, kind, AuditOutcome::DENIED, now);
            return Result<EntityMapping>::error(failure,
                std::format("Mapping for kind {} in session {} has expired",
                            entity_kind_to_string(*kind), utils::redact_session_id(session_id)));

        default:
            audit(session_id, AuditEventKind::ACCESSED, std::nullopt, AuditOutcome::NOT_FOUND, now);
            return Result<EntityMapping>::error(ErrorCategory::NOT_FOUND,
                std::format("Placeholder not found in session {}", utils::redact_session_id(session_id)));
    }
}

Status MemoryVault::delete_session(const std::string& session_id,
                                  const std::optional<std::string>& owner) {
    const auto now = clock_->now();
    AuditOutcome outcome = AuditOutcome::NOT_FOUND;
    {
        std::unique_lock lock(mutex_);
        const auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            if (it->second->admits(owner)) {
                sessions_.erase(it);
                outcome = AuditOutcome::SUCCESS;
            } else {
                outcome = AuditOutcome::DENIED;
            }
        }
    }

    audit(session_id, AuditEventKind::DELETED, std::nullopt, outcome, now);
    if (outcome == AuditOutcome::DENIED) {
        utils::log::warn(std::format("Vault delete denied in session {}: owner mismatch",
                                     utils::redact_session_id(session_id)));
        return Status::error(ErrorCategory::ACCESS_DENIED,
            std::format("Session {} belongs to another owner", utils::redact_session_id(session_id)));
    }
    if (outcome == AuditOutcome::SUCCESS) {
        utils::log::debug(std::format("Vault session {} deleted",
                                      utils::redact_session_id(session_id)));
    }
    return Status::ok();
}

Status MemoryVault::touch_session(const std::string& session_id,
                                  const std::optional<std::string>& owner) {
    const auto now = clock_->now();
    std::shared_lock lock(mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second->is_expired(now)) {
        return Status::error(ErrorCategory::SESSION_NOT_FOUND,
            std::format("Session {} not found or expired", utils::redact_session_id(session_id)));
    }
    if (!it->second->admits(owner)) {
        return Status::error(ErrorCategory::ACCESS_DENIED,
            std::format("Session {} belongs to another owner", utils::redact_session_id(session_id)));
    }
    it->second->touch(now);
    return Status::ok();
}

// ============================================================================
// Expiry
// ============================================================================

size_t MemoryVault::sweep_expired() {
    const auto now = clock_->now();

    struct Eviction {
        std::string session_id;
        std::optional<EntityKind> kind;     // nullopt = whole session
    };
    std::vector<Eviction> evicted;

    {
        std::unique_lock lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            auto& entry = *it->second;
            if (entry.is_expired(now)) {
                evicted.push_back({entry.session_id, std::nullopt});
                it = sessions_.erase(it);
                continue;
            }
            for (auto m = entry.mappings.begin(); m != entry.mappings.end();) {
                if (m->second.is_expired(now)) {
                    evicted.push_back({entry.session_id, m->second.kind});
                    m = entry.mappings.erase(m);
                } else {
                    ++m;
                }
            }
            ++it;
        }
    }

    for (const auto& e : evicted) {
        audit(e.session_id, AuditEventKind::EXPIRED, e.kind, AuditOutcome::SUCCESS, now);
    }

    if (!evicted.empty()) {
        utils::log::info(std::format("Vault sweep evicted {} expired entries", evicted.size()));
    }
    return evicted.size();
}

// ============================================================================
// Inspection
// ============================================================================

Result<AnonymizationSession> MemoryVault::get_session(const std::string& session_id) const {
    const auto now = clock_->now();
    std::shared_lock lock(mutex_);

    const auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second->is_expired(now)) {
        return Result<AnonymizationSession>::error(ErrorCategory::SESSION_NOT_FOUND,
            std::format("Session {} not found or expired", utils::redact_session_id(session_id)));
    }

    const auto& entry = *it->second;
    AnonymizationSession snapshot;
    snapshot.session_id = entry.session_id;
    snapshot.created_at = entry.created_at;
    snapshot.last_accessed_at = entry.last_accessed_at();
    snapshot.ttl = entry.ttl;
    snapshot.owner = entry.owner;
    for (const auto& [placeholder, mapping] : entry.mappings) {
        if (!mapping.is_expired(now)) {
            snapshot.mappings.emplace(placeholder, mapping);
        }
    }
    return Result<AnonymizationSession>::ok(std::move(snapshot));
}

std::vector<std::string> MemoryVault::list_sessions() const {
    const auto now = clock_->now();
    std::shared_lock lock(mutex_);

    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, entry] : sessions_) {
        if (!entry->is_expired(now)) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t MemoryVault::session_count() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

} // namespace piishield
