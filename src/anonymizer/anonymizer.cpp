#include "anonymizer/anonymizer.hpp"
#include "anonymizer/span_replacer.hpp"
#include "core/utils.hpp"
#include "placeholder/placeholder_scanner.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace piishield {

namespace {

bool overlaps_any(const EntityMatch& candidate, const std::vector<EntityMatch>& matches) {
    return std::any_of(matches.begin(), matches.end(), [&candidate](const EntityMatch& m) {
        return candidate.start < m.end && m.start < candidate.end;
    });
}

} // anonymous namespace

Anonymizer::Anonymizer(AnonymizerConfig config,
                       std::shared_ptr<IEntityDetector> detector,
                       std::shared_ptr<IVaultStorage> vault,
                       std::shared_ptr<IClock> clock)
    : config_(std::move(config)),
      detector_(std::move(detector)),
      vault_(std::move(vault)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {}

// ============================================================================
// Anonymize
// ============================================================================

Result<AnonymizeResult> Anonymizer::anonymize(std::string_view text,
                                              const std::optional<std::string>& session_id,
                                              const std::optional<std::string>& owner) {
    if (text.empty()) {
        return Result<AnonymizeResult>::error(ErrorCategory::EMPTY_INPUT,
            "Cannot anonymize empty text");
    }

    utils::Timer timer;
    const auto started = clock_->now();

    // 1. Detect, keep enabled kinds only
    auto detected = detector_->detect(text);
    if (!detected.is_ok()) {
        return Result<AnonymizeResult>::propagate(detected);
    }

    std::vector<EntityMatch> entities;
    entities.reserve(detected.value().size());
    for (auto& m : detected.value()) {
        if (config_.entity_types.contains(m.kind)) {
            entities.push_back(std::move(m));
        }
    }

    // Literal tokens that would otherwise be mistaken for ours on the way back
    for (auto& literal : literal_placeholders(text)) {
        if (!overlaps_any(literal, entities)) {
            entities.push_back(std::move(literal));
        }
    }
    std::stable_sort(entities.begin(), entities.end(),
        [](const EntityMatch& a, const EntityMatch& b) { return a.start < b.start; });

    // Reject bad detector spans before any session, counter or mapping is touched
    const auto spans_ok = check_spans(text, entities);
    if (!spans_ok.is_ok()) {
        utils::log::error(std::format("Detector '{}' returned unusable spans: {}",
                                      detector_->name(), spans_ok.error_message()));
        return Result<AnonymizeResult>::propagate(spans_ok);
    }

    // 2. Obtain or create the session
    std::string sid;
    bool created = false;
    if (session_id) {
        const auto touched = vault_->touch_session(*session_id, owner);
        if (!touched.is_ok()) {
            return Result<AnonymizeResult>::propagate(touched);
        }
        sid = *session_id;
    } else {
        auto fresh = vault_->create_session(config_.vault_ttl, owner);
        if (!fresh.is_ok()) {
            return Result<AnonymizeResult>::propagate(fresh);
        }
        sid = std::move(fresh.value());
        created = true;
    }

    // 3. Mint placeholders
    auto generator = generator_for(sid, created);
    if (!generator.is_ok()) {
        if (created) abandon_session(sid, owner);
        return Result<AnonymizeResult>::propagate(generator);
    }

    auto placeholders = generator.value()->generate_batch(entities);
    if (!placeholders.is_ok()) {
        utils::log::error(std::format("Placeholder generation failed in session {}: {}",
                                      utils::redact_session_id(sid), placeholders.error_message()));
        if (created) abandon_session(sid, owner);
        return Result<AnonymizeResult>::propagate(placeholders);
    }

    // 4. Substitute
    auto sanitized = replace_spans(text, entities, placeholders.value());
    if (!sanitized.is_ok()) {
        if (created) abandon_session(sid, owner);
        return Result<AnonymizeResult>::propagate(sanitized);
    }

    // 5. Persist as one batch, judged at the instant this call began
    if (!entities.empty()) {
        std::optional<std::chrono::system_clock::time_point> expires_at;
        if (config_.vault_ttl) {
            expires_at = started + *config_.vault_ttl;
        }

        std::vector<EntityMapping> mappings;
        mappings.reserve(entities.size());
        for (size_t i = 0; i < entities.size(); ++i) {
            EntityMapping mapping;
            mapping.kind = entities[i].kind;
            mapping.original_value = entities[i].text;
            mapping.placeholder = placeholders.value()[i];
            mapping.confidence = entities[i].confidence;
            mapping.created_at = started;
            mapping.expires_at = expires_at;
            mappings.push_back(std::move(mapping));
        }

        const auto stored = vault_->put_mappings(sid, mappings, started);
        if (!stored.is_ok()) {
            utils::log::error(std::format("Vault rejected {} mappings in session {}: {}",
                mappings.size(), utils::redact_session_id(sid), stored.error_message()));
            if (created) abandon_session(sid, owner);
            return Result<AnonymizeResult>::propagate(stored);
        }
    }

    utils::log::debug(std::format("Anonymized {} entities in session {} ({}us)",
        entities.size(), utils::redact_session_id(sid), timer.elapsed_us().count()));

    AnonymizeResult result;
    result.sanitized_text = std::move(sanitized.value());
    result.session_id = std::move(sid);
    result.entities = std::move(entities);
    return Result<AnonymizeResult>::ok(std::move(result));
}

// ============================================================================
// Deanonymize
// ============================================================================

Result<std::string> Anonymizer::deanonymize(std::string_view text, const std::string& session_id,
                                            const std::optional<std::string>& owner) {
    if (text.empty()) {
        return Result<std::string>::error(ErrorCategory::EMPTY_INPUT,
            "Cannot deanonymize empty text");
    }

    const auto tokens = find_placeholders(text, config_.placeholder_format);
    if (tokens.empty()) {
        const auto touched = vault_->touch_session(session_id, owner);
        if (!touched.is_ok()) {
            return Result<std::string>::propagate(touched);
        }
        return Result<std::string>::ok(std::string(text));
    }

    std::vector<std::string> originals;
    originals.reserve(tokens.size());
    for (const auto& token : tokens) {
        auto mapping = vault_->get_mapping(session_id, token.text, owner);
        if (!mapping.is_ok()) {
            utils::log::warn(std::format("Deanonymize aborted in session {}: {} ({})",
                utils::redact_session_id(session_id),
                error_category_to_string(mapping.error_category()),
                entity_kind_to_string(token.kind)));
            return Result<std::string>::propagate(mapping);
        }
        originals.push_back(std::move(mapping.value().original_value));
    }

    auto restored = replace_spans(text, tokens, originals);
    if (!restored.is_ok()) {
        return restored;
    }

    utils::log::debug(std::format("Restored {} placeholders in session {}",
                                  tokens.size(), utils::redact_session_id(session_id)));
    return restored;
}

// ============================================================================
// Session management
// ============================================================================

Status Anonymizer::end_session(const std::string& session_id,
                               const std::optional<std::string>& owner) {
    auto deleted = vault_->delete_session(session_id, owner);
    if (!deleted.is_ok()) {
        return deleted;
    }
    std::lock_guard<std::mutex> lock(generators_mutex_);
    generators_.erase(session_id);
    return deleted;
}

size_t Anonymizer::sweep_expired() {
    const size_t evicted = vault_->sweep_expired();

    const auto live = vault_->list_sessions();
    const std::unordered_set<std::string> live_set(live.begin(), live.end());

    std::lock_guard<std::mutex> lock(generators_mutex_);
    std::erase_if(generators_, [&live_set](const auto& entry) {
        return !live_set.contains(entry.first);
    });
    return evicted;
}

size_t Anonymizer::active_generators() const {
    std::lock_guard<std::mutex> lock(generators_mutex_);
    return generators_.size();
}

Result<std::shared_ptr<PlaceholderGenerator>> Anonymizer::generator_for(
    const std::string& session_id, bool fresh) {
    {
        std::lock_guard<std::mutex> lock(generators_mutex_);
        const auto it = generators_.find(session_id);
        if (it != generators_.end()) {
            return Result<std::shared_ptr<PlaceholderGenerator>>::ok(it->second);
        }
    }

    auto generator = std::make_shared<PlaceholderGenerator>(session_id,
                                                            config_.placeholder_format);

    // Resuming a session minted elsewhere: never re-issue its numbered tokens
    if (!fresh && config_.placeholder_format == PlaceholderFormat::NUMBERED) {
        const auto session = vault_->get_session(session_id);
        if (!session.is_ok()) {
            return Result<std::shared_ptr<PlaceholderGenerator>>::propagate(session);
        }
        for (const auto& [placeholder, mapping] : session.value().mappings) {
            if (const auto parsed = parse_numbered_counter(placeholder)) {
                generator->reserve(parsed->first, parsed->second);
            }
        }
    }

    std::lock_guard<std::mutex> lock(generators_mutex_);
    const auto it = generators_.try_emplace(session_id, std::move(generator)).first;
    return Result<std::shared_ptr<PlaceholderGenerator>>::ok(it->second);
}

std::vector<EntityMatch> Anonymizer::literal_placeholders(std::string_view text) const {
    std::vector<EntityMatch> literals;
    for (auto& token : find_placeholders(text, config_.placeholder_format)) {
        literals.emplace_back(token.kind, token.start, token.end, std::move(token.text), 1.0);
    }
    return literals;
}

void Anonymizer::abandon_session(const std::string& session_id,
                                 const std::optional<std::string>& owner) {
    {
        std::lock_guard<std::mutex> lock(generators_mutex_);
        generators_.erase(session_id);
    }
    const auto deleted = vault_->delete_session(session_id, owner);
    if (!deleted.is_ok()) {
        utils::log::error(std::format("Failed to discard session {}: {}",
                                      utils::redact_session_id(session_id), deleted.error_message()));
    }
}

} // namespace piishield
