#pragma once

#include "core/clock.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "detector/ientity_detector.hpp"
#include "placeholder/placeholder_generator.hpp"
#include "vault/ivault_storage.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace piishield {

struct AnonymizeResult {
    std::string sanitized_text;
    std::string session_id;
    std::vector<EntityMatch> entities;      // Replaced spans, offsets into the input
};

/**
 * @brief Orchestrates detect -> mint -> vault -> substitute, and the reverse
 *
 * Failures abort the whole call: no partially anonymized or partially
 * restored text is ever returned.
 *
 * Placeholder-shaped literals already present in the input are vaulted like
 * any other entity, so restoring always reproduces the input exactly.
 *
 * Thread-safe. One PlaceholderGenerator per session is kept here; a
 * generator rebuilt for an existing session is seeded from its mappings.
 */
class Anonymizer {
public:
    /// clock must be the vault's clock
    Anonymizer(AnonymizerConfig config,
               std::shared_ptr<IEntityDetector> detector,
               std::shared_ptr<IVaultStorage> vault,
               std::shared_ptr<IClock> clock = nullptr);

    /**
     * @brief Replace detected entities with placeholders
     * @param session_id Continue an existing session; nullopt = start one
     * @param owner Recorded on a new session; must match to continue an owned one
     *
     * Mappings are created and checked against the vault as of the instant
     * the call began, so a zero TTL still stores them (already expired).
     */
    [[nodiscard]] Result<AnonymizeResult> anonymize(
        std::string_view text,
        const std::optional<std::string>& session_id = std::nullopt,
        const std::optional<std::string>& owner = std::nullopt);

    /**
     * @brief Restore originals for every placeholder in text
     * Any unresolvable token fails the whole call; ACCESS_DENIED if the
     * session is owned by someone other than owner.
     */
    [[nodiscard]] Result<std::string> deanonymize(
        std::string_view text,
        const std::string& session_id,
        const std::optional<std::string>& owner = std::nullopt);

    /// Delete the session from the vault and forget its generator
    Status end_session(const std::string& session_id,
                       const std::optional<std::string>& owner = std::nullopt);

    /// Sweep the vault, then drop generators of sessions that no longer exist
    size_t sweep_expired();

    [[nodiscard]] const AnonymizerConfig& config() const { return config_; }

    [[nodiscard]] size_t active_generators() const;

private:
    [[nodiscard]] Result<std::shared_ptr<PlaceholderGenerator>> generator_for(
        const std::string& session_id, bool fresh);

    [[nodiscard]] std::vector<EntityMatch> literal_placeholders(std::string_view text) const;

    void abandon_session(const std::string& session_id, const std::optional<std::string>& owner);

    AnonymizerConfig config_;
    std::shared_ptr<IEntityDetector> detector_;
    std::shared_ptr<IVaultStorage> vault_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex generators_mutex_;
    std::unordered_map<std::string, std::shared_ptr<PlaceholderGenerator>> generators_;
};

} // namespace piishield
