#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace piishield {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        PiiShieldConfig config;

        static LoadResult ok(PiiShieldConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to pii_shield.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, one message each (empty = valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const PiiShieldConfig& config);

    /// "numbered" | "uuid" | "hashed" (case-insensitive)
    [[nodiscard]] static std::optional<PlaceholderFormat> parse_placeholder_format(
        const std::string& name);
};

} // namespace piishield
