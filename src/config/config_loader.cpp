#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <chrono>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace piishield {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

constexpr int64_t kMaxAuditFiles = 1000;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

struct Extracted {
    PiiShieldConfig config;
    std::vector<std::string> errors;    // Problems only visible while parsing
};

void extract_anonymizer(const toml::table& root, Extracted& out) {
    const auto* section = root["anonymizer"].as_table();
    if (!section) return;
    const auto& a = *section;
    auto& cfg = out.config.anonymizer;

    if (const auto* arr = a["entity_types"].as_array()) {
        cfg.entity_types.clear();
        for (const auto& elem : *arr) {
            const auto* s = elem.as_string();
            if (!s) {
                out.errors.push_back("anonymizer.entity_types entries must be strings");
                continue;
            }
            const auto kind = entity_kind_from_string(s->get());
            if (!kind) {
                out.errors.push_back(std::format("anonymizer.entity_types: unknown entity type '{}'",
                                                 s->get()));
                continue;
            }
            cfg.entity_types.insert(*kind);
        }
    }

    if (const auto* fmt = a["placeholder_format"].as_string()) {
        const auto parsed = ConfigLoader::parse_placeholder_format(fmt->get());
        if (parsed) {
            cfg.placeholder_format = *parsed;
        } else {
            out.errors.push_back(std::format(
                "anonymizer.placeholder_format must be numbered|uuid|hashed, got '{}'", fmt->get()));
        }
    }

    const int64_t ttl = a["vault_ttl_seconds"].value_or(int64_t{3600});
    if (ttl < 0) {
        out.errors.push_back(std::format("anonymizer.vault_ttl_seconds must be >= 0, got {}", ttl));
    } else {
        cfg.vault_ttl = std::chrono::seconds(ttl);
    }

    if (a["never_expire"].value_or(false)) {
        cfg.vault_ttl = std::nullopt;
    }
}

DetectorConfig extract_detector(const toml::table& root, Extracted& out) {
    DetectorConfig cfg;
    const auto* section = root["detector"].as_table();
    if (!section) return cfg;
    const auto& d = *section;

    const int64_t max_bytes = d["max_input_bytes"].value_or(static_cast<int64_t>(cfg.max_input_bytes));
    if (max_bytes <= 0) {
        out.errors.push_back(std::format("detector.max_input_bytes must be > 0, got {}", max_bytes));
    } else {
        cfg.max_input_bytes = static_cast<size_t>(max_bytes);
    }
    cfg.min_confidence = d["min_confidence"].value_or(cfg.min_confidence);
    return cfg;
}

VaultConfig extract_vault(const toml::table& root, Extracted& out) {
    VaultConfig cfg;
    const auto* section = root["vault"].as_table();
    if (!section) return cfg;
    const auto& v = *section;

    const int64_t max_sessions = v["max_sessions"].value_or(static_cast<int64_t>(cfg.max_sessions));
    if (max_sessions <= 0) {
        out.errors.push_back(std::format("vault.max_sessions must be > 0, got {}", max_sessions));
    } else {
        cfg.max_sessions = static_cast<size_t>(max_sessions);
    }

    const int64_t history = v["audit_history"].value_or(static_cast<int64_t>(cfg.audit_history));
    if (history < 0) {
        out.errors.push_back(std::format("vault.audit_history must be >= 0, got {}", history));
    } else {
        cfg.audit_history = static_cast<size_t>(history);
    }
    return cfg;
}

AuditConfig extract_audit(const toml::table& root, Extracted& out) {
    AuditConfig cfg;
    const auto* section = root["audit"].as_table();
    if (!section) return cfg;
    const auto& a = *section;

    cfg.enabled = a["enabled"].value_or(cfg.enabled);
    cfg.file = a["file"].value_or(cfg.file);

    const int64_t size_mb = a["max_file_size_mb"].value_or(static_cast<int64_t>(cfg.max_file_size_mb));
    if (size_mb <= 0) {
        out.errors.push_back(std::format("audit.max_file_size_mb must be > 0, got {}", size_mb));
    } else {
        cfg.max_file_size_mb = static_cast<size_t>(size_mb);
    }
    const int64_t max_files = a["max_files"].value_or(int64_t{cfg.max_files});
    if (max_files < 0 || max_files > kMaxAuditFiles) {
        out.errors.push_back(std::format("audit.max_files must be in [0, {}], got {}",
                                         kMaxAuditFiles, max_files));
    } else {
        cfg.max_files = static_cast<int>(max_files);
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* section = root["logging"].as_table();
    if (!section) return cfg;
    cfg.level = (*section)["level"].value_or("info"s);
    return cfg;
}

Extracted extract_all_sections(const toml::table& root) {
    Extracted out;
    extract_anonymizer(root, out);
    out.config.detector = extract_detector(root, out);
    out.config.vault = extract_vault(root, out);
    out.config.audit = extract_audit(root, out);
    out.config.logging = extract_logging(root);
    return out;
}

ConfigLoader::LoadResult validate_and_return(Extracted extracted) {
    auto errors = std::move(extracted.errors);
    for (auto& err : ConfigLoader::validate_config(extracted.config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(extracted.config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::optional<PlaceholderFormat> ConfigLoader::parse_placeholder_format(const std::string& name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "numbered") return PlaceholderFormat::NUMBERED;
    if (lower == "uuid") return PlaceholderFormat::UUID;
    if (lower == "hashed") return PlaceholderFormat::HASHED;
    return std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PiiShieldConfig& config) {
    std::vector<std::string> errors;

    if (config.anonymizer.entity_types.empty()) {
        errors.push_back("anonymizer.entity_types must name at least one entity type");
    }
    if (config.anonymizer.vault_ttl && config.anonymizer.vault_ttl->count() < 0) {
        errors.push_back(std::format("anonymizer.vault_ttl_seconds must be >= 0, got {}",
                                     config.anonymizer.vault_ttl->count()));
    }

    if (config.detector.max_input_bytes == 0) {
        errors.push_back("detector.max_input_bytes must be > 0");
    }
    if (config.detector.min_confidence < 0.0 || config.detector.min_confidence > 1.0) {
        errors.push_back(std::format("detector.min_confidence must be in [0, 1], got {}",
                                     config.detector.min_confidence));
    }

    if (config.vault.max_sessions == 0) {
        errors.push_back("vault.max_sessions must be > 0");
    }

    if (config.audit.max_files < 0) {
        errors.push_back(std::format("audit.max_files must be >= 0, got {}", config.audit.max_files));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace piishield
