#include "anonymizer/engine_builder.hpp"
#include "anonymizer/anonymizer.hpp"
#include "audit/audit_log.hpp"
#include "audit/file_sink.hpp"
#include "config/config_loader.hpp"
#include "core/clock.hpp"
#include "core/utils.hpp"
#include "detector/regex_detector.hpp"
#include "vault/memory_vault.hpp"

#include <format>
#include <stdexcept>

namespace piishield {

Result<EngineComponents> EngineBuilder::build() {
    const auto errors = ConfigLoader::validate_config(config_);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return Result<EngineComponents>::error(ErrorCategory::CONFIG_ERROR, std::move(combined));
    }

    if (const auto level = utils::log::parse_level(config_.logging.level)) {
        utils::log::set_level(*level);
    }

    EngineComponents c;
    c.clock = clock_ ? clock_ : std::make_shared<SystemClock>();

    AuditLog::Config audit_cfg;
    audit_cfg.max_history = config_.vault.audit_history;
    audit_cfg.sinks_enabled = config_.audit.enabled;
    c.audit = std::make_shared<AuditLog>(audit_cfg);

    if (config_.audit.enabled && !config_.audit.file.empty()) {
        FileSink::Config sink_cfg;
        sink_cfg.output_file = config_.audit.file;
        sink_cfg.max_file_size_bytes = config_.audit.max_file_size_mb * 1024 * 1024;
        sink_cfg.max_files = config_.audit.max_files;
        try {
            c.audit->add_sink(std::make_shared<FileSink>(sink_cfg));
        } catch (const std::runtime_error& e) {
            return Result<EngineComponents>::error(ErrorCategory::CONFIG_ERROR, e.what());
        }
    }
    for (auto& sink : sinks_) {
        c.audit->add_sink(std::move(sink));
    }
    sinks_.clear();

    if (detector_) {
        c.detector = detector_;
    } else {
        RegexDetector::Config det_cfg;
        det_cfg.enabled_kinds = config_.anonymizer.entity_types;
        det_cfg.max_input_bytes = config_.detector.max_input_bytes;
        det_cfg.min_confidence = config_.detector.min_confidence;
        try {
            c.detector = std::make_shared<RegexDetector>(det_cfg);
        } catch (const std::regex_error& e) {
            return Result<EngineComponents>::error(ErrorCategory::DETECTOR_ERROR,
                std::format("Failed to compile detection rules: {}", e.what()));
        }
    }

    if (vault_) {
        c.vault = vault_;
    } else {
        MemoryVault::Config vault_cfg;
        vault_cfg.max_sessions = config_.vault.max_sessions;
        c.vault = std::make_shared<MemoryVault>(vault_cfg, c.clock, c.audit);
    }

    c.anonymizer = std::make_shared<Anonymizer>(config_.anonymizer, c.detector, c.vault, c.clock);

    utils::log::info(std::format("PII engine ready: detector={}, format={}, ttl={}",
        c.detector->name(),
        placeholder_format_to_string(config_.anonymizer.placeholder_format),
        config_.anonymizer.vault_ttl
            ? std::format("{}s", config_.anonymizer.vault_ttl->count())
            : std::string("never")));

    return Result<EngineComponents>::ok(std::move(c));
}

} // namespace piishield
