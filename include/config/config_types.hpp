#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace piishield {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct DetectorConfig {
    size_t max_input_bytes = 1024 * 1024;   // 1MB
    double min_confidence = 0.0;
};

struct VaultConfig {
    size_t max_sessions = 100000;
    size_t audit_history = 10000;           // Events kept in memory
};

struct AuditConfig {
    bool enabled = true;                    // false = no sink output
    std::string file = "audit.jsonl";       // empty = no file sink
    size_t max_file_size_mb = 100;
    int max_files = 10;
};

struct LoggingConfig {
    std::string level = "info";
};

struct PiiShieldConfig {
    AnonymizerConfig anonymizer;
    DetectorConfig detector;
    VaultConfig vault;
    AuditConfig audit;
    LoggingConfig logging;
};

} // namespace piishield
