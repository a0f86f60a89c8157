#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <memory>
#include <vector>

namespace piishield {

// Forward declarations
class IClock;
class IEntityDetector;
class IVaultStorage;
class IAuditSink;
class AuditLog;
class Anonymizer;

/**
 * @brief Everything a running engine consists of, wired together
 */
struct EngineComponents {
    std::shared_ptr<IClock> clock;
    std::shared_ptr<AuditLog> audit;
    std::shared_ptr<IEntityDetector> detector;
    std::shared_ptr<IVaultStorage> vault;
    std::shared_ptr<Anonymizer> anonymizer;
};

/**
 * @brief Builds an engine from a loaded PiiShieldConfig.
 *
 * Usage:
 *   auto loaded = ConfigLoader::load_from_file("pii_shield.toml");
 *   auto engine = EngineBuilder(loaded.config)
 *       .with_clock(clock)          // optional, default SystemClock
 *       .with_detector(detector)    // optional, default RegexDetector
 *       .with_vault(vault)          // optional, default MemoryVault
 *       .build();
 *
 * A custom vault brings its own audit wiring; the built-in one records
 * into the returned AuditLog.
 */
class EngineBuilder {
public:
    explicit EngineBuilder(PiiShieldConfig config) : config_(std::move(config)) {}

    EngineBuilder& with_clock(std::shared_ptr<IClock> p)              { clock_ = std::move(p); return *this; }
    EngineBuilder& with_detector(std::shared_ptr<IEntityDetector> p)  { detector_ = std::move(p); return *this; }
    EngineBuilder& with_vault(std::shared_ptr<IVaultStorage> p)       { vault_ = std::move(p); return *this; }
    EngineBuilder& with_audit_sink(std::shared_ptr<IAuditSink> p)     { sinks_.push_back(std::move(p)); return *this; }

    /**
     * @brief Validate the config, apply the log level and wire the components
     * CONFIG_ERROR on an invalid config or an audit file that cannot be opened.
     */
    [[nodiscard]] Result<EngineComponents> build();

private:
    PiiShieldConfig config_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IEntityDetector> detector_;
    std::shared_ptr<IVaultStorage> vault_;
    std::vector<std::shared_ptr<IAuditSink>> sinks_;
};

} // namespace piishield
