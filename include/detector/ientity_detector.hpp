#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace piishield {

/**
 * @brief Abstract entity detector
 *
 * Regex-based detection today; model-based detectors plug in behind the
 * same contract without touching the Anonymizer.
 *
 * Implementations must be safe for concurrent detect() calls and return
 * non-overlapping matches ordered by start offset.
 */
class IEntityDetector {
public:
    virtual ~IEntityDetector() = default;

    [[nodiscard]] virtual Result<std::vector<EntityMatch>> detect(std::string_view text) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace piishield
