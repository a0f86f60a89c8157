#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace piishield {

/**
 * @brief Find placeholder tokens of the given surface syntax, ordered by start
 *
 * Only tokens whose prefix names a known entity kind count; any other
 * bracketed text is left alone.
 */
[[nodiscard]] std::vector<Placeholder> find_placeholders(std::string_view text,
                                                         PlaceholderFormat format);

/**
 * @brief Split a NUMBERED token ("[EMAIL_3]") into its kind and counter
 */
[[nodiscard]] std::optional<std::pair<EntityKind, uint64_t>> parse_numbered_counter(
    std::string_view placeholder);

} // namespace piishield
