#include "core/types.hpp"
#include "core/utils.hpp"

namespace piishield {

std::optional<EntityKind> entity_kind_from_string(std::string_view name) {
    const std::string upper = utils::to_upper(utils::trim(std::string(name)));
    for (const auto& info : detail::kKindTable) {
        if (info.name == upper || info.prefix == upper) {
            return info.kind;
        }
    }
    return std::nullopt;
}

} // namespace piishield
