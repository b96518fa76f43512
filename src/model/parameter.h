#pragma once

/// Named element attributes.
///
/// The host model exposes attributes through a fixed, stable set of
/// identifiers.  Only the ones the level utilities read are listed here.

#include "common.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace levelsplit {

enum class ParamId : unsigned char {
    WALL_BASE_CONSTRAINT,
    FAMILY_BASE_LEVEL,               ///< In-place family base level.
    INSTANCE_SCHEDULE_ONLY_LEVEL,
    INSTANCE_REFERENCE_LEVEL,
    TRUSS_REFERENCE_LEVEL,
    STAIRS_BASE_LEVEL,
    ROOF_CONSTRAINT_LEVEL,
    LEVEL_IS_BUILDING_STORY,
    LEVEL_UP_TO_LEVEL,
};

/// A parameter value.  The alternative held is the parameter's storage type.
using ParamValue = std::variant<ElementId, int, double, std::string>;

using ParamMap = std::unordered_map<ParamId, ParamValue>;

/// Look up a parameter holding an element id.  Returns nullopt if the
/// parameter is absent or stores something other than an element id.
inline std::optional<ElementId> find_id_param(const ParamMap& params,
                                              ParamId id) {
    auto it = params.find(id);
    if (it == params.end()) return std::nullopt;
    if (const ElementId* value = std::get_if<ElementId>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

/// Look up a parameter holding an integer.
inline std::optional<int> find_int_param(const ParamMap& params,
                                         ParamId id) {
    auto it = params.find(id);
    if (it == params.end()) return std::nullopt;
    if (const int* value = std::get_if<int>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

/// Parse a parameter name as it appears in model files
/// ("WALL_BASE_CONSTRAINT", ...).
std::optional<ParamId> param_id_from_name(std::string_view name);

} // namespace levelsplit
