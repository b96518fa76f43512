#include "model/parameter.h"

#include <array>
#include <utility>

namespace levelsplit {

std::optional<ParamId> param_id_from_name(std::string_view name) {
    static constexpr std::array<std::pair<std::string_view, ParamId>, 9>
        names{{
            {"WALL_BASE_CONSTRAINT",         ParamId::WALL_BASE_CONSTRAINT},
            {"FAMILY_BASE_LEVEL",            ParamId::FAMILY_BASE_LEVEL},
            {"INSTANCE_SCHEDULE_ONLY_LEVEL", ParamId::INSTANCE_SCHEDULE_ONLY_LEVEL},
            {"INSTANCE_REFERENCE_LEVEL",     ParamId::INSTANCE_REFERENCE_LEVEL},
            {"TRUSS_REFERENCE_LEVEL",        ParamId::TRUSS_REFERENCE_LEVEL},
            {"STAIRS_BASE_LEVEL",            ParamId::STAIRS_BASE_LEVEL},
            {"ROOF_CONSTRAINT_LEVEL",        ParamId::ROOF_CONSTRAINT_LEVEL},
            {"LEVEL_IS_BUILDING_STORY",      ParamId::LEVEL_IS_BUILDING_STORY},
            {"LEVEL_UP_TO_LEVEL",            ParamId::LEVEL_UP_TO_LEVEL},
        }};

    for (const auto& [text, id] : names) {
        if (text == name) return id;
    }
    return std::nullopt;
}

} // namespace levelsplit
