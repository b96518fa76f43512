#include "levels/base_level.h"

#include <spdlog/spdlog.h>

#include <type_traits>
#include <variant>

namespace levelsplit {

std::vector<ParamId> level_param_priority(const ElementKind& kind) {
    return std::visit([](const auto& k) -> std::vector<ParamId> {
        using K = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<K, WallKind>) {
            return {ParamId::WALL_BASE_CONSTRAINT};
        } else if constexpr (std::is_same_v<K, FamilyInstanceKind>) {
            // In-place families first, then the two scheduling levels of
            // loadable families.
            return {ParamId::FAMILY_BASE_LEVEL,
                    ParamId::INSTANCE_SCHEDULE_ONLY_LEVEL,
                    ParamId::INSTANCE_REFERENCE_LEVEL};
        } else if constexpr (std::is_same_v<K, TrussKind>) {
            return {ParamId::TRUSS_REFERENCE_LEVEL};
        } else if constexpr (std::is_same_v<K, StairsKind>) {
            return {ParamId::STAIRS_BASE_LEVEL};
        } else if constexpr (std::is_same_v<K, ExtrusionRoofKind>) {
            return {ParamId::ROOF_CONSTRAINT_LEVEL};
        } else {
            return {};
        }
    }, kind);
}

ElementId first_valid_level_param(const ParamMap& params,
                                  const std::vector<ParamId>& priority) {
    for (ParamId param : priority) {
        auto level_id = find_id_param(params, param);
        if (level_id && *level_id != INVALID_ID) {
            return *level_id;
        }
    }
    return INVALID_ID;
}

namespace {

/// Nested family instances carry their level on the top-level instance.
const Element& element_to_check(const Document& document,
                                const Element& element) {
    const auto* instance = std::get_if<FamilyInstanceKind>(&element.kind);
    if (!instance || instance->super_component == INVALID_ID) {
        return element;
    }
    const Element* super = document.find_element(instance->super_component);
    return super ? *super : element;
}

} // namespace

ElementId resolve_base_level(const Document& document,
                             const Element& element,
                             const ViewLevelMap& view_levels) {
    if (element.view_specific) {
        auto it = view_levels.find(element.owner_view);
        if (it != view_levels.end()) {
            return it->second;
        }
    }

    const Element& checked = element_to_check(document, element);
    ElementId level_id = first_valid_level_param(
        checked.parameters, level_param_priority(element.kind));
    if (level_id != INVALID_ID) {
        return level_id;
    }

    if (const auto* curve = std::get_if<MepCurveKind>(&element.kind)) {
        if (curve->reference_level != INVALID_ID
            && document.find_level(curve->reference_level)) {
            return curve->reference_level;
        }
    }

    if (element.level_id == INVALID_ID) {
        spdlog::trace("element {}: no base level", element.id);
    }
    return element.level_id;
}

} // namespace levelsplit
