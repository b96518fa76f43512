#include "model/element.h"

#include <array>
#include <string_view>
#include <utility>

namespace levelsplit {

EntityType entity_type_from_name(const std::string& name) {
    static constexpr std::array<std::pair<std::string_view, EntityType>, 14>
        names{{
            {"IfcBeam",                 EntityType::IFC_BEAM},
            {"IfcBuildingElementProxy", EntityType::IFC_BUILDING_ELEMENT_PROXY},
            {"IfcColumn",               EntityType::IFC_COLUMN},
            {"IfcColumnType",           EntityType::IFC_COLUMN_TYPE},
            {"IfcDuctSegment",          EntityType::IFC_DUCT_SEGMENT},
            {"IfcDuctSegmentType",      EntityType::IFC_DUCT_SEGMENT_TYPE},
            {"IfcMember",               EntityType::IFC_MEMBER},
            {"IfcPipeSegment",          EntityType::IFC_PIPE_SEGMENT},
            {"IfcPipeSegmentType",      EntityType::IFC_PIPE_SEGMENT_TYPE},
            {"IfcRoof",                 EntityType::IFC_ROOF},
            {"IfcSlab",                 EntityType::IFC_SLAB},
            {"IfcStair",                EntityType::IFC_STAIR},
            {"IfcWall",                 EntityType::IFC_WALL},
            {"IfcWallType",             EntityType::IFC_WALL_TYPE},
        }};

    for (const auto& [text, type] : names) {
        if (text == name) return type;
    }
    return EntityType::UNKNOWN;
}

} // namespace levelsplit
