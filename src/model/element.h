#pragma once

/// Building elements as seen by the exporter.
///
/// The element kind is a closed set; everything the level utilities need
/// to know about a particular kind is carried in its variant alternative.

#include "common.h"
#include "model/parameter.h"
#include "model/range.h"

#include <map>
#include <optional>
#include <string>
#include <variant>

namespace levelsplit {

// ── Element kinds ───────────────────────────────────────────────────

struct WallKind {};

/// A family instance.  Nested instances point at their top-level
/// containing instance.
struct FamilyInstanceKind {
    ElementId super_component = INVALID_ID;
};

struct TrussKind {};

struct StairsKind {
    bool legacy = false; ///< Stairs authored in the pre-component format.
};

struct ExtrusionRoofKind {};

/// Pipes, ducts, cable trays: curves that know their reference level.
struct MepCurveKind {
    ElementId reference_level = INVALID_ID;
};

struct OtherKind {};

using ElementKind = std::variant<OtherKind,
                                 WallKind,
                                 FamilyInstanceKind,
                                 TrussKind,
                                 StairsKind,
                                 ExtrusionRoofKind,
                                 MepCurveKind>;

// ── Export classification ───────────────────────────────────────────

enum class EntityType : unsigned char {
    UNKNOWN,
    IFC_BEAM,
    IFC_BUILDING_ELEMENT_PROXY,
    IFC_COLUMN,
    IFC_COLUMN_TYPE,
    IFC_DUCT_SEGMENT,
    IFC_DUCT_SEGMENT_TYPE,
    IFC_MEMBER,
    IFC_PIPE_SEGMENT,
    IFC_PIPE_SEGMENT_TYPE,
    IFC_ROOF,
    IFC_SLAB,
    IFC_STAIR,
    IFC_WALL,
    IFC_WALL_TYPE,
};

/// The entity an element is exported as, and the entity of its type object.
struct ExportType {
    EntityType instance = EntityType::UNKNOWN;
    EntityType type     = EntityType::UNKNOWN;
};

/// Parse an entity name as written in model files ("IfcWall", ...).
/// Unrecognised names map to UNKNOWN.
EntityType entity_type_from_name(const std::string& name);

// ── Element ─────────────────────────────────────────────────────────

struct Element {
    ElementId   id   = INVALID_ID;
    ElementKind kind = OtherKind{};

    /// Generic "level" attribute; may be INVALID_ID.
    ElementId level_id = INVALID_ID;

    bool      view_specific = false;
    ElementId owner_view    = INVALID_ID;

    ParamMap parameters;

    /// Vertical extent of the axis-aligned bounding box, if the element
    /// has geometry.
    std::optional<Range> bounding_z;

    ExportType export_type;

    /// Free-form string overrides keyed by override name.
    std::map<std::string, std::string> overrides;
};

} // namespace levelsplit
