#pragma once

/// JSON model files.
///
/// A model file describes one building:
///
///   {
///     "levels": [
///       { "id": 1, "name": "Level 1", "elevation": 0.0,
///         "isBuildingStory": true, "upToLevel": 2, "defaultHeight": 10.0 }
///     ],
///     "views": [
///       { "id": 100, "type": "FloorPlan", "genLevel": 1, "bottomClipLevel": 1 }
///     ],
///     "elements": [
///       { "id": 500, "kind": "wall", "level": 1,
///         "exportAs": "IfcWall", "exportType": "IfcWallType",
///         "boundingBox": { "minZ": -1.0, "maxZ": 25.0 },
///         "parameters": { "WALL_BASE_CONSTRAINT": 1 },
///         "overrides": { "IfcElementCompositionType": "Element" } }
///     ]
///   }
///
/// Element kinds: "wall", "familyInstance" (optional "superComponent"),
/// "truss", "stairs" (optional "legacy"), "extrusionRoof", "mepCurve"
/// (optional "referenceLevel"), "other".  Integer parameter values are
/// element ids.

#include "common.h"
#include "model/document.h"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <unordered_map>

namespace levelsplit {

struct ModelFile {
    Document document;

    /// "defaultHeight" of each level that has one.
    std::unordered_map<ElementId, double> default_heights;
};

/// Build a model from parsed JSON.  Throws ModelError on malformed input.
ModelFile parse_model(const nlohmann::json& model_json);

/// Read a model file.  Throws ModelError if it cannot be read or parsed.
ModelFile read_model(const std::string& path);

} // namespace levelsplit
