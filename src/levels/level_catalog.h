#pragma once

/// Ordered views over the levels of a document.
///
/// Levels are ordered by elevation.  Floating elevations may tie exactly,
/// so ties are broken by ascending element id; the order is total and
/// deterministic for any document.

#include "common.h"
#include "model/document.h"
#include "model/level.h"

#include <unordered_map>
#include <vector>

namespace levelsplit {

/// Strict weak order on (elevation, id).
struct LevelElevationOrder {
    bool operator()(const Level& a, const Level& b) const noexcept {
        if (a.elevation != b.elevation) return a.elevation < b.elevation;
        return a.id < b.id;
    }
};

/// All levels of the document, ascending by elevation.
std::vector<Level> find_all_levels(const Document& document);

/// True if the level is a building story.  A level without the story
/// flag counts as a story; a missing level does not.
bool is_building_story(const Level* level);

/// Ids of the building stories, ascending by elevation.
std::vector<ElementId> building_stories_by_elevation(const Document& document);

/// For each level, find a representative plan view of type `view_type`.
///
/// A view generated by the level whose bottom clip plane is the level
/// itself is preferred.  Otherwise any view generated by the level is used.
/// Levels without a view map to INVALID_ID.  An empty level list yields an
/// empty map.
std::unordered_map<ElementId, ElementId>
find_views_for_levels(const Document& document, ViewType view_type,
                      const std::vector<Level>& levels);

/// Allowed overflow into the next level when splitting by level.
inline constexpr double level_extension() noexcept { return LEVEL_EXTENSION; }

} // namespace levelsplit
