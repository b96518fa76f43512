#include "levels/level_catalog.h"

#include <algorithm>
#include <unordered_set>

namespace levelsplit {

std::vector<Level> find_all_levels(const Document& document) {
    std::vector<Level> all_levels = document.levels();
    std::sort(all_levels.begin(), all_levels.end(), LevelElevationOrder{});
    return all_levels;
}

bool is_building_story(const Level* level) {
    if (!level) return false;

    auto flag = find_int_param(level->parameters,
                               ParamId::LEVEL_IS_BUILDING_STORY);
    if (!flag) return true;

    return *flag != 0;
}

std::vector<ElementId> building_stories_by_elevation(const Document& document) {
    std::vector<ElementId> stories;
    for (const Level& level : find_all_levels(document)) {
        if (is_building_story(&level)) {
            stories.push_back(level.id);
        }
    }
    return stories;
}

std::unordered_map<ElementId, ElementId>
find_views_for_levels(const Document& document, ViewType view_type,
                      const std::vector<Level>& levels) {
    std::unordered_map<ElementId, ElementId> views_for_levels;
    if (levels.empty()) return views_for_levels;

    std::unordered_map<ElementId, ElementId> possible_views;
    std::unordered_set<ElementId> levels_to_find;
    for (const Level& level : levels) {
        levels_to_find.insert(level.id);
        possible_views[level.id] = INVALID_ID;
    }

    for (const View& view : document.views()) {
        if (view.type != view_type) continue;
        if (view.gen_level == INVALID_ID) continue;
        if (!levels_to_find.count(view.gen_level)) continue;

        // A view clipped at some other level is only a fallback.
        if (view.bottom_clip_level != view.gen_level) {
            possible_views[view.gen_level] = view.id;
            continue;
        }

        views_for_levels[view.gen_level] = view.id;
        levels_to_find.erase(view.gen_level);
    }

    for (ElementId level_id : levels_to_find) {
        views_for_levels[level_id] = possible_views[level_id];
    }

    return views_for_levels;
}

} // namespace levelsplit
