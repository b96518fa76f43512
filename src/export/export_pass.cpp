#include "export/export_pass.h"
#include "levels/level_catalog.h"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace levelsplit {

ExportPass::ExportPass(const Document& document, ExportOptions options)
    : document_{document}
    , options_{std::move(options)}
{
    std::vector<Level> stories;
    for (const Level& level : find_all_levels(document_)) {
        if (is_building_story(&level)) stories.push_back(level);
    }

    for (const auto& [level_id, view_id] :
         find_views_for_levels(document_, ViewType::FLOOR_PLAN, stories)) {
        if (view_id != INVALID_ID) {
            view_levels_[view_id] = level_id;
        }
    }

    spdlog::info("export pass: {} level(s), {} building stor{}, splitting {}",
                 document_.num_levels(), stories.size(),
                 stories.size() == 1 ? "y" : "ies",
                 options_.wall_and_column_splitting ? "on" : "off");
}

void ExportPass::seed_default_heights(
    const std::unordered_map<ElementId, double>& heights) {
    for (const auto& [level_id, height] : heights) {
        const Level* level = document_.find_level(level_id);
        if (!level) {
            spdlog::warn("default height for unknown level {}", level_id);
            continue;
        }
        cache_.add_level_info(level_id, level->elevation, height);
    }
}

void ExportPass::map_view_to_level(ElementId view_id, ElementId level_id) {
    view_levels_[view_id] = level_id;
}

SplitContext ExportPass::context() {
    return SplitContext{document_, cache_, view_levels_,
                        options_.wall_and_column_splitting};
}

LevelRanges ExportPass::split_element(const Element& element) {
    SplitContext ctx = context();
    return create_split_level_ranges(ctx, element);
}

LevelRanges ExportPass::split_element(const Element& element,
                                      const Range& z_span) {
    SplitContext ctx = context();
    return create_split_level_ranges(ctx, element, z_span);
}

ElementId ExportPass::base_level(const Element& element) const {
    return resolve_base_level(document_, element, view_levels_);
}

void ExportPass::reset() {
    cache_.clear();
}

} // namespace levelsplit
