#include "levels/split_ranges.h"
#include "levels/level_catalog.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace levelsplit {

bool splits_by_level(const ExportType& export_type) noexcept {
    return export_type.instance == EntityType::IFC_COLUMN
        || export_type.instance == EntityType::IFC_WALL
        || export_type.type     == EntityType::IFC_DUCT_SEGMENT_TYPE;
}

SplitState initial_split_state(ElementId base_level_id) noexcept {
    SplitState state;
    state.first_level_id    = base_level_id;
    state.found_first_level = (base_level_id == INVALID_ID);
    return state;
}

// ── One story ───────────────────────────────────────────────────────

LevelStep split_at_level(const Document& document, LevelInfoCache& cache,
                         SplitState& state, ElementId level_id,
                         const Range& z_span, const Range* last) {
    const LevelStep skip{LevelAction::SKIP, {}};

    // Stories below the base level are not considered.
    if (!state.found_first_level) {
        if (level_id != state.first_level_id) return skip;
        state.found_first_level = true;
    }

    if (state.skip_to_next_level != INVALID_ID
        && level_id != state.skip_to_next_level) {
        return skip;
    }

    auto level_info = cache.get_level_info(document, level_id);
    if (!level_info) return skip;

    const double extension = level_extension();
    const double elevation = level_info->elevation;

    // Ends below this level.
    if (z_span.end < elevation + extension) {
        spdlog::trace("level {}: span ends below {}", level_id, elevation);
        return skip;
    }

    double height = level_info->height
        ? *level_info->height
        : calculate_distance_to_next_level(document, level_id,
                                           &*level_info, cache);
    state.skip_to_next_level = cache.find_next_level(level_id);

    // A zero height means the level extends indefinitely upwards.
    const bool has_height = !is_almost_zero(height);

    // Starts above this level.
    if (has_height && z_span.start > elevation + height - extension) {
        spdlog::trace("level {}: span starts above {}", level_id,
                      elevation + height);
        return skip;
    }

    const bool start_below_level = !state.first_fragment
        && z_span.start < elevation - extension;
    const bool end_above_level = has_height
        && z_span.end > elevation + height + extension;

    // Anything below an explicit base level stays with the base level.
    // Without one the walk starts at the lowest story and is clipped there.
    const bool clip_start = z_span.start < elevation - extension
        && (start_below_level || state.first_level_id == INVALID_ID);

    Range current{
        clip_start ? elevation : z_span.start,
        end_above_level ? elevation + height : z_span.end,
    };

    // Neither boundary crosses the band: this is the last fragment.
    const bool is_last = !start_below_level && !end_above_level;

    if (last) {
        if (last->end >= current.end - extension) {
            spdlog::debug("level {}: dropping fragment [{}, {}] behind {}",
                          level_id, current.start, current.end, last->end);
            return skip;
        }
        current.start = std::max(current.start, last->end);
    }

    state.first_fragment = false;
    return {is_last ? LevelAction::APPEND_AND_STOP : LevelAction::APPEND,
            current};
}

// ── Whole element ───────────────────────────────────────────────────

LevelRanges create_split_level_ranges(SplitContext& context,
                                      const Element& element,
                                      const Range& z_span) {
    LevelRanges result;

    if (!context.split_by_level) return result;
    if (!splits_by_level(element.export_type)) return result;
    if (!(z_span.start < z_span.end)) return result;

    SplitState state = initial_split_state(
        resolve_base_level(context.document, element, context.view_levels));

    const std::vector<ElementId> stories =
        context.cache.building_stories_by_elevation(context.document);

    for (ElementId level_id : stories) {
        const Range* last = result.empty() ? nullptr : &result.ranges.back();
        LevelStep step = split_at_level(context.document, context.cache,
                                        state, level_id, z_span, last);

        if (step.action == LevelAction::APPEND
            || step.action == LevelAction::APPEND_AND_STOP) {
            result.ranges.push_back(step.span);
            result.levels.push_back(level_id);
        }
        if (step.action == LevelAction::APPEND_AND_STOP) break;
    }

    spdlog::debug("element {}: {} fragment(s)", element.id, result.size());
    return result;
}

LevelRanges create_split_level_ranges(SplitContext& context,
                                      const Element& element) {
    if (!element.bounding_z) return {};
    return create_split_level_ranges(context, element, *element.bounding_z);
}

} // namespace levelsplit
