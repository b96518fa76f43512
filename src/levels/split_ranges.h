#pragma once

/// Level-based splitting of vertically extended elements.
///
/// Columns, walls and duct segments that span several building stories
/// are exported as one fragment per story.  This module computes the
/// vertical ranges of those fragments; cutting the geometry is done by
/// the caller.
///
/// The stories are walked once, bottom to top, starting at the element's
/// base level.  All boundary tests allow LEVEL_EXTENSION of slack.  The
/// produced ranges are ordered by start, do not overlap, and each has
/// strictly positive length.

#include "common.h"
#include "levels/base_level.h"
#include "levels/level_info_cache.h"
#include "model/document.h"
#include "model/element.h"
#include "model/range.h"

#include <cstddef>
#include <vector>

namespace levelsplit {

/// Parallel sequences: ranges[i] belongs to levels[i].
struct LevelRanges {
    std::vector<ElementId> levels;
    std::vector<Range>     ranges;

    std::size_t size()  const noexcept { return ranges.size(); }
    bool        empty() const noexcept { return ranges.empty(); }
};

/// Loop state carried from one story to the next.
struct SplitState {
    /// Base level of the element; INVALID_ID starts at the lowest story.
    ElementId first_level_id     = INVALID_ID;
    bool      found_first_level  = true;

    /// Set when the previous story extends "up to" a specific level;
    /// every story until that one is skipped.
    ElementId skip_to_next_level = INVALID_ID;

    bool      first_fragment     = true;
};

/// What to do with one story.
enum class LevelAction : unsigned char {
    SKIP,            ///< No fragment here; keep walking.
    APPEND,          ///< Emit `span`; keep walking.
    APPEND_AND_STOP, ///< Emit `span`; it is the last fragment.
};

struct LevelStep {
    LevelAction action = LevelAction::SKIP;
    Range       span;
};

/// Everything the splitter reads, scoped to one export pass.
struct SplitContext {
    const Document&     document;
    LevelInfoCache&     cache;
    const ViewLevelMap& view_levels;
    bool                split_by_level = false;
};

/// True for the export classifications that are split by level:
/// column and wall instances, duct segment types.
bool splits_by_level(const ExportType& export_type) noexcept;

/// Initial loop state for an element anchored at `base_level_id`.
SplitState initial_split_state(ElementId base_level_id) noexcept;

/// Decide the fragment for one story.  Updates `state`; `last` is the
/// previously emitted fragment, if any.
LevelStep split_at_level(const Document& document, LevelInfoCache& cache,
                         SplitState& state, ElementId level_id,
                         const Range& z_span, const Range* last);

/// Split an element over the given vertical extent.
LevelRanges create_split_level_ranges(SplitContext& context,
                                      const Element& element,
                                      const Range& z_span);

/// Split an element over the vertical extent of its bounding box.
/// Elements without geometry produce no ranges.
LevelRanges create_split_level_ranges(SplitContext& context,
                                      const Element& element);

} // namespace levelsplit
