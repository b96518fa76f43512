#pragma once

/// One export pass over a document.
///
/// Owns everything whose lifetime is "one pass": the options read at the
/// start, the level-info cache and the view -> level map used for
/// view-specific elements.  Start a new pass (or call reset()) when the
/// document changes.

#include "common.h"
#include "export/export_options.h"
#include "levels/base_level.h"
#include "levels/level_info_cache.h"
#include "levels/split_ranges.h"
#include "model/document.h"
#include "model/element.h"
#include "model/range.h"

#include <unordered_map>

namespace levelsplit {

class ExportPass {
public:
    /// Builds the view -> level map from the floor plans of every
    /// building story.
    ExportPass(const Document& document, ExportOptions options);

    ExportPass(const ExportPass&)            = delete;
    ExportPass& operator=(const ExportPass&) = delete;

    /// Supply host-computed default heights, keyed by level id.
    /// Ids that are not levels of the document are ignored, as are levels
    /// whose height an earlier split already fixed.
    void seed_default_heights(const std::unordered_map<ElementId, double>& heights);

    /// Associate a view with a level for view-specific elements.
    void map_view_to_level(ElementId view_id, ElementId level_id);

    /// Fragments of an element over its bounding box extent.
    LevelRanges split_element(const Element& element);

    /// Fragments of an element over an explicit extent.
    LevelRanges split_element(const Element& element, const Range& z_span);

    ElementId base_level(const Element& element) const;

    /// Drop cached level info, seeded default heights included.  The next
    /// split repopulates it from the document.
    void reset();

    const ExportOptions&  options()          const noexcept { return options_; }
    const ViewLevelMap&   view_levels()      const noexcept { return view_levels_; }
    LevelInfoCache&       level_info_cache()       noexcept { return cache_; }
    const LevelInfoCache& level_info_cache() const noexcept { return cache_; }

private:
    SplitContext context();

    const Document& document_;
    ExportOptions   options_;
    LevelInfoCache  cache_;
    ViewLevelMap    view_levels_;
};

} // namespace levelsplit
