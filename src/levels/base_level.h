#pragma once

/// Base-level resolution: which level anchors an element.
///
/// Order of the search (first match wins):
///   1. view-specific elements take the level of their owner view;
///   2. kind-specific level parameters, in priority order;
///   3. the reference level of MEP curves;
///   4. the element's generic level attribute (possibly INVALID_ID).
///
/// Never throws for missing data; INVALID_ID means "no base level known".
/// Failures of the document itself (ModelError) propagate.

#include "common.h"
#include "model/document.h"
#include "model/element.h"
#include "model/parameter.h"

#include <unordered_map>
#include <vector>

namespace levelsplit {

/// View id -> level id for the views being exported.
using ViewLevelMap = std::unordered_map<ElementId, ElementId>;

/// Level parameters to consult for an element kind, highest priority first.
std::vector<ParamId> level_param_priority(const ElementKind& kind);

/// First parameter in `priority` that holds a valid level id, or
/// INVALID_ID.
ElementId first_valid_level_param(const ParamMap& params,
                                  const std::vector<ParamId>& priority);

ElementId resolve_base_level(const Document& document,
                             const Element& element,
                             const ViewLevelMap& view_levels);

} // namespace levelsplit
