#pragma once

#include "common.h"
#include "model/parameter.h"

#include <string>

namespace levelsplit {

/// A horizontal reference plane.  Owned by the document and immutable for
/// the duration of an export pass.
struct Level {
    ElementId   id = INVALID_ID;
    std::string name;
    double      elevation = 0.0;
    ParamMap    parameters; ///< LEVEL_IS_BUILDING_STORY, LEVEL_UP_TO_LEVEL.
};

enum class ViewType : unsigned char {
    FLOOR_PLAN,
    CEILING_PLAN,
    ENGINEERING_PLAN,
    SECTION,
    ELEVATION,
    THREE_D,
};

/// A model view.  Plan views carry the level that generated them and the
/// level their bottom clip plane is attached to.
struct View {
    ElementId id                = INVALID_ID;
    ViewType  type              = ViewType::FLOOR_PLAN;
    ElementId gen_level         = INVALID_ID;
    ElementId bottom_clip_level = INVALID_ID;
};

} // namespace levelsplit
