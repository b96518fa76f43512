#pragma once

/// Per-pass cache of derived level metadata.
///
/// Computing a level's height to the next level needs a model query, and
/// every element that shares a level must see the same height within one
/// export pass.  Heights are therefore registered once and the first
/// registration is authoritative; later conflicting writes are ignored.
///
/// One cache is created per export pass and cleared (or dropped) before
/// the next.  All members lock an internal mutex, so per-element work may
/// run on several threads against one cache.

#include "common.h"
#include "model/document.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace levelsplit {

/// Derived data for one level.
struct LevelInfo {
    double elevation = 0.0;

    /// Default height supplied by the host before any "up to level"
    /// resolution.  0 when nothing was supplied.
    double distance_to_next_level = 0.0;

    /// Registered height to the next level; nullopt until computed.
    std::optional<double> height;

    /// Level the height was measured to, or INVALID_ID.
    ElementId next_level_id = INVALID_ID;
};

class LevelInfoCache {
public:
    LevelInfoCache() = default;

    LevelInfoCache(const LevelInfoCache&)            = delete;
    LevelInfoCache& operator=(const LevelInfoCache&) = delete;

    // ── Population ──────────────────────────────────────────────

    /// Seed a level with its elevation and a default height.  Replaces an
    /// earlier default until a height is registered for the level; after
    /// that the call is ignored with a warning.
    void add_level_info(ElementId level_id, double elevation,
                        double distance_to_next_level);

    /// Record the height from `level_id` to `next_level_id`.  If a height
    /// is already registered for the level, it wins and this call has no
    /// effect.
    void register_height(ElementId level_id, ElementId next_level_id,
                         double height);

    /// Drop everything, including the cached story order.
    void clear();

    // ── Lookup ──────────────────────────────────────────────────

    /// Info for a level, created from the document on first request.
    /// Returns nullopt if the id does not name a level of the document.
    std::optional<LevelInfo> get_level_info(const Document& document,
                                            ElementId level_id);

    /// Info for a level without touching the document.
    std::optional<LevelInfo> find_level_info(ElementId level_id) const;

    /// Registered height, or nullopt if not yet known.
    std::optional<double> find_height(ElementId level_id) const;

    /// Registered next level, or INVALID_ID.
    ElementId find_next_level(ElementId level_id) const;

    /// Building-story ids ascending by elevation.  Derived from the
    /// document on first call and reused for the rest of the pass.
    std::vector<ElementId> building_stories_by_elevation(const Document& document);

    std::size_t size() const;

private:
    struct Registration {
        double    height        = 0.0;
        ElementId next_level_id = INVALID_ID;
    };

    LevelInfo compose(ElementId level_id, LevelInfo info) const;

    mutable std::mutex mutex_;
    std::unordered_map<ElementId, LevelInfo>    infos_;
    std::unordered_map<ElementId, Registration> registrations_;
    std::optional<std::vector<ElementId>>       stories_;
};

/// Height from a level to the level named by its "up to level" parameter.
///
/// The named level must be a building story strictly above this one;
/// otherwise the level's default height is used (0 if unknown).  The
/// result is registered in the cache and the cache's authoritative value
/// is returned.
double calculate_distance_to_next_level(const Document& document,
                                        ElementId level_id,
                                        const LevelInfo* level_info,
                                        LevelInfoCache& cache);

} // namespace levelsplit
