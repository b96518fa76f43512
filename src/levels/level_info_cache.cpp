#include "levels/level_info_cache.h"
#include "levels/level_catalog.h"

#include <spdlog/spdlog.h>

namespace levelsplit {

// ── Population ──────────────────────────────────────────────────────

void LevelInfoCache::add_level_info(ElementId level_id, double elevation,
                                    double distance_to_next_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (registrations_.count(level_id)) {
        spdlog::warn("level {}: height already in use, ignoring default {}",
                     level_id, distance_to_next_level);
        return;
    }
    LevelInfo& info             = infos_[level_id];
    info.elevation              = elevation;
    info.distance_to_next_level = distance_to_next_level;
}

void LevelInfoCache::register_height(ElementId level_id,
                                     ElementId next_level_id,
                                     double height) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = registrations_.try_emplace(
        level_id, Registration{height, next_level_id});
    if (!inserted && it->second.height != height) {
        spdlog::debug("level {}: keeping height {} over {}",
                      level_id, it->second.height, height);
    }
}

void LevelInfoCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    infos_.clear();
    registrations_.clear();
    stories_.reset();
}

// ── Lookup ──────────────────────────────────────────────────────────

LevelInfo LevelInfoCache::compose(ElementId level_id, LevelInfo info) const {
    auto it = registrations_.find(level_id);
    if (it != registrations_.end()) {
        info.height        = it->second.height;
        info.next_level_id = it->second.next_level_id;
    }
    return info;
}

std::optional<LevelInfo>
LevelInfoCache::get_level_info(const Document& document, ElementId level_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = infos_.find(level_id);
    if (it == infos_.end()) {
        const Level* level = document.find_level(level_id);
        if (!level) return std::nullopt;

        LevelInfo info;
        info.elevation = level->elevation;
        it = infos_.emplace(level_id, info).first;
    }
    return compose(level_id, it->second);
}

std::optional<LevelInfo> LevelInfoCache::find_level_info(ElementId level_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = infos_.find(level_id);
    if (it == infos_.end()) return std::nullopt;
    return compose(level_id, it->second);
}

std::optional<double> LevelInfoCache::find_height(ElementId level_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(level_id);
    if (it == registrations_.end()) return std::nullopt;
    return it->second.height;
}

ElementId LevelInfoCache::find_next_level(ElementId level_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(level_id);
    if (it == registrations_.end()) return INVALID_ID;
    return it->second.next_level_id;
}

std::vector<ElementId>
LevelInfoCache::building_stories_by_elevation(const Document& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stories_) {
        stories_ = levelsplit::building_stories_by_elevation(document);
    }
    return *stories_;
}

std::size_t LevelInfoCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return infos_.size();
}

// ── Height calculation ──────────────────────────────────────────────

double calculate_distance_to_next_level(const Document& document,
                                        ElementId level_id,
                                        const LevelInfo* level_info,
                                        LevelInfoCache& cache) {
    double height = 0.0;
    ElementId next_level_id = INVALID_ID;

    if (const Level* level = document.find_level(level_id)) {
        auto up_to = find_id_param(level->parameters,
                                   ParamId::LEVEL_UP_TO_LEVEL);
        if (up_to) {
            const Level* next_level = document.find_level(*up_to);
            if (next_level && is_building_story(next_level)) {
                double net_elevation = next_level->elevation - level->elevation;
                if (net_elevation > 0.0) {
                    height        = net_elevation;
                    next_level_id = *up_to;
                }
            }
        }
    }

    if (height <= 0.0 && level_info) {
        height = level_info->distance_to_next_level;
    }

    cache.register_height(level_id, next_level_id, height);
    return cache.find_height(level_id).value_or(height);
}

} // namespace levelsplit
