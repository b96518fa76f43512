#include "model/document.h"
#include "model/model_error.h"

#include <string>
#include <utility>

namespace levelsplit {

// ── Construction ────────────────────────────────────────────────────

void Document::claim_id(ElementId id) {
    check_open();
    if (id == INVALID_ID) {
        throw ModelError("element id " + std::to_string(id) + " is reserved");
    }
    if (level_index_.count(id) || view_index_.count(id)
        || element_index_.count(id)) {
        throw ModelError("duplicate element id " + std::to_string(id));
    }
}

void Document::add_level(Level level) {
    claim_id(level.id);
    level_index_.emplace(level.id, levels_.size());
    levels_.push_back(std::move(level));
}

void Document::add_view(View view) {
    claim_id(view.id);
    view_index_.emplace(view.id, views_.size());
    views_.push_back(view);
}

void Document::add_element(Element element) {
    claim_id(element.id);
    element_index_.emplace(element.id, elements_.size());
    elements_.push_back(std::move(element));
}

// ── Queries ─────────────────────────────────────────────────────────

void Document::check_open() const {
    if (closed_) {
        throw ModelError("document is closed");
    }
}

const std::vector<Level>& Document::levels() const {
    check_open();
    return levels_;
}

const std::vector<View>& Document::views() const {
    check_open();
    return views_;
}

const std::vector<Element>& Document::elements() const {
    check_open();
    return elements_;
}

const Level* Document::find_level(ElementId id) const {
    check_open();
    auto it = level_index_.find(id);
    return it == level_index_.end() ? nullptr : &levels_[it->second];
}

const View* Document::find_view(ElementId id) const {
    check_open();
    auto it = view_index_.find(id);
    return it == view_index_.end() ? nullptr : &views_[it->second];
}

const Element* Document::find_element(ElementId id) const {
    check_open();
    auto it = element_index_.find(id);
    return it == element_index_.end() ? nullptr : &elements_[it->second];
}

const Level& Document::level(ElementId id) const {
    const Level* found = find_level(id);
    if (!found) {
        throw ModelError("no level with id " + std::to_string(id));
    }
    return *found;
}

const Element& Document::element(ElementId id) const {
    const Element* found = find_element(id);
    if (!found) {
        throw ModelError("no element with id " + std::to_string(id));
    }
    return *found;
}

} // namespace levelsplit
