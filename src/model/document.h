#pragma once

/// In-memory host model: the levels, views and elements of one building.
///
/// Lookups that return pointers treat an unknown id as ordinary absence
/// (nullptr).  Lookups that return references, and every query made after
/// close(), throw ModelError.

#include "common.h"
#include "model/element.h"
#include "model/level.h"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace levelsplit {

class Document {
public:
    Document() = default;

    // ── Construction ────────────────────────────────────────────

    /// Add a level.  Throws ModelError if the id is invalid or taken.
    void add_level(Level level);
    void add_view(View view);
    void add_element(Element element);

    /// Mark the document unreadable.  Every later query throws.
    void close() noexcept { closed_ = true; }
    bool is_closed() const noexcept { return closed_; }

    // ── Queries ─────────────────────────────────────────────────

    /// All levels, in insertion order.
    const std::vector<Level>&   levels()   const;
    const std::vector<View>&    views()    const;
    const std::vector<Element>& elements() const;

    const Level*   find_level(ElementId id)   const;
    const View*    find_view(ElementId id)    const;
    const Element* find_element(ElementId id) const;

    const Level&   level(ElementId id)   const;
    const Element& element(ElementId id) const;

    std::size_t num_levels()   const noexcept { return levels_.size(); }
    std::size_t num_elements() const noexcept { return elements_.size(); }

private:
    void check_open() const;
    void claim_id(ElementId id);

    std::vector<Level>   levels_;
    std::vector<View>    views_;
    std::vector<Element> elements_;

    /// id -> position in the owning vector above.
    std::unordered_map<ElementId, std::size_t> level_index_;
    std::unordered_map<ElementId, std::size_t> view_index_;
    std::unordered_map<ElementId, std::size_t> element_index_;

    bool closed_ = false;
};

} // namespace levelsplit
