#pragma once

#include "model/element.h"

#include <optional>
#include <string_view>

namespace levelsplit {

/// Composition of a spatial element (IfcElementCompositionEnum).
enum class ElementComposition : unsigned char { COMPLEX, ELEMENT, PARTIAL };

/// Case-insensitive parse of "Complex", "Element" or "Partial".
std::optional<ElementComposition> parse_element_composition(std::string_view text);

/// The composition requested by the element's "IfcElementCompositionType"
/// override.  ELEMENT when unset or unparseable.
ElementComposition element_composition_override(const Element& element);

const char* to_string(ElementComposition composition) noexcept;

} // namespace levelsplit
