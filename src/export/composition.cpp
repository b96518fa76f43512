#include "export/composition.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace levelsplit {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::optional<ElementComposition> parse_element_composition(std::string_view text) {
    if (iequals(text, "Complex")) return ElementComposition::COMPLEX;
    if (iequals(text, "Element")) return ElementComposition::ELEMENT;
    if (iequals(text, "Partial")) return ElementComposition::PARTIAL;
    return std::nullopt;
}

ElementComposition element_composition_override(const Element& element) {
    auto it = element.overrides.find("IfcElementCompositionType");
    if (it == element.overrides.end()) return ElementComposition::ELEMENT;

    return parse_element_composition(it->second)
        .value_or(ElementComposition::ELEMENT);
}

const char* to_string(ElementComposition composition) noexcept {
    switch (composition) {
    case ElementComposition::COMPLEX: return "COMPLEX";
    case ElementComposition::ELEMENT: return "ELEMENT";
    case ElementComposition::PARTIAL: return "PARTIAL";
    }
    return "ELEMENT";
}

} // namespace levelsplit
