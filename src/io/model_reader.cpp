#include "io/model_reader.h"
#include "model/model_error.h"
#include "model/parameter.h"

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

namespace levelsplit {

namespace {

using nlohmann::json;

// ── Field helpers ───────────────────────────────────────────────────

const json& require(const json& object, const char* key) {
    if (!object.is_object() || !object.contains(key)) {
        throw ModelError(std::string("missing field '") + key + "'");
    }
    return object[key];
}

ElementId get_id(const json& value, const char* key) {
    if (!value.is_number_integer()) {
        throw ModelError(std::string("field '") + key + "' must be an integer id");
    }
    return value.get<ElementId>();
}

double get_double(const json& value, const char* key) {
    if (!value.is_number()) {
        throw ModelError(std::string("field '") + key + "' must be a number");
    }
    return value.get<double>();
}

bool get_bool(const json& value, const char* key) {
    if (!value.is_boolean()) {
        throw ModelError(std::string("field '") + key + "' must be a boolean");
    }
    return value.get<bool>();
}

std::string get_string(const json& value, const char* key) {
    if (!value.is_string()) {
        throw ModelError(std::string("field '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

ElementId optional_id(const json& object, const char* key) {
    return object.contains(key) ? get_id(object[key], key) : INVALID_ID;
}

// ── Levels and views ────────────────────────────────────────────────

Level read_level(const json& entry, ModelFile& model) {
    Level level;
    level.id        = get_id(require(entry, "id"), "id");
    level.elevation = get_double(require(entry, "elevation"), "elevation");
    if (entry.contains("name")) {
        level.name = get_string(entry["name"], "name");
    }
    if (entry.contains("isBuildingStory")) {
        level.parameters[ParamId::LEVEL_IS_BUILDING_STORY] =
            get_bool(entry["isBuildingStory"], "isBuildingStory") ? 1 : 0;
    }
    if (entry.contains("upToLevel")) {
        level.parameters[ParamId::LEVEL_UP_TO_LEVEL] =
            get_id(entry["upToLevel"], "upToLevel");
    }
    if (entry.contains("defaultHeight")) {
        model.default_heights[level.id] =
            get_double(entry["defaultHeight"], "defaultHeight");
    }
    return level;
}

ViewType read_view_type(const std::string& name) {
    if (name == "FloorPlan")       return ViewType::FLOOR_PLAN;
    if (name == "CeilingPlan")     return ViewType::CEILING_PLAN;
    if (name == "EngineeringPlan") return ViewType::ENGINEERING_PLAN;
    if (name == "Section")         return ViewType::SECTION;
    if (name == "Elevation")       return ViewType::ELEVATION;
    if (name == "ThreeD")          return ViewType::THREE_D;
    throw ModelError("unknown view type '" + name + "'");
}

View read_view(const json& entry) {
    View view;
    view.id   = get_id(require(entry, "id"), "id");
    view.type = read_view_type(get_string(require(entry, "type"), "type"));
    view.gen_level         = optional_id(entry, "genLevel");
    view.bottom_clip_level = optional_id(entry, "bottomClipLevel");
    return view;
}

// ── Elements ────────────────────────────────────────────────────────

ElementKind read_kind(const json& entry) {
    const std::string kind =
        entry.contains("kind") ? get_string(entry["kind"], "kind") : "other";

    if (kind == "wall")          return WallKind{};
    if (kind == "truss")         return TrussKind{};
    if (kind == "extrusionRoof") return ExtrusionRoofKind{};
    if (kind == "other")         return OtherKind{};
    if (kind == "familyInstance") {
        return FamilyInstanceKind{optional_id(entry, "superComponent")};
    }
    if (kind == "stairs") {
        bool legacy = entry.contains("legacy")
            && get_bool(entry["legacy"], "legacy");
        return StairsKind{legacy};
    }
    if (kind == "mepCurve") {
        return MepCurveKind{optional_id(entry, "referenceLevel")};
    }
    throw ModelError("unknown element kind '" + kind + "'");
}

ParamValue read_param_value(const json& value, const std::string& name) {
    if (value.is_number_integer()) return value.get<ElementId>();
    if (value.is_number())         return value.get<double>();
    if (value.is_string())         return value.get<std::string>();
    throw ModelError("parameter '" + name + "' has an unsupported value");
}

Element read_element(const json& entry) {
    Element element;
    element.id            = get_id(require(entry, "id"), "id");
    element.kind          = read_kind(entry);
    element.level_id      = optional_id(entry, "level");
    element.owner_view    = optional_id(entry, "ownerView");
    element.view_specific = entry.contains("viewSpecific")
        && get_bool(entry["viewSpecific"], "viewSpecific");

    if (entry.contains("exportAs")) {
        element.export_type.instance =
            entity_type_from_name(get_string(entry["exportAs"], "exportAs"));
    }
    if (entry.contains("exportType")) {
        element.export_type.type =
            entity_type_from_name(get_string(entry["exportType"], "exportType"));
    }

    if (entry.contains("boundingBox")) {
        const json& box = entry["boundingBox"];
        element.bounding_z = Range{get_double(require(box, "minZ"), "minZ"),
                                   get_double(require(box, "maxZ"), "maxZ")};
    }

    if (entry.contains("parameters")) {
        const json& params = entry["parameters"];
        if (!params.is_object()) {
            throw ModelError("field 'parameters' must be an object");
        }
        for (const auto& [name, value] : params.items()) {
            auto param = param_id_from_name(name);
            if (!param) {
                spdlog::warn("element {}: ignoring unknown parameter '{}'",
                             element.id, name);
                continue;
            }
            element.parameters[*param] = read_param_value(value, name);
        }
    }

    if (entry.contains("overrides")) {
        const json& overrides = entry["overrides"];
        if (!overrides.is_object()) {
            throw ModelError("field 'overrides' must be an object");
        }
        for (const auto& [name, value] : overrides.items()) {
            element.overrides[name] = get_string(value, name.c_str());
        }
    }

    return element;
}

const json& array_field(const json& object, const char* key) {
    static const json empty = json::array();
    if (!object.contains(key)) return empty;
    const json& value = object[key];
    if (!value.is_array()) {
        throw ModelError(std::string("field '") + key + "' must be an array");
    }
    return value;
}

} // namespace

ModelFile parse_model(const json& model_json) {
    if (!model_json.is_object()) {
        throw ModelError("model must be a JSON object");
    }

    ModelFile model;
    for (const auto& entry : array_field(model_json, "levels")) {
        model.document.add_level(read_level(entry, model));
    }
    for (const auto& entry : array_field(model_json, "views")) {
        model.document.add_view(read_view(entry));
    }
    for (const auto& entry : array_field(model_json, "elements")) {
        model.document.add_element(read_element(entry));
    }
    return model;
}

ModelFile read_model(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ModelError("cannot open model file '" + path + "'");
    }

    json parsed;
    try {
        in >> parsed;
    } catch (const json::parse_error& e) {
        throw ModelError("model file '" + path + "': " + e.what());
    }
    return parse_model(parsed);
}

} // namespace levelsplit
