#include "export/export_options.h"

#include <nlohmann/json.hpp>

#include <fstream>

namespace levelsplit {

namespace {

/// Booleans may also be written as 0 / 1.
bool get_json_bool(const nlohmann::json& value, const char* key) {
    if (value.is_boolean()) return value.get<bool>();

    if (value.is_number_integer()) {
        auto as_int = value.get<long long>();
        if (as_int == 0) return false;
        if (as_int == 1) return true;
    }
    throw ConfigError(std::string("option '") + key + "' must be a boolean");
}

std::string get_json_string(const nlohmann::json& value, const char* key) {
    if (!value.is_string()) {
        throw ConfigError(std::string("option '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps anything it does not know to "off".
    if (level == spdlog::level::off && name != "off") {
        throw ConfigError("unknown log level '" + name + "'");
    }
    return level;
}

} // namespace

ExportOptions parse_export_options(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("options must be a JSON object");
    }

    ExportOptions options;

    if (json.contains("wallAndColumnSplitting")) {
        options.wall_and_column_splitting =
            get_json_bool(json["wallAndColumnSplitting"], "wallAndColumnSplitting");
    }
    if (json.contains("logLevel")) {
        options.log_level =
            parse_log_level(get_json_string(json["logLevel"], "logLevel"));
    }
    if (json.contains("logFile")) {
        options.log_file = get_json_string(json["logFile"], "logFile");
    }

    return options;
}

ExportOptions load_export_options(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open options file '" + path + "'");
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("options file '" + path + "': " + e.what());
    }
    return parse_export_options(json);
}

} // namespace levelsplit
