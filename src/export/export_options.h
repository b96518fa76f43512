#pragma once

/// Options read once at the start of an export pass.
///
/// Options file (JSON, every key optional):
///   {
///     "wallAndColumnSplitting": true,
///     "logLevel": "debug",
///     "logFile": "levelsplit.log"
///   }

#include <nlohmann/json_fwd.hpp>

#include <spdlog/common.h>

#include <stdexcept>
#include <string>

namespace levelsplit {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

struct ExportOptions {
    /// Split columns, walls and duct segments by building story.
    bool wall_and_column_splitting = false;

    spdlog::level::level_enum log_level = spdlog::level::info;

    /// Empty: log to the console only.
    std::string log_file;
};

/// Build options from a parsed JSON object.  Throws ConfigError on a
/// value of the wrong type or an unknown log level.
ExportOptions parse_export_options(const nlohmann::json& json);

/// Read and parse an options file.  Throws ConfigError if the file cannot
/// be opened or is not valid JSON.
ExportOptions load_export_options(const std::string& path);

} // namespace levelsplit
