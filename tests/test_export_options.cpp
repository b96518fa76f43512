/// Export options and logging setup tests.

#include "export/export_options.h"
#include "export/logging.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

using namespace levelsplit;
using nlohmann::json;

static bool throws_config_error(const json& value) {
    try {
        (void)parse_export_options(value);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

static void test_defaults() {
    std::printf("Test 1: empty object keeps defaults\n");

    ExportOptions options = parse_export_options(json::object());
    assert(!options.wall_and_column_splitting);
    assert(options.log_level == spdlog::level::info);
    assert(options.log_file.empty());

    std::printf("  PASS\n\n");
}

static void test_all_keys() {
    std::printf("Test 2: every key parsed\n");

    json value = {
        {"wallAndColumnSplitting", true},
        {"logLevel", "debug"},
        {"logFile", "export.log"},
    };
    ExportOptions options = parse_export_options(value);
    assert(options.wall_and_column_splitting);
    assert(options.log_level == spdlog::level::debug);
    assert(options.log_file == "export.log");

    // 0 / 1 are accepted as booleans.
    assert(parse_export_options({{"wallAndColumnSplitting", 1}})
               .wall_and_column_splitting);
    assert(!parse_export_options({{"wallAndColumnSplitting", 0}})
                .wall_and_column_splitting);

    assert(parse_export_options({{"logLevel", "off"}}).log_level
           == spdlog::level::off);

    std::printf("  PASS\n\n");
}

static void test_bad_values() {
    std::printf("Test 3: wrong types raise ConfigError\n");

    assert(throws_config_error(json::array()));
    assert(throws_config_error({{"wallAndColumnSplitting", "yes"}}));
    assert(throws_config_error({{"wallAndColumnSplitting", 2}}));
    assert(throws_config_error({{"logLevel", 3}}));
    assert(throws_config_error({{"logLevel", "verbose"}}));
    assert(throws_config_error({{"logFile", false}}));

    std::printf("  PASS\n\n");
}

static void test_load_file() {
    std::printf("Test 4: load_export_options reads a file\n");

    const std::string path = "test_export_options.json";
    {
        std::ofstream out(path);
        out << R"({ "wallAndColumnSplitting": true, "logLevel": "warn" })";
    }
    ExportOptions options = load_export_options(path);
    assert(options.wall_and_column_splitting);
    assert(options.log_level == spdlog::level::warn);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool thrown = false;
    try {
        (void)load_export_options(path);
    } catch (const ConfigError&) {
        thrown = true;
    }
    assert(thrown);
    std::remove(path.c_str());

    thrown = false;
    try {
        (void)load_export_options("does_not_exist.json");
    } catch (const ConfigError&) {
        thrown = true;
    }
    assert(thrown);

    std::printf("  PASS\n\n");
}

static void test_configure_logging() {
    std::printf("Test 5: configure_logging installs the default logger\n");

    const std::string path = "test_export_options.log";

    ExportOptions options;
    options.log_level = spdlog::level::debug;
    options.log_file  = path;
    configure_logging(options);

    assert(spdlog::default_logger()->name() == "levelsplit");
    assert(spdlog::default_logger()->level() == spdlog::level::debug);
    assert(spdlog::default_logger()->sinks().size() == 2);

    spdlog::info("written to {}", path);
    spdlog::default_logger()->flush();

    std::ifstream in(path);
    std::string line;
    assert(std::getline(in, line));
    assert(line.find("written to") != std::string::npos);
    in.close();

    configure_logging(ExportOptions{});
    assert(spdlog::default_logger()->sinks().size() == 1);
    std::remove(path.c_str());

    std::printf("  PASS\n\n");
}

int main() {
    std::printf("=== Export options tests ===\n\n");

    test_defaults();
    test_all_keys();
    test_bad_values();
    test_load_file();
    test_configure_logging();

    std::printf("All %d tests passed.\n", 5);
    return 0;
}
