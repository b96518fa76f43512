#include "export/logging.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace levelsplit {

void configure_logging(const ExportOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!options.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                options.log_file, true));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError(std::string("cannot open log file: ") + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(
        "levelsplit", sinks.begin(), sinks.end());
    logger->set_level(options.log_level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

    spdlog::set_default_logger(logger);
}

} // namespace levelsplit
