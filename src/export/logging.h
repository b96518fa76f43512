#pragma once

#include "export/export_options.h"

namespace levelsplit {

/// Install the default logger: stderr, plus the options' log file if set.
/// Throws ConfigError if the log file cannot be created.
void configure_logging(const ExportOptions& options);

} // namespace levelsplit
