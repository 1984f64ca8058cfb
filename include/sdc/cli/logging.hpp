#pragma once

#include <filesystem>
#include <optional>

namespace sdc::cli {

/// Install the process-wide `sdc` logger: colored stderr plus an optional
/// log file. Level is warn, or trace with `verbose`.
void configure_logging(bool verbose,
                       const std::optional<std::filesystem::path>& log_file);

}  // namespace sdc::cli
