#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sdc/cli/logging.hpp>

#include <memory>
#include <vector>

namespace sdc::cli {

void configure_logging(const bool verbose,
                       const std::optional<std::filesystem::path>& log_file) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries command output; logs go to stderr.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (log_file) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        log_file->string(), false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "sdc", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  logger->set_level(verbose ? spdlog::level::trace : spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

}  // namespace sdc::cli
