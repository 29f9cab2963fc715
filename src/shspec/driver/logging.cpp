#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace shspec::driver {

void ConfigureLogging(int verbosity) {
  auto logger = spdlog::stderr_color_mt("shspec");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[shspec] [%l] %v");

  if (verbosity >= 2) {
    spdlog::set_level(spdlog::level::debug);
  } else if (verbosity == 1) {
    spdlog::set_level(spdlog::level::info);
  } else {
    spdlog::set_level(spdlog::level::warn);
  }
}

}  // namespace shspec::driver
