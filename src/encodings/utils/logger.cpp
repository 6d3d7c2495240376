// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/sinks/stdout_color_sinks.h>

#include <encodings/utils/logger.hpp>
#include <mutex>
#include <stdexcept>

namespace encodings::utils {

std::shared_ptr<spdlog::logger> Logger::get() {
  static std::once_flag flag;
  static std::shared_ptr<spdlog::logger> logger;
  std::call_once(flag, []() {
    logger = spdlog::get(name);
    if (!logger) {
      logger = spdlog::stderr_color_mt(name);
      logger->set_level(spdlog::level::warn);
    }
  });
  return logger;
}

void Logger::set_global_level(spdlog::level::level_enum level) {
  get()->set_level(level);
}

void Logger::set_global_level(const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to `off`
  if (parsed == spdlog::level::off && level != "off") {
    throw std::invalid_argument("Unknown log level: " + level);
  }
  set_global_level(parsed);
}

void Logger::trace_entering(const char* function) {
  auto& logger = *get();
  if (logger.should_log(spdlog::level::trace)) {
    logger.trace("Entering {}", function);
  }
}

}  // namespace encodings::utils
