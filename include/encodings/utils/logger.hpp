// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace encodings::utils {

/**
 * @brief Access point for the library-wide spdlog logger.
 *
 * All library diagnostics go through a single named logger ("encodings") so
 * that applications can redirect or silence them independently of their own
 * spdlog setup. The logger is created lazily on first use with a colored
 * stderr sink and defaults to the `warn` level.
 */
class Logger {
 public:
  /// Name under which the logger is registered with spdlog
  static constexpr const char* name = "encodings";

  /**
   * @brief Get the shared library logger, creating it on first use
   * @return Shared pointer to the spdlog logger
   */
  static std::shared_ptr<spdlog::logger> get();

  /**
   * @brief Set the verbosity of the library logger
   * @param level New spdlog level
   */
  static void set_global_level(spdlog::level::level_enum level);

  /**
   * @brief Set the verbosity of the library logger from a level name
   *
   * Accepts the spdlog level names ("trace", "debug", "info", "warn",
   * "error", "critical", "off").
   *
   * @param level Level name
   * @throws std::invalid_argument if the name is not a spdlog level
   */
  static void set_global_level(const std::string& level);

  /**
   * @brief Emit the trace record used by ENCODINGS_LOG_TRACE_ENTERING
   * @param function Name of the entered function
   */
  static void trace_entering(const char* function);
};

}  // namespace encodings::utils

/// Library logger accessor
#define ENCODINGS_LOGGER() (*::encodings::utils::Logger::get())

/// Trace-level record marking entry into a library function
#define ENCODINGS_LOG_TRACE_ENTERING() \
  ::encodings::utils::Logger::trace_entering(__func__)
