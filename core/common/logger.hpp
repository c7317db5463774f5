/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace pyrsia::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Duplicates output of all loggers, existing and future ones, to file.
   * Safe to call while other threads log, replaces previous log file.
   * @param path - log file path, appended if exists
   */
  void setLogFile(const std::string &path);
}  // namespace pyrsia::common
