/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pyrsia::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e %n %^%L%$ %v"};

    std::mutex &loggers_mutex() {
      static std::mutex mutex;
      return mutex;
    }

    /// Shared by all loggers, its sink list is guarded by its own mutex
    std::shared_ptr<spdlog::sinks::dist_sink_mt> output_sink() {
      static auto sink{[] {
        auto dist{std::make_shared<spdlog::sinks::dist_sink_mt>()};
        dist->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        return dist;
      }()};
      return sink;
    }

    spdlog::sink_ptr file_sink;
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{loggers_mutex()};
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    auto logger{std::make_shared<spdlog::logger>(tag, output_sink())};
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::get_level());
    spdlog::register_logger(logger);
    return logger;
  }

  void setLogFile(const std::string &path) {
    auto sink{std::make_shared<spdlog::sinks::basic_file_sink_mt>(path)};
    sink->set_pattern(kPattern);
    std::lock_guard lock{loggers_mutex()};
    if (file_sink) {
      output_sink()->remove_sink(file_sink);
    }
    file_sink = sink;
    output_sink()->add_sink(file_sink);
  }
}  // namespace pyrsia::common
