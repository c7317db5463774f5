/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/log/configurator.hpp>
#include <libp2p/log/logger.hpp>

#include "common/logger.hpp"

namespace pyrsia {
  /**
   * Configures logging system of libp2p, libp2p won't work without it.
   * @param path - libp2p log file, console when empty
   * @param level - soralog level name of libp2p group
   */
  inline void libp2pSoralog(const std::string &path = {},
                            const std::string &level = "info") {
    static auto done{false};
    if (done) {
      return;
    }
    done = true;
    std::string console{R"(
sinks:
  - name: console
    type: console
    color: true
groups:
  - name: main
    sink: console
    level: {}
    children:
      - name: libp2p
          )"};
    std::string file{R"(
sinks:
  - name: file
    type: file
    path: {}
groups:
  - name: main
    sink: file
    level: {}
    children:
      - name: libp2p
          )"};
    auto log{std::make_shared<soralog::LoggingSystem>(
        std::make_shared<libp2p::log::Configurator>(
            path.empty() ? fmt::format(console, level)
                         : fmt::format(file, path, level)))};
    auto result{log->configure()};
    if (result.has_error || result.has_warning) {
      spdlog::warn("libp2p logging configuration: {}", result.message);
    }
    libp2p::log::setLoggingSystem(log);
  }
}  // namespace pyrsia
