/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>
#include <vector>

namespace pyrsia {
  /**
   * Owns an io_context together with the threads running it. Used to move
   * blocking work (disk, http) off the overlay event loop.
   */
  struct IoThread {
    inline explicit IoThread(size_t threads = 1)
        : io{std::make_shared<boost::asio::io_context>()},
          work{io->get_executor()} {
      if (threads == 0) {
        threads = 1;
      }
      for (size_t i = 0; i < threads; ++i) {
        this->threads.emplace_back([this] { io->run(); });
      }
    }
    IoThread(const IoThread &) = delete;
    IoThread &operator=(const IoThread &) = delete;
    inline ~IoThread() {
      io->stop();
      for (auto &thread : threads) {
        if (thread.joinable()) {
          thread.join();
        }
      }
    }

    std::shared_ptr<boost::asio::io_context> io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work;
    std::vector<std::thread> threads;
  };
}  // namespace pyrsia
