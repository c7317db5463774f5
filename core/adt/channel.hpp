/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace pyrsia::adt {
  /**
   * Single reader channel. Values written before reader is attached are
   * queued. Handler returns false to stop reading, it receives none when
   * channel is closed for writing.
   */
  template <typename T>
  class Channel {
   public:
    using Queue = std::pair<std::vector<T>, bool>;
    using Handler = std::function<bool(boost::optional<T>)>;
    struct Closed {};

    Channel() = default;
    Channel(const Channel &) = delete;
    Channel &operator=(const Channel &) = delete;
    ~Channel() {
      closeRead();
    }

    bool canWrite() const {
      std::lock_guard lock{mutex};
      if (auto queue{boost::get<Queue>(&state)}) {
        return !queue->second;
      }
      return boost::get<Handler>(&state) != nullptr;
    }

    bool write(T value) {
      std::lock_guard lock{mutex};
      if (auto queue{boost::get<Queue>(&state)}) {
        auto &[values, closed] = *queue;
        if (closed) {
          return false;
        }
        values.push_back(std::move(value));
      } else if (auto handler{boost::get<Handler>(&state)}) {
        if (!(*handler)(std::move(value))) {
          state = Closed{};
        }
      } else {
        return false;
      }
      return true;
    }

    bool closeWrite() {
      std::lock_guard lock{mutex};
      if (auto queue{boost::get<Queue>(&state)}) {
        if (queue->second) {
          return false;
        }
        queue->second = true;
      } else if (auto handler{boost::get<Handler>(&state)}) {
        (*handler)(boost::none);
        state = Closed{};
      } else {
        return false;
      }
      return true;
    }

    bool read(Handler handler) {
      std::lock_guard lock{mutex};
      auto queue{boost::get<Queue>(&state)};
      if (!queue) {
        return false;
      }
      auto &[values, closed] = *queue;
      auto stop = false;
      for (auto &&value : values) {
        stop = !handler(std::move(value));
        if (stop) {
          break;
        }
      }
      if (closed || stop) {
        if (!stop) {
          handler(boost::none);
        }
        state = Closed{};
      } else {
        state = std::move(handler);
      }
      return true;
    }

    bool closeRead() {
      std::lock_guard lock{mutex};
      if (boost::get<Closed>(&state)) {
        return false;
      }
      if (auto handler{boost::get<Handler>(&state)}) {
        (*handler)(boost::none);
      }
      state = Closed{};
      return true;
    }

   private:
    boost::variant<Queue, Handler, Closed> state{Queue{{}, false}};
    mutable std::mutex mutex;
  };

}  // namespace pyrsia::adt
