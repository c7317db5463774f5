/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>

#include "common/outcome.hpp"

namespace pyrsia {
  template <typename T>
  using CbT = std::function<void(outcome::result<T>)>;

  /**
   * Calls asynchronous function and blocks until its callback fires or
   * timeout elapses. The callback may still fire after timeout, its result is
   * then discarded.
   * @param f - function accepting CbT<T>
   * @param timeout - how long to wait for callback
   * @param on_timeout - error returned when callback did not fire in time
   */
  template <typename T, typename F, typename E>
  outcome::result<T> waitCb(const F &f,
                            std::chrono::milliseconds timeout,
                            E on_timeout) {
    auto wait{std::make_shared<std::promise<outcome::result<T>>>()};
    auto future{wait->get_future()};
    f([wait](outcome::result<T> res) { wait->set_value(std::move(res)); });
    if (future.wait_for(timeout) != std::future_status::ready) {
      return on_timeout;
    }
    return future.get();
  }
}  // namespace pyrsia
