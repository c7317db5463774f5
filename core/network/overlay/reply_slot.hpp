/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>

#include "common/async.hpp"

namespace pyrsia::network::overlay {
  /**
   * Single use reply capability of command. Copies share state, callback is
   * called at most once no matter how many copies try to complete it.
   */
  template <typename T>
  class ReplySlot {
   public:
    using Callback = CbT<T>;

    ReplySlot() = default;
    explicit ReplySlot(Callback cb)
        : state_{std::make_shared<State>(std::move(cb))} {}

    /**
     * Completes slot
     * @return false if slot was already completed
     */
    bool complete(outcome::result<T> result) const {
      if (!state_ || state_->done.exchange(true)) {
        return false;
      }
      auto cb{std::move(state_->cb)};
      state_->cb = nullptr;
      if (cb) {
        cb(std::move(result));
      }
      return true;
    }

    bool completed() const {
      return !state_ || state_->done;
    }

   private:
    struct State {
      explicit State(Callback cb) : cb{std::move(cb)} {}

      std::atomic_bool done{false};
      Callback cb;
    };

    std::shared_ptr<State> state_;
  };
}  // namespace pyrsia::network::overlay
