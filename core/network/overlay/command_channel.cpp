/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/overlay/command_channel.hpp"

#include <boost/asio/post.hpp>

#include "common/ptr.hpp"

namespace pyrsia::network::overlay {
  CommandChannel::CommandChannel(std::shared_ptr<boost::asio::io_context> io,
                                 size_t capacity)
      : io_{std::move(io)}, capacity_{capacity} {}

  void CommandChannel::setHandler(Handler handler) {
    size_t queued{};
    {
      std::lock_guard lock{mutex_};
      handler_ = std::move(handler);
      queued = queue_.size();
    }
    for (size_t i = 0; i < queued; ++i) {
      boost::asio::post(
          *io_, weakCb(*this, [](std::shared_ptr<CommandChannel> &&self) {
            self->deliverOne();
          }));
    }
  }

  bool CommandChannel::send(Command command) {
    bool deliver{};
    {
      std::lock_guard lock{mutex_};
      if (closed_ || queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(command));
      deliver = static_cast<bool>(handler_);
    }
    if (deliver) {
      boost::asio::post(
          *io_, weakCb(*this, [](std::shared_ptr<CommandChannel> &&self) {
            self->deliverOne();
          }));
    }
    return true;
  }

  void CommandChannel::deliverOne() {
    std::unique_lock lock{mutex_};
    if (queue_.empty() || !handler_) {
      return;
    }
    auto command{std::move(queue_.front())};
    queue_.pop_front();
    auto handler{handler_};
    lock.unlock();
    handler(std::move(command));
  }

  std::deque<Command> CommandChannel::close() {
    std::lock_guard lock{mutex_};
    closed_ = true;
    handler_ = nullptr;
    std::deque<Command> left;
    left.swap(queue_);
    return left;
  }

  bool CommandChannel::isClosed() const {
    std::lock_guard lock{mutex_};
    return closed_;
  }

  size_t CommandChannel::size() const {
    std::lock_guard lock{mutex_};
    return queue_.size();
  }
}  // namespace pyrsia::network::overlay
