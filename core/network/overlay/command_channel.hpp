/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <mutex>

#include <boost/asio/io_context.hpp>

#include "network/overlay/command.hpp"

namespace pyrsia::network::overlay {
  /**
   * Bounded multi producer queue of commands consumed by overlay engine.
   * Each command is delivered in its own io_context turn, so network events
   * get processed between commands. Commands sent from one thread are
   * delivered in send order.
   */
  class CommandChannel : public std::enable_shared_from_this<CommandChannel> {
   public:
    using Handler = std::function<void(Command)>;

    CommandChannel(std::shared_ptr<boost::asio::io_context> io,
                   size_t capacity);

    /**
     * Sets consumer, commands queued before are delivered to it
     */
    void setHandler(Handler handler);

    /**
     * Enqueues command, never blocks
     * @return false if channel is full or closed, command is not delivered
     */
    bool send(Command command);

    /**
     * Refuses further commands
     * @return commands which were not delivered
     */
    std::deque<Command> close();

    bool isClosed() const;

    size_t size() const;

   private:
    void deliverOne();

    std::shared_ptr<boost::asio::io_context> io_;
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Command> queue_;
    Handler handler_;
    bool closed_{false};
  };
}  // namespace pyrsia::network::overlay
