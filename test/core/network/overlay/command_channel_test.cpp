/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/overlay/command_channel.hpp"

#include <gtest/gtest.h>

#include "network/overlay/overlay_error.hpp"

namespace pyrsia::network::overlay {
  class CommandChannelTest : public testing::Test {
   public:
    Command provide(uint8_t n) {
      return command::StartProviding{ArtifactHash::of(Bytes{n}),
                                     ReplySlot<void>{}};
    }

    static ArtifactHash hashOf(const Command &command) {
      return boost::get<command::StartProviding>(command).hash;
    }

    void poll() {
      io->restart();
      io->poll();
    }

    std::shared_ptr<boost::asio::io_context> io{
        std::make_shared<boost::asio::io_context>()};
    std::shared_ptr<CommandChannel> channel{
        std::make_shared<CommandChannel>(io, 2)};
    std::vector<ArtifactHash> received;
  };

  /**
   * @given commands sent before handler is set
   * @when set handler and run context
   * @then commands are delivered in send order
   */
  TEST_F(CommandChannelTest, QueuedBeforeHandler) {
    EXPECT_TRUE(channel->send(provide(1)));
    EXPECT_TRUE(channel->send(provide(2)));
    poll();
    EXPECT_EQ(channel->size(), 2u);

    channel->setHandler(
        [this](Command command) { received.push_back(hashOf(command)); });
    poll();
    EXPECT_EQ(received,
              (std::vector{ArtifactHash::of(Bytes{1}),
                           ArtifactHash::of(Bytes{2})}));
    EXPECT_EQ(channel->size(), 0u);
  }

  /**
   * @given channel at capacity
   * @when send one more command
   * @then send is refused until queue drains
   */
  TEST_F(CommandChannelTest, Capacity) {
    channel->setHandler(
        [this](Command command) { received.push_back(hashOf(command)); });
    EXPECT_TRUE(channel->send(provide(1)));
    EXPECT_TRUE(channel->send(provide(2)));
    EXPECT_FALSE(channel->send(provide(3)));
    EXPECT_FALSE(channel->isClosed());
    poll();
    EXPECT_EQ(received.size(), 2u);
    EXPECT_TRUE(channel->send(provide(3)));
  }

  /**
   * @given channel with undelivered commands
   * @when close it
   * @then undelivered commands are returned and send is refused
   */
  TEST_F(CommandChannelTest, Close) {
    channel->setHandler(
        [this](Command command) { received.push_back(hashOf(command)); });
    EXPECT_TRUE(channel->send(provide(1)));
    auto left{channel->close()};
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(hashOf(left.front()), ArtifactHash::of(Bytes{1}));
    EXPECT_TRUE(channel->isClosed());
    EXPECT_FALSE(channel->send(provide(2)));
    poll();
    EXPECT_TRUE(received.empty());
  }

  /**
   * @given command with reply slot
   * @when fail it twice
   * @then callback is called once with first error
   */
  TEST_F(CommandChannelTest, FailCommandOnce) {
    size_t calls{};
    std::error_code error;
    Command command{command::ListPeers{ReplySlot<std::vector<PeerId>>{
        [&](outcome::result<std::vector<PeerId>> res) {
          ++calls;
          error = res.error();
        }}}};
    failCommand(command, OverlayError::kChannelFull);
    failCommand(command, OverlayError::kChannelClosed);
    EXPECT_EQ(calls, 1u);
    EXPECT_EQ(error, make_error_code(OverlayError::kChannelFull));
  }
}  // namespace pyrsia::network::overlay
