/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/network_client.hpp"

#include <algorithm>
#include <future>

#include <gtest/gtest.h>
#include <boost/asio/post.hpp>
#include <libp2p/basic/scheduler/manual_scheduler_backend.hpp>
#include <libp2p/basic/scheduler/scheduler_impl.hpp>

#include "network/overlay/overlay_engine.hpp"
#include "testutil/mocks/network/swarm_mock.hpp"
#include "testutil/network/fake_overlay.hpp"
#include "testutil/outcome.hpp"
#include "testutil/peer_id.hpp"

namespace pyrsia::network {
  using libp2p::basic::ManualSchedulerBackend;
  using libp2p::basic::SchedulerImpl;
  using overlay::BroadcastMessage;
  using overlay::OverlayConfig;
  using overlay::OverlayEngine;
  using overlay::OverlayError;
  using overlay::SwarmMock;
  using std::chrono_literals::operator""ms;
  using testing::_;
  using testing::AnyNumber;
  using testing::Return;
  using testing::SaveArg;
  namespace broadcast = overlay::broadcast;
  namespace swarm_event = overlay::swarm_event;

  /**
   * @given overlay answering commands on its thread
   * @when call blocking operations
   * @then replies of overlay are returned
   */
  TEST(NetworkClientTest, Blocking) {
    test::FakeOverlay overlay;
    overlay.peers = {generatePeerId(1), generatePeerId(2)};
    overlay.providers = {generatePeerId(2)};
    overlay.served.emplace(generatePeerId(2), Bytes{1, 2});
    overlay.start();
    auto client{overlay.client()};
    auto hash{ArtifactHash::of(Bytes{1, 2})};

    EXPECT_OUTCOME_EQ(client.listPeers(), overlay.peers);
    EXPECT_OUTCOME_EQ(client.listProviders(hash), overlay.providers);
    EXPECT_OUTCOME_EQ(client.requestArtifact(generatePeerId(2), hash),
                      (Bytes{1, 2}));
    EXPECT_OUTCOME_ERROR(OverlayError::kArtifactNotFound,
                         client.requestArtifact(generatePeerId(1), hash));
    EXPECT_OUTCOME_TRUE_1(client.provide(hash));
    EXPECT_EQ(overlay.providedHashes(), std::vector<ArtifactHash>{hash});
  }

  /**
   * @given overlay which never replies
   * @when call blocking operation
   * @then kCommandTimeout is returned after command timeout
   */
  TEST(NetworkClientTest, CommandTimeout) {
    test::FakeOverlay overlay;
    overlay.commands->setHandler([](overlay::Command) {});
    auto client{overlay.client(50ms)};
    EXPECT_OUTCOME_ERROR(OverlayError::kCommandTimeout, client.listPeers());
  }

  /**
   * @given full command channel
   * @when send one more command
   * @then it fails with kChannelFull without blocking
   */
  TEST(NetworkClientTest, ChannelFull) {
    test::FakeOverlay overlay{1};
    auto client{overlay.client()};
    bool first_called{false};
    client.listPeers([&](auto) { first_called = true; });

    boost::optional<outcome::result<std::vector<PeerId>>> result;
    client.listPeers([&](auto res) { result = std::move(res); });
    ASSERT_TRUE(result);
    EXPECT_OUTCOME_ERROR(OverlayError::kChannelFull, *result);
    EXPECT_FALSE(first_called);
  }

  /**
   * @given closed command channel
   * @when call operation
   * @then it fails with kChannelClosed
   */
  TEST(NetworkClientTest, ChannelClosed) {
    test::FakeOverlay overlay;
    overlay.commands->close();
    auto client{overlay.client()};
    auto address{Multiaddress::create("/ip4/127.0.0.1/tcp/1").value()};
    EXPECT_OUTCOME_ERROR(OverlayError::kChannelClosed,
                         client.dial(generatePeerId(1), address));
  }

  /**
   * @given overlay engine running on its own thread
   * @when clones of one client provide and withdraw artifacts concurrently
   * @then broadcasts of each clone keep its call order and list request is
   * answered with exactly the artifacts left provided
   */
  TEST(NetworkClientTest, ConcurrentClones) {
    constexpr size_t kClones{2};
    constexpr size_t kHashes{20};
    IoThread thread;
    auto scheduler{std::make_shared<SchedulerImpl>(
        std::make_shared<ManualSchedulerBackend>(),
        libp2p::basic::Scheduler::Config{})};
    auto swarm{std::make_shared<SwarmMock>()};
    auto self{generatePeerId(1)};
    auto other{generatePeerId(2)};

    std::mutex mutex;
    std::vector<BroadcastMessage> published;
    std::promise<std::vector<ArtifactHash>> listed;
    overlay::Swarm::EventHandler emit;
    EXPECT_CALL(*swarm, selfId()).WillRepeatedly(Return(self));
    EXPECT_CALL(*swarm, start(_)).WillOnce(SaveArg<0>(&emit));
    EXPECT_CALL(*swarm, stop()).Times(AnyNumber());
    EXPECT_CALL(*swarm, announce()).WillRepeatedly(Return(outcome::success()));
    EXPECT_CALL(*swarm, provide(_)).WillRepeatedly(Return(outcome::success()));
    EXPECT_CALL(*swarm, publish(_))
        .WillRepeatedly([&](const Bytes &data) -> outcome::result<void> {
          OUTCOME_TRY(message, overlay::decodeBroadcast(data));
          if (auto response{boost::get<broadcast::ListResponse>(&message)}) {
            listed.set_value(response->hashes);
            return outcome::success();
          }
          std::lock_guard lock{mutex};
          published.push_back(std::move(message));
          return outcome::success();
        });

    auto engine{std::make_shared<OverlayEngine>(
        OverlayConfig{}, thread.io, scheduler, swarm, nullptr)};
    std::promise<void> started;
    boost::asio::post(*thread.io, [&] {
      engine->start();
      started.set_value();
    });
    started.get_future().wait();

    NetworkClient client{engine->commands(), std::chrono::seconds{5}};
    std::vector<std::vector<ArtifactHash>> hashes(kClones);
    std::vector<ArtifactHash> expected;
    for (size_t k = 0; k < kClones; ++k) {
      for (size_t i = 0; i < kHashes; ++i) {
        hashes[k].push_back(ArtifactHash::of(
            asBytes(std::to_string(k) + "/" + std::to_string(i))));
        if (i % 2 == 0) {
          expected.push_back(hashes[k].back());
        }
      }
    }
    std::sort(expected.begin(), expected.end());

    std::vector<std::thread> clones;
    for (size_t k = 0; k < kClones; ++k) {
      clones.emplace_back([clone{client}, &hashes, k] {
        for (size_t i = 0; i < kHashes; ++i) {
          EXPECT_OUTCOME_TRUE_1(clone.provide(hashes[k][i]));
          if (i % 2 == 1) {
            EXPECT_OUTCOME_TRUE_1(clone.stopProviding(hashes[k][i]));
          }
        }
      });
    }
    for (auto &clone : clones) {
      clone.join();
    }

    for (size_t k = 0; k < kClones; ++k) {
      std::vector<std::pair<bool, ArtifactHash>> sent, order;
      for (size_t i = 0; i < kHashes; ++i) {
        order.emplace_back(true, hashes[k][i]);
        if (i % 2 == 1) {
          order.emplace_back(false, hashes[k][i]);
        }
      }
      auto own{[&](const ArtifactHash &hash) {
        return std::find(hashes[k].begin(), hashes[k].end(), hash)
            != hashes[k].end();
      }};
      std::lock_guard lock{mutex};
      for (auto &message : published) {
        if (auto provide{boost::get<broadcast::Provide>(&message)};
            provide && own(provide->hash)) {
          sent.emplace_back(true, provide->hash);
        } else if (auto withdraw{boost::get<broadcast::Withdraw>(&message)};
                   withdraw && own(withdraw->hash)) {
          sent.emplace_back(false, withdraw->hash);
        }
      }
      EXPECT_EQ(sent, order);
    }

    auto list{listed.get_future()};
    boost::asio::post(*thread.io, [&] {
      emit(swarm_event::BroadcastReceived{
          other, overlay::encodeBroadcast(broadcast::ListRequest{})});
    });
    ASSERT_EQ(list.wait_for(std::chrono::seconds{5}),
              std::future_status::ready);
    EXPECT_EQ(list.get(), expected);

    std::promise<void> stopped;
    boost::asio::post(*thread.io, [&] {
      engine->stop();
      stopped.set_value();
    });
    stopped.get_future().wait();
  }
}  // namespace pyrsia::network
