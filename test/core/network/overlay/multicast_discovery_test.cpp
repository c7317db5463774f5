/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/overlay/impl/multicast_discovery.hpp"

#include <gtest/gtest.h>

#include "network/overlay/overlay_error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/peer_id.hpp"

namespace pyrsia::network::overlay {
  using boost::asio::ip::make_address;

  class MulticastDiscoveryTest : public testing::Test {
   public:
    Multiaddress address(std::string_view str) {
      return Multiaddress::create(str).value();
    }

    std::shared_ptr<boost::asio::io_context> io{
        std::make_shared<boost::asio::io_context>()};
    PeerId self{generatePeerId(1)};
    PeerId peer{generatePeerId(2)};
    std::shared_ptr<MulticastDiscovery> discovery{
        std::make_shared<MulticastDiscovery>(
            LanDiscoveryConfig{}, io, self, [this] {
              return std::vector<Multiaddress>{
                  address("/ip4/0.0.0.0/tcp/44000")};
            })};
  };

  /**
   * @given announcement of peer with listen addresses
   * @when encode it
   * @then datagram is json object decoded back to the same peer and addresses
   */
  TEST_F(MulticastDiscoveryTest, Announcement) {
    LanAnnouncement announcement{
        peer,
        {address("/ip4/0.0.0.0/tcp/44000"),
         address("/ip4/10.0.0.2/tcp/44000")}};
    auto datagram{encodeLanAnnouncement(announcement)};
    EXPECT_EQ(asString(datagram),
              R"({"peer":")" + peer.toBase58()
                  + R"(","addresses":["/ip4/0.0.0.0/tcp/44000",)"
                    R"("/ip4/10.0.0.2/tcp/44000"]})");
    EXPECT_OUTCOME_TRUE(decoded, decodeLanAnnouncement(datagram));
    EXPECT_EQ(decoded.peer, peer);
    EXPECT_EQ(decoded.addresses, announcement.addresses);
  }

  /**
   * @given datagrams which are not announcements
   * @when decode them
   * @then error is returned
   */
  TEST_F(MulticastDiscoveryTest, MalformedAnnouncement) {
    EXPECT_OUTCOME_FALSE_1(decodeLanAnnouncement(asBytes("hello")));
    EXPECT_OUTCOME_FALSE_1(
        decodeLanAnnouncement(asBytes(R"({"addresses":[]})")));
    EXPECT_OUTCOME_FALSE_1(
        decodeLanAnnouncement(asBytes(R"({"peer":"xyz","addresses":[]})")));
    EXPECT_OUTCOME_FALSE_1(decodeLanAnnouncement(asBytes(
        R"({"peer":")" + peer.toBase58() + R"(","addresses":["tcp"]})")));
  }

  /**
   * @given announcement listening on all interfaces
   * @when it is received from a sender
   * @then peer is discovered at sender address, other hosts are kept
   */
  TEST_F(MulticastDiscoveryTest, SenderAddress) {
    auto datagram{encodeLanAnnouncement(
        {peer,
         {address("/ip4/0.0.0.0/tcp/44000"),
          address("/ip4/10.0.0.2/tcp/44000")}})};
    auto discovered{
        discovery->handleDatagram(datagram, make_address("192.168.1.7"))};
    ASSERT_TRUE(discovered);
    EXPECT_EQ(discovered->peer, peer);
    EXPECT_EQ(discovered->addresses,
              (std::vector<Multiaddress>{address("/ip4/192.168.1.7/tcp/44000"),
                                         address("/ip4/10.0.0.2/tcp/44000")}));
  }

  /**
   * @given own announcement looped back and garbage datagram
   * @when they are received
   * @then no peer is discovered
   */
  TEST_F(MulticastDiscoveryTest, IgnoredDatagrams) {
    auto own{encodeLanAnnouncement({self, {}})};
    EXPECT_FALSE(discovery->handleDatagram(own, make_address("192.168.1.7")));
    EXPECT_FALSE(discovery->handleDatagram(asBytes("{}"),
                                           make_address("192.168.1.7")));
  }

  /**
   * @given discovery with unicast group address
   * @when start it
   * @then start fails without opening socket and announce is refused
   */
  TEST_F(MulticastDiscoveryTest, InvalidGroup) {
    LanDiscoveryConfig config;
    config.group = "10.0.0.1";
    auto unicast{std::make_shared<MulticastDiscovery>(
        config, io, self, [] { return std::vector<Multiaddress>{}; })};
    EXPECT_OUTCOME_ERROR(OverlayError::kInvalidAddress,
                         unicast->start([](auto) {}));
    EXPECT_OUTCOME_ERROR(OverlayError::kDiscoveryFailed, unicast->announce());
    EXPECT_OUTCOME_ERROR(OverlayError::kDiscoveryFailed, discovery->announce());
  }
}  // namespace pyrsia::network::overlay
