/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/optional.hpp>

#include "network/overlay/peer_discovery.hpp"

namespace pyrsia::network::overlay {
  struct LanDiscoveryConfig {
    bool enabled{true};
    /// Multicast group shared by nodes of local network
    std::string group{"239.255.70.77"};
    uint16_t port{44001};
  };

  /// Presence datagram sent to multicast group
  struct LanAnnouncement {
    PeerId peer;
    std::vector<Multiaddress> addresses;
  };

  Bytes encodeLanAnnouncement(const LanAnnouncement &announcement);

  outcome::result<LanAnnouncement> decodeLanAnnouncement(BytesIn datagram);

  /**
   * Local network discovery over UDP multicast. Each announcement carries
   * peer id and listen addresses; unspecified ip4 host is replaced with
   * sender address on receipt. Must share io_context with overlay engine.
   */
  class MulticastDiscovery
      : public PeerDiscovery,
        public std::enable_shared_from_this<MulticastDiscovery> {
   public:
    using AddressesFn = std::function<std::vector<Multiaddress>()>;

    static constexpr size_t kMaxDatagramSize{8192};

    MulticastDiscovery(LanDiscoveryConfig config,
                       std::shared_ptr<boost::asio::io_context> io,
                       PeerId self,
                       AddressesFn addresses);

    outcome::result<void> start(Handler handler) override;

    void stop() override;

    outcome::result<void> announce() override;

    /**
     * Converts datagram received from sender to discovered peer.
     * @return none for malformed datagram or own announcement
     */
    boost::optional<swarm_event::PeerDiscovered> handleDatagram(
        BytesIn datagram, const boost::asio::ip::address &sender) const;

   private:
    void receive();

    LanDiscoveryConfig config_;
    std::shared_ptr<boost::asio::io_context> io_;
    PeerId self_;
    AddressesFn addresses_;
    Handler handler_;

    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint group_endpoint_;
    boost::asio::ip::udp::endpoint sender_;
    Bytes buffer_;
  };
}  // namespace pyrsia::network::overlay
