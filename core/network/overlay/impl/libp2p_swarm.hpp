/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_map>

#include <libp2p/connection/stream.hpp>
#include <libp2p/host/host.hpp>
#include <libp2p/protocol/common/subscription.hpp>
#include <libp2p/protocol/gossip/gossip.hpp>
#include <libp2p/protocol/kademlia/kademlia.hpp>

#include "network/overlay/overlay_config.hpp"
#include "network/overlay/swarm.hpp"

namespace pyrsia::network::overlay {
  using libp2p::Host;
  using libp2p::protocol::Subscription;
  using libp2p::protocol::gossip::Gossip;
  using libp2p::protocol::kademlia::Kademlia;

  /**
   * Swarm over libp2p host. Presence announcements and broadcast messages go
   * through gossip topics, provider records through kademlia, artifacts
   * through varint framed request/response streams.
   * Must share io_context with overlay engine.
   */
  class Libp2pSwarm : public Swarm,
                      public std::enable_shared_from_this<Libp2pSwarm> {
   public:
    using StreamPtr = std::shared_ptr<libp2p::connection::Stream>;

    Libp2pSwarm(const OverlayConfig &config,
                std::shared_ptr<Host> host,
                std::shared_ptr<Gossip> gossip,
                std::shared_ptr<Kademlia> kademlia);

    void start(EventHandler handler) override;

    void stop() override;

    PeerId selfId() const override;

    outcome::result<void> listen(const Multiaddress &address) override;

    outcome::result<void> dial(const PeerId &peer,
                               const Multiaddress &address) override;

    outcome::result<void> announce() override;

    outcome::result<void> publish(const Bytes &message) override;

    void addToBroadcastView(
        const PeerId &peer,
        const std::vector<Multiaddress> &addresses) override;

    void removeFromBroadcastView(const PeerId &peer) override;

    outcome::result<void> provide(const ArtifactHash &hash) override;

    void findProviders(const ArtifactHash &hash,
                       CbT<std::vector<PeerId>> cb) override;

    void sendRequest(RequestId request_id,
                     const PeerId &peer,
                     Bytes request) override;

    outcome::result<void> sendResponse(ResponseChannel channel,
                                       Bytes response) override;

    void dropResponse(ResponseChannel channel) override;

    /**
     * Reads one varint length prefixed frame. Length is checked against
     * max_size before reading, payload buffer grows as chunks arrive.
     */
    static void readFrame(const StreamPtr &stream,
                          size_t max_size,
                          CbT<Bytes> cb);

    /// Writes one varint length prefixed frame
    static void writeFrame(const StreamPtr &stream,
                           const Bytes &frame,
                           CbT<void> cb);

   private:
    static void readChunks(const StreamPtr &stream,
                           std::shared_ptr<Bytes> buffer,
                           size_t size,
                           CbT<Bytes> cb);

    void writeRequest(RequestId request_id,
                      const StreamPtr &stream,
                      const Bytes &request);
    void readResponse(RequestId request_id, const StreamPtr &stream);
    void onInboundStream(StreamPtr stream);
    void onAnnounce(const PeerId &from, BytesIn data);
    void emit(SwarmEvent event);

    OverlayConfig config_;
    std::shared_ptr<Host> host_;
    std::shared_ptr<Gossip> gossip_;
    std::shared_ptr<Kademlia> kademlia_;
    EventHandler handler_;
    bool started_{false};

    Subscription discovery_sub_;
    Subscription broadcast_sub_;

    /// Inbound streams waiting for response
    std::unordered_map<uint64_t, StreamPtr> inbound_;
    uint64_t next_channel_{1};
  };
}  // namespace pyrsia::network::overlay
