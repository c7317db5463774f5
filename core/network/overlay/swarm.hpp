/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include <boost/variant.hpp>

#include "common/async.hpp"
#include "network/overlay/types.hpp"

namespace pyrsia::network::overlay {
  namespace swarm_event {
    /// Peer announced its presence on discovery topic
    struct PeerDiscovered {
      PeerId peer;
      std::vector<Multiaddress> addresses;
    };

    /// Message received on broadcast topic
    struct BroadcastReceived {
      PeerId from;
      Bytes data;
    };

    /// Remote peer opened artifact exchange, frame is not decoded yet
    struct InboundRequest {
      PeerId from;
      Bytes request;
      ResponseChannel channel;
    };

    /// Response frame for outbound request
    struct InboundResponse {
      RequestId request_id;
      Bytes response;
    };

    /// Outbound request failed before response was received
    struct OutboundFailure {
      RequestId request_id;
      std::error_code error;
    };
  }  // namespace swarm_event

  using SwarmEvent = boost::variant<swarm_event::PeerDiscovered,
                                    swarm_event::BroadcastReceived,
                                    swarm_event::InboundRequest,
                                    swarm_event::InboundResponse,
                                    swarm_event::OutboundFailure>;

  /**
   * Wire side of overlay: transport, discovery, broadcast and artifact
   * exchange protocol. Owned and called only by overlay engine. Events and
   * callbacks are delivered on engine's execution context.
   */
  class Swarm {
   public:
    using EventHandler = std::function<void(SwarmEvent)>;

    virtual ~Swarm() = default;

    /**
     * Starts protocols, events are delivered to handler until stop
     */
    virtual void start(EventHandler handler) = 0;

    virtual void stop() = 0;

    virtual PeerId selfId() const = 0;

    virtual outcome::result<void> listen(const Multiaddress &address) = 0;

    virtual outcome::result<void> dial(const PeerId &peer,
                                       const Multiaddress &address) = 0;

    /// Publishes presence of this node on discovery topic
    virtual outcome::result<void> announce() = 0;

    /// Publishes message on broadcast topic
    virtual outcome::result<void> publish(const Bytes &message) = 0;

    virtual void addToBroadcastView(
        const PeerId &peer, const std::vector<Multiaddress> &addresses) = 0;

    virtual void removeFromBroadcastView(const PeerId &peer) = 0;

    /// Advertises this node as provider in routing table
    virtual outcome::result<void> provide(const ArtifactHash &hash) = 0;

    virtual void findProviders(const ArtifactHash &hash,
                               CbT<std::vector<PeerId>> cb) = 0;

    /**
     * Sends request frame to peer, result is reported with InboundResponse or
     * OutboundFailure event carrying the same request id
     */
    virtual void sendRequest(RequestId request_id,
                             const PeerId &peer,
                             Bytes request) = 0;

    virtual outcome::result<void> sendResponse(ResponseChannel channel,
                                               Bytes response) = 0;

    /// Resets stream of inbound request which will not be answered
    virtual void dropResponse(ResponseChannel channel) = 0;
  };
}  // namespace pyrsia::network::overlay
