/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <unordered_map>
#include <unordered_set>

#include <libp2p/basic/scheduler.hpp>

#include "adt/channel.hpp"
#include "network/overlay/broadcast_message.hpp"
#include "network/overlay/command_channel.hpp"
#include "network/overlay/inbound_event.hpp"
#include "network/overlay/overlay_config.hpp"
#include "network/overlay/peer_discovery.hpp"
#include "network/overlay/swarm.hpp"

namespace pyrsia::network::overlay {
  using libp2p::basic::Scheduler;

  /**
   * Exclusive owner of overlay state: partial view of peers, provider
   * records, outbound requests and inbound response channels. All state is
   * mutated on one io_context, other threads interact only through command
   * channel and inbound event channel.
   */
  class OverlayEngine : public std::enable_shared_from_this<OverlayEngine> {
   public:
    /**
     * @param lan_discovery - optional source of peers on local network,
     * announced together with presence on discovery topic
     */
    OverlayEngine(OverlayConfig config,
                  std::shared_ptr<boost::asio::io_context> io,
                  std::shared_ptr<Scheduler> scheduler,
                  std::shared_ptr<Swarm> swarm,
                  std::shared_ptr<PeerDiscovery> lan_discovery);

    /// Starts consuming commands and swarm events
    void start();

    /**
     * Closes command channel, fails queued commands and pending requests
     * with kChannelClosed and closes inbound event channel
     */
    void stop();

    std::shared_ptr<CommandChannel> commands() const;

    /// Inbound artifact requests to be answered with RespondArtifact
    std::shared_ptr<adt::Channel<InboundEvent>> events() const;

    size_t pendingRequests() const;

    size_t openResponseChannels() const;

   private:
    struct PendingRequest {
      PeerId peer;
      ArtifactHash hash;
      ReplySlot<Bytes> reply;
      Scheduler::Handle timeout;
    };

    struct OpenChannel {
      PeerId from;
      ArtifactHash hash;
      std::chrono::milliseconds deadline;
    };

    void onCommand(Command command);
    void onSwarmEvent(SwarmEvent event);

    void startProviding(const command::StartProviding &cmd);
    void stopProviding(const command::StopProviding &cmd);
    void getProviders(const command::GetProviders &cmd);
    void requestArtifact(const command::RequestArtifact &cmd);
    void respondArtifact(const command::RespondArtifact &cmd);

    void onPeerDiscovered(const swarm_event::PeerDiscovered &event);
    void onBroadcast(const swarm_event::BroadcastReceived &event);
    void onInboundRequest(const swarm_event::InboundRequest &event);
    void completeRequest(RequestId request_id, outcome::result<Bytes> result);

    ProviderSet knownProviders(const ArtifactHash &hash,
                               const std::vector<PeerId> &found) const;
    void addProvider(const ArtifactHash &hash, const PeerId &peer);
    void removeProvider(const ArtifactHash &hash, const PeerId &peer);
    outcome::result<void> broadcast(const BroadcastMessage &message);

    void scheduleTick();
    void onTick();
    void sweepView();
    void sweepChannels();

    OverlayConfig config_;
    std::shared_ptr<boost::asio::io_context> io_;
    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<Swarm> swarm_;
    std::shared_ptr<PeerDiscovery> lan_discovery_;
    std::shared_ptr<CommandChannel> commands_;
    std::shared_ptr<adt::Channel<InboundEvent>> events_;
    PeerId self_;
    bool stopped_{false};

    Scheduler::Handle tick_;
    /// Partial view, peer to time of last announcement
    std::unordered_map<PeerId, std::chrono::milliseconds> view_;
    std::unordered_set<ArtifactHash> provided_;
    /// Advisory provider records learned from broadcasts
    std::unordered_map<ArtifactHash, std::vector<PeerId>> providers_;
    std::unordered_map<RequestId, PendingRequest> pending_;
    RequestId next_request_id_{1};
    std::unordered_map<uint64_t, OpenChannel> channels_;
  };
}  // namespace pyrsia::network::overlay
