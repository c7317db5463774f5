/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/overlay/overlay_engine.hpp"

#include <algorithm>

#include "common/logger.hpp"
#include "common/ptr.hpp"
#include "common/visitor.hpp"
#include "network/overlay/overlay_error.hpp"

namespace pyrsia::network::overlay {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("overlay");
      return logger.get();
    }

    void pushUnique(ProviderSet &set, const PeerId &peer) {
      if (std::find(set.begin(), set.end(), peer) == set.end()) {
        set.push_back(peer);
      }
    }
  }  // namespace

  OverlayEngine::OverlayEngine(OverlayConfig config,
                               std::shared_ptr<boost::asio::io_context> io,
                               std::shared_ptr<Scheduler> scheduler,
                               std::shared_ptr<Swarm> swarm,
                               std::shared_ptr<PeerDiscovery> lan_discovery)
      : config_{config},
        io_{std::move(io)},
        scheduler_{std::move(scheduler)},
        swarm_{std::move(swarm)},
        lan_discovery_{std::move(lan_discovery)},
        commands_{std::make_shared<CommandChannel>(io_,
                                                   config_.command_capacity)},
        events_{std::make_shared<adt::Channel<InboundEvent>>()},
        self_{swarm_->selfId()} {}

  void OverlayEngine::start() {
    swarm_->start(weakCb(*this,
                         [](std::shared_ptr<OverlayEngine> &&self,
                            SwarmEvent event) {
                           self->onSwarmEvent(std::move(event));
                         }));
    if (lan_discovery_) {
      auto started{lan_discovery_->start(
          weakCb(*this,
                 [](std::shared_ptr<OverlayEngine> &&self,
                    swarm_event::PeerDiscovered event) {
                   self->onSwarmEvent(std::move(event));
                 }))};
      if (!started) {
        log()->warn("local network discovery is disabled: {}",
                    started.error().message());
        lan_discovery_.reset();
      }
    }
    commands_->setHandler(
        weakCb(*this,
               [](std::shared_ptr<OverlayEngine> &&self, Command command) {
                 self->onCommand(std::move(command));
               }));
    scheduleTick();
    log()->info("overlay started, peer id {}", self_.toBase58());
  }

  void OverlayEngine::stop() {
    if (stopped_) {
      return;
    }
    stopped_ = true;
    for (auto &command : commands_->close()) {
      failCommand(command, OverlayError::kChannelClosed);
    }
    tick_.cancel();
    auto pending{std::move(pending_)};
    pending_.clear();
    for (auto &[id, request] : pending) {
      request.timeout.cancel();
      request.reply.complete(OverlayError::kChannelClosed);
    }
    for (auto &[id, channel] : channels_) {
      swarm_->dropResponse(ResponseChannel{id});
    }
    channels_.clear();
    events_->closeWrite();
    if (lan_discovery_) {
      lan_discovery_->stop();
    }
    swarm_->stop();
    log()->info("overlay stopped");
  }

  std::shared_ptr<CommandChannel> OverlayEngine::commands() const {
    return commands_;
  }

  std::shared_ptr<adt::Channel<InboundEvent>> OverlayEngine::events() const {
    return events_;
  }

  size_t OverlayEngine::pendingRequests() const {
    return pending_.size();
  }

  size_t OverlayEngine::openResponseChannels() const {
    return channels_.size();
  }

  void OverlayEngine::onCommand(Command command) {
    if (stopped_) {
      return failCommand(command, OverlayError::kChannelClosed);
    }
    visit_in_place(
        command,
        [&](const command::Listen &cmd) {
          auto res{swarm_->listen(cmd.address)};
          if (!res) {
            log()->error("cannot listen on {}: {}",
                         cmd.address.getStringAddress(),
                         res.error().message());
          }
          cmd.reply.complete(res);
        },
        [&](const command::Dial &cmd) {
          cmd.reply.complete(swarm_->dial(cmd.peer, cmd.address));
        },
        [&](const command::StartProviding &cmd) { startProviding(cmd); },
        [&](const command::StopProviding &cmd) { stopProviding(cmd); },
        [&](const command::GetProviders &cmd) { getProviders(cmd); },
        [&](const command::RequestArtifact &cmd) { requestArtifact(cmd); },
        [&](const command::RespondArtifact &cmd) { respondArtifact(cmd); },
        [&](const command::ListPeers &cmd) {
          std::vector<PeerId> peers;
          peers.reserve(view_.size());
          for (const auto &it : view_) {
            peers.push_back(it.first);
          }
          cmd.reply.complete(std::move(peers));
        });
  }

  void OverlayEngine::onSwarmEvent(SwarmEvent event) {
    if (stopped_) {
      return;
    }
    visit_in_place(
        event,
        [&](const swarm_event::PeerDiscovered &e) { onPeerDiscovered(e); },
        [&](const swarm_event::BroadcastReceived &e) { onBroadcast(e); },
        [&](const swarm_event::InboundRequest &e) { onInboundRequest(e); },
        [&](swarm_event::InboundResponse &e) {
          auto response{decodeResponse(e.response)};
          if (!response) {
            log()->debug("malformed response to request {}: {}",
                         e.request_id,
                         response.error().message());
            return completeRequest(e.request_id,
                                   OverlayError::kPeerTransferFailed);
          }
          completeRequest(e.request_id,
                          responseResult(std::move(response.value())));
        },
        [&](const swarm_event::OutboundFailure &e) {
          log()->debug(
              "request {} failed: {}", e.request_id, e.error.message());
          completeRequest(e.request_id, OverlayError::kPeerTransferFailed);
        });
  }

  void OverlayEngine::startProviding(const command::StartProviding &cmd) {
    provided_.insert(cmd.hash);
    if (auto res{swarm_->provide(cmd.hash)}; !res) {
      log()->debug("cannot announce {} to routing table: {}",
                   cmd.hash,
                   res.error().message());
    }
    cmd.reply.complete(broadcast(broadcast::Provide{cmd.hash}));
  }

  void OverlayEngine::stopProviding(const command::StopProviding &cmd) {
    if (provided_.erase(cmd.hash) == 0) {
      cmd.reply.complete(outcome::success());
      return;
    }
    cmd.reply.complete(broadcast(broadcast::Withdraw{cmd.hash}));
  }

  void OverlayEngine::getProviders(const command::GetProviders &cmd) {
    struct Lookup {
      ArtifactHash hash;
      ReplySlot<ProviderSet> reply;
      Scheduler::Handle timeout;
    };
    auto lookup{std::make_shared<Lookup>(Lookup{cmd.hash, cmd.reply, {}})};
    lookup->timeout = scheduler_->scheduleWithHandle(
        weakCb(*this,
               [lookup](std::shared_ptr<OverlayEngine> &&self) {
                 log()->debug("provider lookup of {} timed out", lookup->hash);
                 lookup->reply.complete(self->knownProviders(lookup->hash, {}));
               }),
        config_.request_timeout);
    swarm_->findProviders(
        cmd.hash,
        weakCb(*this,
               [lookup](std::shared_ptr<OverlayEngine> &&self,
                        outcome::result<std::vector<PeerId>> found) {
                 lookup->timeout.cancel();
                 std::vector<PeerId> peers;
                 if (found) {
                   peers = std::move(found.value());
                 } else {
                   log()->debug("provider lookup of {} failed: {}",
                                lookup->hash,
                                found.error().message());
                 }
                 lookup->reply.complete(
                     self->knownProviders(lookup->hash, peers));
               }));
  }

  ProviderSet OverlayEngine::knownProviders(
      const ArtifactHash &hash, const std::vector<PeerId> &found) const {
    ProviderSet in_view;
    ProviderSet rest;
    auto add{[&](const PeerId &peer) {
      if (peer == self_) {
        return;
      }
      pushUnique(view_.count(peer) != 0 ? in_view : rest, peer);
    }};
    if (auto it{providers_.find(hash)}; it != providers_.end()) {
      for (const auto &peer : it->second) {
        add(peer);
      }
    }
    for (const auto &peer : found) {
      add(peer);
    }
    for (const auto &peer : rest) {
      pushUnique(in_view, peer);
    }
    return in_view;
  }

  void OverlayEngine::requestArtifact(const command::RequestArtifact &cmd) {
    const auto request_id{next_request_id_++};
    auto timeout{scheduler_->scheduleWithHandle(
        weakCb(*this,
               [request_id](std::shared_ptr<OverlayEngine> &&self) {
                 self->completeRequest(request_id, OverlayError::kPeerTimeout);
               }),
        config_.request_timeout)};
    pending_.emplace(
        request_id,
        PendingRequest{cmd.peer, cmd.hash, cmd.reply, std::move(timeout)});
    log()->debug("request {} for {} sent to {}",
                 request_id,
                 cmd.hash,
                 cmd.peer.toBase58());
    swarm_->sendRequest(request_id, cmd.peer, encodeRequest(cmd.hash));
  }

  void OverlayEngine::completeRequest(RequestId request_id,
                                      outcome::result<Bytes> result) {
    auto it{pending_.find(request_id)};
    if (it == pending_.end()) {
      log()->debug("dropped response to unknown request {}", request_id);
      return;
    }
    auto request{std::move(it->second)};
    pending_.erase(it);
    request.timeout.cancel();
    if (!result) {
      log()->debug("request {} for {} to {}: {}",
                   request_id,
                   request.hash,
                   request.peer.toBase58(),
                   result.error().message());
    }
    request.reply.complete(std::move(result));
  }

  void OverlayEngine::respondArtifact(const command::RespondArtifact &cmd) {
    auto it{channels_.find(cmd.channel.id)};
    if (it == channels_.end()) {
      cmd.reply.complete(OverlayError::kResponseChannelClosed);
      return;
    }
    if (it->second.deadline <= scheduler_->now()) {
      swarm_->dropResponse(cmd.channel);
      channels_.erase(it);
      cmd.reply.complete(OverlayError::kResponseChannelClosed);
      return;
    }
    channels_.erase(it);
    cmd.reply.complete(
        swarm_->sendResponse(cmd.channel, encodeResponse(cmd.response)));
  }

  void OverlayEngine::onPeerDiscovered(
      const swarm_event::PeerDiscovered &event) {
    if (event.peer == self_) {
      return;
    }
    auto [it, inserted]{view_.emplace(event.peer, scheduler_->now())};
    if (!inserted) {
      it->second = scheduler_->now();
      return;
    }
    log()->debug("discovered {}", event.peer.toBase58());
    swarm_->addToBroadcastView(event.peer, event.addresses);
    if (auto res{broadcast(broadcast::ListRequest{event.peer})}; !res) {
      log()->debug("cannot ask {} for provided artifacts: {}",
                   event.peer.toBase58(),
                   res.error().message());
    }
  }

  void OverlayEngine::onBroadcast(const swarm_event::BroadcastReceived &event) {
    if (event.from == self_) {
      return;
    }
    auto message{decodeBroadcast(event.data)};
    if (!message) {
      log()->debug("malformed broadcast from {}: {}",
                   event.from.toBase58(),
                   message.error().message());
      return;
    }
    visit_in_place(
        message.value(),
        [&](const broadcast::Announce &) {},
        [&](const broadcast::Provide &provide) {
          addProvider(provide.hash, event.from);
        },
        [&](const broadcast::Withdraw &withdraw) {
          removeProvider(withdraw.hash, event.from);
        },
        [&](const broadcast::ListRequest &request) {
          if (request.peer && !(*request.peer == self_)) {
            return;
          }
          std::vector<ArtifactHash> hashes(provided_.begin(),
                                           provided_.end());
          std::sort(hashes.begin(), hashes.end());
          if (auto res{broadcast(
                  broadcast::ListResponse{event.from, std::move(hashes)})};
              !res) {
            log()->debug("cannot answer list request of {}: {}",
                         event.from.toBase58(),
                         res.error().message());
          }
        },
        [&](const broadcast::ListResponse &response) {
          for (const auto &hash : response.hashes) {
            addProvider(hash, event.from);
          }
        });
  }

  void OverlayEngine::onInboundRequest(
      const swarm_event::InboundRequest &event) {
    auto hash{decodeRequest(event.request)};
    if (!hash) {
      log()->debug("malformed request from {}: {}",
                   event.from.toBase58(),
                   hash.error().message());
      if (auto res{swarm_->sendResponse(
              event.channel,
              encodeResponse(ArtifactResponse::error("malformed request")))};
          !res) {
        swarm_->dropResponse(event.channel);
      }
      return;
    }
    const auto deadline{scheduler_->now() + config_.request_timeout};
    channels_.emplace(event.channel.id,
                      OpenChannel{event.from, hash.value(), deadline});
    if (!events_->write(
            InboundEvent{event.from, hash.value(), event.channel})) {
      log()->warn("no reader of inbound requests, dropping request from {}",
                  event.from.toBase58());
      channels_.erase(event.channel.id);
      swarm_->dropResponse(event.channel);
    }
  }

  void OverlayEngine::addProvider(const ArtifactHash &hash,
                                  const PeerId &peer) {
    pushUnique(providers_[hash], peer);
  }

  void OverlayEngine::removeProvider(const ArtifactHash &hash,
                                     const PeerId &peer) {
    auto it{providers_.find(hash)};
    if (it == providers_.end()) {
      return;
    }
    auto &peers{it->second};
    peers.erase(std::remove(peers.begin(), peers.end(), peer), peers.end());
    if (peers.empty()) {
      providers_.erase(it);
    }
  }

  outcome::result<void> OverlayEngine::broadcast(
      const BroadcastMessage &message) {
    if (auto res{swarm_->publish(encodeBroadcast(message))}; !res) {
      log()->debug("broadcast failed: {}", res.error().message());
      return OverlayError::kBroadcastFailed;
    }
    return outcome::success();
  }

  void OverlayEngine::scheduleTick() {
    tick_ = scheduler_->scheduleWithHandle(
        weakCb(*this,
               [](std::shared_ptr<OverlayEngine> &&self) { self->onTick(); }),
        config_.announce_interval);
  }

  void OverlayEngine::onTick() {
    if (stopped_) {
      return;
    }
    if (auto res{swarm_->announce()}; !res) {
      log()->debug("cannot announce presence: {}", res.error().message());
    }
    if (lan_discovery_) {
      if (auto res{lan_discovery_->announce()}; !res) {
        log()->debug("cannot announce presence on local network: {}",
                     res.error().message());
      }
    }
    sweepView();
    sweepChannels();
    scheduleTick();
  }

  void OverlayEngine::sweepView() {
    const auto now{scheduler_->now()};
    for (auto it{view_.begin()}; it != view_.end();) {
      if (it->second + config_.discovery_ttl > now) {
        ++it;
        continue;
      }
      const auto peer{it->first};
      it = view_.erase(it);
      log()->debug("{} expired from view", peer.toBase58());
      swarm_->removeFromBroadcastView(peer);
      for (auto records{providers_.begin()}; records != providers_.end();) {
        auto &peers{records->second};
        peers.erase(std::remove(peers.begin(), peers.end(), peer),
                    peers.end());
        records = peers.empty() ? providers_.erase(records) : ++records;
      }
    }
  }

  void OverlayEngine::sweepChannels() {
    const auto now{scheduler_->now()};
    for (auto it{channels_.begin()}; it != channels_.end();) {
      if (it->second.deadline > now) {
        ++it;
        continue;
      }
      log()->debug("request of {} for {} expired unanswered",
                   it->second.from.toBase58(),
                   it->second.hash);
      swarm_->dropResponse(ResponseChannel{it->first});
      it = channels_.erase(it);
    }
  }
}  // namespace pyrsia::network::overlay
