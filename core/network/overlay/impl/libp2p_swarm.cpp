/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/overlay/impl/libp2p_swarm.hpp"

#include <algorithm>

#include <libp2p/basic/varint_reader.hpp>
#include <libp2p/multi/uvarint.hpp>
#include <libp2p/protocol/kademlia/content_id.hpp>

#include "common/logger.hpp"
#include "common/ptr.hpp"
#include "network/overlay/artifact_exchange.hpp"
#include "network/overlay/broadcast_message.hpp"
#include "network/overlay/overlay_error.hpp"

namespace pyrsia::network::overlay {
  using libp2p::multi::UVarint;
  using libp2p::peer::PeerInfo;
  using libp2p::protocol::kademlia::ContentId;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("swarm");
      return logger.get();
    }

    std::vector<Multiaddress> parseAddresses(
        const std::vector<std::string> &strings) {
      std::vector<Multiaddress> addresses;
      for (const auto &str : strings) {
        if (auto address{Multiaddress::create(str)}) {
          addresses.push_back(std::move(address.value()));
        }
      }
      return addresses;
    }
  }  // namespace

  Libp2pSwarm::Libp2pSwarm(const OverlayConfig &config,
                           std::shared_ptr<Host> host,
                           std::shared_ptr<Gossip> gossip,
                           std::shared_ptr<Kademlia> kademlia)
      : config_{config},
        host_{std::move(host)},
        gossip_{std::move(gossip)},
        kademlia_{std::move(kademlia)} {}

  void Libp2pSwarm::start(EventHandler handler) {
    handler_ = std::move(handler);
    started_ = true;

    host_->setProtocolHandler(
        kArtifactExchangeProtocol,
        weakCb(*this,
               [](std::shared_ptr<Libp2pSwarm> &&self, StreamPtr stream) {
                 self->onInboundStream(std::move(stream));
               }));

    gossip_->setValidator(kDiscoveryTopic,
                          [](const Bytes &, const Bytes &data) {
                            auto message{decodeBroadcast(data)};
                            return message
                                   && boost::get<broadcast::Announce>(
                                          &message.value());
                          });
    gossip_->setValidator(kBroadcastTopic,
                          [](const Bytes &, const Bytes &data) {
                            return decodeBroadcast(data).has_value();
                          });

    discovery_sub_ = gossip_->subscribe(
        {kDiscoveryTopic},
        weakCb(*this,
               [](std::shared_ptr<Libp2pSwarm> &&self,
                  boost::optional<const Gossip::Message &> message) {
                 if (!message) {
                   return;
                 }
                 if (auto peer{PeerId::fromBytes(message->from)}) {
                   self->onAnnounce(peer.value(), message->data);
                 }
               }));
    broadcast_sub_ = gossip_->subscribe(
        {kBroadcastTopic},
        weakCb(*this,
               [](std::shared_ptr<Libp2pSwarm> &&self,
                  boost::optional<const Gossip::Message &> message) {
                 if (!message) {
                   return;
                 }
                 if (auto peer{PeerId::fromBytes(message->from)}) {
                   self->emit(swarm_event::BroadcastReceived{
                       std::move(peer.value()), message->data});
                 }
               }));

    kademlia_->start();
    gossip_->start();
  }

  void Libp2pSwarm::stop() {
    if (!started_) {
      return;
    }
    started_ = false;
    handler_ = nullptr;
    discovery_sub_.cancel();
    broadcast_sub_.cancel();
    for (auto &it : inbound_) {
      it.second->reset();
    }
    inbound_.clear();
    gossip_->stop();
  }

  PeerId Libp2pSwarm::selfId() const {
    return host_->getId();
  }

  outcome::result<void> Libp2pSwarm::listen(const Multiaddress &address) {
    if (auto res{host_->listen(address)}; !res) {
      log()->error("cannot listen to {}: {}",
                   address.getStringAddress(),
                   res.error().message());
      return OverlayError::kListenFailed;
    }
    host_->start();
    for (const auto &listening : host_->getAddresses()) {
      log()->info("listening on {}/p2p/{}",
                  listening.getStringAddress(),
                  host_->getId().toBase58());
    }
    return outcome::success();
  }

  outcome::result<void> Libp2pSwarm::dial(const PeerId &peer,
                                          const Multiaddress &address) {
    if (peer == host_->getId()) {
      return OverlayError::kDialFailed;
    }
    PeerInfo info{peer, {address}};
    host_->connect(info);
    gossip_->addBootstrapPeer(peer, address);
    kademlia_->addPeer(info, true);
    return outcome::success();
  }

  outcome::result<void> Libp2pSwarm::announce() {
    broadcast::Announce announce;
    for (const auto &address : host_->getAddresses()) {
      announce.addresses.push_back(std::string{address.getStringAddress()});
    }
    if (!gossip_->publish({kDiscoveryTopic}, encodeBroadcast(announce))) {
      return OverlayError::kBroadcastFailed;
    }
    return outcome::success();
  }

  outcome::result<void> Libp2pSwarm::publish(const Bytes &message) {
    if (!gossip_->publish({kBroadcastTopic}, message)) {
      return OverlayError::kBroadcastFailed;
    }
    return outcome::success();
  }

  void Libp2pSwarm::addToBroadcastView(
      const PeerId &peer, const std::vector<Multiaddress> &addresses) {
    if (addresses.empty()) {
      gossip_->addBootstrapPeer(peer, boost::none);
    } else {
      gossip_->addBootstrapPeer(peer, addresses.front());
      kademlia_->addPeer(PeerInfo{peer, addresses}, false);
    }
  }

  void Libp2pSwarm::removeFromBroadcastView(const PeerId &peer) {
    host_->getNetwork().closeConnections(peer);
  }

  outcome::result<void> Libp2pSwarm::provide(const ArtifactHash &hash) {
    return kademlia_->provide(ContentId{hash.toString()}, true);
  }

  void Libp2pSwarm::findProviders(const ArtifactHash &hash,
                                  CbT<std::vector<PeerId>> cb) {
    auto res{kademlia_->findProviders(
        ContentId{hash.toString()},
        config_.max_providers,
        [cb](outcome::result<std::vector<PeerInfo>> providers) {
          if (!providers) {
            return cb(providers.error());
          }
          std::vector<PeerId> peers;
          peers.reserve(providers.value().size());
          for (auto &info : providers.value()) {
            peers.push_back(std::move(info.id));
          }
          cb(std::move(peers));
        })};
    if (!res) {
      cb(res.error());
    }
  }

  void Libp2pSwarm::sendRequest(RequestId request_id,
                                const PeerId &peer,
                                Bytes request) {
    host_->newStream(
        PeerInfo{peer, {}},
        kArtifactExchangeProtocol,
        weakCb(*this,
               [request_id, request{std::move(request)}](
                   std::shared_ptr<Libp2pSwarm> &&self,
                   outcome::result<StreamPtr> _stream) {
                 if (!_stream) {
                   return self->emit(swarm_event::OutboundFailure{
                       request_id, _stream.error()});
                 }
                 self->writeRequest(request_id, _stream.value(), request);
               }));
  }

  void Libp2pSwarm::writeRequest(RequestId request_id,
                                 const StreamPtr &stream,
                                 const Bytes &request) {
    writeFrame(stream,
               request,
               weakCb(*this,
                      [request_id, stream](std::shared_ptr<Libp2pSwarm> &&self,
                                           outcome::result<void> written) {
                        if (!written) {
                          stream->reset();
                          return self->emit(swarm_event::OutboundFailure{
                              request_id, written.error()});
                        }
                        self->readResponse(request_id, stream);
                      }));
  }

  void Libp2pSwarm::readResponse(RequestId request_id,
                                 const StreamPtr &stream) {
    readFrame(stream,
              config_.max_frame_size,
              weakCb(*this,
                     [request_id, stream](std::shared_ptr<Libp2pSwarm> &&self,
                                          outcome::result<Bytes> frame) {
                       if (!frame) {
                         stream->reset();
                         return self->emit(swarm_event::OutboundFailure{
                             request_id, frame.error()});
                       }
                       stream->close([stream](outcome::result<void>) {});
                       self->emit(swarm_event::InboundResponse{
                           request_id, std::move(frame.value())});
                     }));
  }

  outcome::result<void> Libp2pSwarm::sendResponse(ResponseChannel channel,
                                                  Bytes response) {
    auto it{inbound_.find(channel.id)};
    if (it == inbound_.end()) {
      return OverlayError::kResponseChannelClosed;
    }
    auto stream{std::move(it->second)};
    inbound_.erase(it);
    writeFrame(stream, response, [stream](outcome::result<void> written) {
      if (!written) {
        log()->debug("cannot send response: {}", written.error().message());
        return stream->reset();
      }
      stream->close([stream](outcome::result<void>) {});
    });
    return outcome::success();
  }

  void Libp2pSwarm::dropResponse(ResponseChannel channel) {
    auto it{inbound_.find(channel.id)};
    if (it == inbound_.end()) {
      return;
    }
    it->second->reset();
    inbound_.erase(it);
  }

  void Libp2pSwarm::readFrame(const StreamPtr &stream,
                              size_t max_size,
                              CbT<Bytes> cb) {
    libp2p::basic::VarintReader::readVarint(
        stream,
        [stream, max_size, cb{std::move(cb)}](
            boost::optional<UVarint> varint) {
          if (!varint) {
            return cb(OverlayError::kPeerTransferFailed);
          }
          const auto size{varint->toUInt64()};
          if (auto checked{checkFrameSize(size, max_size)}; !checked) {
            log()->debug("refused frame of {} bytes: {}",
                         size,
                         checked.error().message());
            return cb(OverlayError::kPeerTransferFailed);
          }
          readChunks(stream, std::make_shared<Bytes>(), size, cb);
        });
  }

  void Libp2pSwarm::readChunks(const StreamPtr &stream,
                               std::shared_ptr<Bytes> buffer,
                               size_t size,
                               CbT<Bytes> cb) {
    const auto offset{buffer->size()};
    if (offset == size) {
      return cb(std::move(*buffer));
    }
    const auto chunk{std::min(size - offset, kReadChunkSize)};
    buffer->resize(offset + chunk);
    stream->read(
        BytesOut{buffer->data() + offset, chunk},
        chunk,
        [stream, buffer, size, chunk, cb{std::move(cb)}](
            outcome::result<size_t> read) {
          if (!read) {
            return cb(read.error());
          }
          if (read.value() != chunk) {
            return cb(OverlayError::kPeerTransferFailed);
          }
          readChunks(stream, buffer, size, cb);
        });
  }

  void Libp2pSwarm::writeFrame(const StreamPtr &stream,
                               const Bytes &frame,
                               CbT<void> cb) {
    auto buffer{std::make_shared<Bytes>(UVarint{frame.size()}.toVector())};
    append(*buffer, frame);
    stream->write(*buffer,
                  buffer->size(),
                  [buffer, cb{std::move(cb)}](outcome::result<size_t> written) {
                    if (!written) {
                      return cb(written.error());
                    }
                    cb(outcome::success());
                  });
  }

  void Libp2pSwarm::onInboundStream(StreamPtr stream) {
    auto peer{stream->remotePeerId()};
    if (!peer) {
      return stream->reset();
    }
    readFrame(stream,
              kMaxRequestFrameSize,
              weakCb(*this,
                     [stream, peer{std::move(peer.value())}](
                         std::shared_ptr<Libp2pSwarm> &&self,
                         outcome::result<Bytes> frame) {
                       if (!frame) {
                         log()->debug("cannot read request from {}: {}",
                                      peer.toBase58(),
                                      frame.error().message());
                         return stream->reset();
                       }
                       if (!self->started_) {
                         return stream->reset();
                       }
                       const ResponseChannel channel{self->next_channel_++};
                       self->inbound_.emplace(channel.id, stream);
                       self->emit(swarm_event::InboundRequest{
                           peer, std::move(frame.value()), channel});
                     }));
  }

  void Libp2pSwarm::onAnnounce(const PeerId &from, BytesIn data) {
    auto message{decodeBroadcast(data)};
    if (!message) {
      return;
    }
    if (auto announce{boost::get<broadcast::Announce>(&message.value())}) {
      emit(swarm_event::PeerDiscovered{from,
                                       parseAddresses(announce->addresses)});
    }
  }

  void Libp2pSwarm::emit(SwarmEvent event) {
    if (started_ && handler_) {
      handler_(std::move(event));
    }
  }
}  // namespace pyrsia::network::overlay
