/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/network_client.hpp"

#include "common/logger.hpp"

namespace pyrsia::network {
  using overlay::OverlayError;
  using overlay::ReplySlot;
  namespace command = overlay::command;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("network_client");
      return logger.get();
    }
  }  // namespace

  NetworkClient::NetworkClient(std::shared_ptr<CommandChannel> commands,
                               std::chrono::milliseconds command_timeout)
      : commands_{std::move(commands)}, command_timeout_{command_timeout} {}

  void NetworkClient::send(overlay::Command command) const {
    if (commands_->send(command)) {
      return;
    }
    if (commands_->isClosed()) {
      return overlay::failCommand(command, OverlayError::kChannelClosed);
    }
    log()->warn("command channel is full, {} commands queued",
                commands_->size());
    overlay::failCommand(command, OverlayError::kChannelFull);
  }

  void NetworkClient::listen(const Multiaddress &address, CbT<void> cb) const {
    send(command::Listen{address, ReplySlot<void>{std::move(cb)}});
  }

  outcome::result<void> NetworkClient::listen(
      const Multiaddress &address) const {
    return waitReply<void>(
        [&](CbT<void> cb) { listen(address, std::move(cb)); });
  }

  void NetworkClient::dial(const PeerId &peer,
                           const Multiaddress &address,
                           CbT<void> cb) const {
    send(command::Dial{peer, address, ReplySlot<void>{std::move(cb)}});
  }

  outcome::result<void> NetworkClient::dial(const PeerId &peer,
                                            const Multiaddress &address) const {
    return waitReply<void>(
        [&](CbT<void> cb) { dial(peer, address, std::move(cb)); });
  }

  void NetworkClient::provide(const ArtifactHash &hash, CbT<void> cb) const {
    send(command::StartProviding{hash, ReplySlot<void>{std::move(cb)}});
  }

  outcome::result<void> NetworkClient::provide(const ArtifactHash &hash) const {
    return waitReply<void>(
        [&](CbT<void> cb) { provide(hash, std::move(cb)); });
  }

  void NetworkClient::stopProviding(const ArtifactHash &hash,
                                    CbT<void> cb) const {
    send(command::StopProviding{hash, ReplySlot<void>{std::move(cb)}});
  }

  outcome::result<void> NetworkClient::stopProviding(
      const ArtifactHash &hash) const {
    return waitReply<void>(
        [&](CbT<void> cb) { stopProviding(hash, std::move(cb)); });
  }

  void NetworkClient::listProviders(const ArtifactHash &hash,
                                    CbT<ProviderSet> cb) const {
    send(command::GetProviders{hash, ReplySlot<ProviderSet>{std::move(cb)}});
  }

  outcome::result<ProviderSet> NetworkClient::listProviders(
      const ArtifactHash &hash) const {
    return waitReply<ProviderSet>(
        [&](CbT<ProviderSet> cb) { listProviders(hash, std::move(cb)); });
  }

  void NetworkClient::listPeers(CbT<std::vector<PeerId>> cb) const {
    send(command::ListPeers{ReplySlot<std::vector<PeerId>>{std::move(cb)}});
  }

  outcome::result<std::vector<PeerId>> NetworkClient::listPeers() const {
    return waitReply<std::vector<PeerId>>(
        [&](CbT<std::vector<PeerId>> cb) { listPeers(std::move(cb)); });
  }

  void NetworkClient::requestArtifact(const PeerId &peer,
                                      const ArtifactHash &hash,
                                      CbT<Bytes> cb) const {
    send(command::RequestArtifact{
        peer, hash, ReplySlot<Bytes>{std::move(cb)}});
  }

  outcome::result<Bytes> NetworkClient::requestArtifact(
      const PeerId &peer, const ArtifactHash &hash) const {
    return waitReply<Bytes>(
        [&](CbT<Bytes> cb) { requestArtifact(peer, hash, std::move(cb)); });
  }

  void NetworkClient::respondArtifact(ResponseChannel channel,
                                      ArtifactResponse response,
                                      CbT<void> cb) const {
    send(command::RespondArtifact{
        channel, std::move(response), ReplySlot<void>{std::move(cb)}});
  }

  outcome::result<void> NetworkClient::respondArtifact(
      ResponseChannel channel, ArtifactResponse response) const {
    return waitReply<void>([&](CbT<void> cb) {
      respondArtifact(channel, std::move(response), std::move(cb));
    });
  }
}  // namespace pyrsia::network
