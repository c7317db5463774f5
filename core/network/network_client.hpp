/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/overlay/command_channel.hpp"
#include "network/overlay/overlay_error.hpp"

namespace pyrsia::network {
  using overlay::ArtifactHash;
  using overlay::ArtifactResponse;
  using overlay::CommandChannel;
  using overlay::Multiaddress;
  using overlay::PeerId;
  using overlay::ProviderSet;
  using overlay::ResponseChannel;

  /**
   * Handle to overlay engine, cheap to copy and safe to use from any thread.
   * Every operation has callback form, completed on engine thread, and
   * blocking form, which must not be called on engine thread.
   */
  class NetworkClient {
   public:
    /**
     * @param commands - command channel of overlay engine
     * @param command_timeout - how long blocking forms wait for reply
     */
    NetworkClient(std::shared_ptr<CommandChannel> commands,
                  std::chrono::milliseconds command_timeout);

    void listen(const Multiaddress &address, CbT<void> cb) const;
    outcome::result<void> listen(const Multiaddress &address) const;

    void dial(const PeerId &peer,
              const Multiaddress &address,
              CbT<void> cb) const;
    outcome::result<void> dial(const PeerId &peer,
                               const Multiaddress &address) const;

    /// Starts providing artifact to other peers
    void provide(const ArtifactHash &hash, CbT<void> cb) const;
    outcome::result<void> provide(const ArtifactHash &hash) const;

    void stopProviding(const ArtifactHash &hash, CbT<void> cb) const;
    outcome::result<void> stopProviding(const ArtifactHash &hash) const;

    /// Peers which may provide artifact, possibly empty
    void listProviders(const ArtifactHash &hash, CbT<ProviderSet> cb) const;
    outcome::result<ProviderSet> listProviders(const ArtifactHash &hash) const;

    void listPeers(CbT<std::vector<PeerId>> cb) const;
    outcome::result<std::vector<PeerId>> listPeers() const;

    /**
     * Requests artifact bytes from peer. Bytes are not verified.
     * @return bytes, kArtifactNotFound, kPeerTimeout or kPeerTransferFailed
     */
    void requestArtifact(const PeerId &peer,
                         const ArtifactHash &hash,
                         CbT<Bytes> cb) const;
    outcome::result<Bytes> requestArtifact(const PeerId &peer,
                                           const ArtifactHash &hash) const;

    /// Answers inbound request received as InboundEvent
    void respondArtifact(ResponseChannel channel,
                         ArtifactResponse response,
                         CbT<void> cb) const;
    outcome::result<void> respondArtifact(ResponseChannel channel,
                                          ArtifactResponse response) const;

   private:
    void send(overlay::Command command) const;

    template <typename T, typename F>
    outcome::result<T> waitReply(const F &f) const {
      return waitCb<T>(
          f, command_timeout_, overlay::OverlayError::kCommandTimeout);
    }

    std::shared_ptr<CommandChannel> commands_;
    std::chrono::milliseconds command_timeout_;
  };
}  // namespace pyrsia::network
