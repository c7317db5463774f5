/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>

#include "adt/channel.hpp"
#include "network/overlay/inbound_event.hpp"
#include "retrieval/retrieval_cascade.hpp"

namespace pyrsia::node {
  using network::NetworkClient;
  using network::overlay::InboundEvent;
  using network::overlay::PeerId;
  using primitives::ArtifactHash;
  using retrieval::RetrievalCascade;
  using storage::artifact::ArtifactStore;

  struct NodeStatus {
    uint64_t artifact_count{};
    size_t peer_count{};
    /// Configured allocation as given in configuration, e.g. "10 GB"
    std::string disk_allocated;
    /// Used part of allocation in percent, four decimals
    std::string disk_usage;
  };

  /**
   * Interface of node used by registry api layer. Also answers artifact
   * requests of other peers from local store.
   */
  class ArtifactNode : public std::enable_shared_from_this<ArtifactNode> {
   public:
    /**
     * @param io - context running blocking store reads, must not be the
     * overlay engine context
     */
    ArtifactNode(std::shared_ptr<RetrievalCascade> cascade,
                 std::shared_ptr<ArtifactStore> store,
                 NetworkClient client,
                 std::string disk_allocated,
                 std::shared_ptr<boost::asio::io_context> io);

    outcome::result<Bytes> resolve(const std::string &name,
                                   const ArtifactHash &hash) const;

    outcome::result<Bytes> resolve(const std::string &name,
                                   std::string_view id) const;

    outcome::result<std::vector<PeerId>> listPeers() const;

    outcome::result<NodeStatus> status() const;

    /// Answers inbound requests until channel is closed
    void serve(const std::shared_ptr<adt::Channel<InboundEvent>> &events);

   private:
    void answer(const InboundEvent &event) const;

    std::shared_ptr<RetrievalCascade> cascade_;
    std::shared_ptr<ArtifactStore> store_;
    NetworkClient client_;
    std::string disk_allocated_;
    std::shared_ptr<boost::asio::io_context> io_;
  };
}  // namespace pyrsia::node
