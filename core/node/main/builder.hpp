/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio.hpp>
#include <memory>

#include "common/io_thread.hpp"
#include "node/artifact_node.hpp"
#include "node/main/config.hpp"

namespace pyrsia::network::overlay {
  class OverlayEngine;
}  // namespace pyrsia::network::overlay

namespace pyrsia::node {
  using libp2p::basic::Scheduler;

  struct NodeObjects {
    // libp2p + async base objects
    std::shared_ptr<boost::asio::io_context> io_context;
    std::shared_ptr<Scheduler> scheduler;
    std::shared_ptr<libp2p::Host> host;
    std::shared_ptr<libp2p::protocol::gossip::Gossip> gossip;
    std::shared_ptr<libp2p::protocol::kademlia::Kademlia> kademlia;

    // overlay
    std::shared_ptr<network::overlay::OverlayEngine> overlay;

    // storage and retrieval
    std::shared_ptr<storage::artifact::ArtifactStore> artifact_store;
    std::shared_ptr<registry::OriginRegistry> origin;
    std::shared_ptr<retrieval::RetrievalCascade> cascade;

    /// Blocking work of inbound peer requests
    std::shared_ptr<IoThread> store_thread;
    std::shared_ptr<ArtifactNode> node;
  };

  outcome::result<NodeObjects> createNodeObjects(Config &config);
}  // namespace pyrsia::node
