/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/multi/multiaddress.hpp>
#include <libp2p/peer/peer_id.hpp>
#include <libp2p/peer/protocol.hpp>

#include "common/bytes.hpp"
#include "primitives/artifact_hash/artifact_hash.hpp"

namespace pyrsia::network::overlay {
  using libp2p::multi::Multiaddress;
  using libp2p::peer::PeerId;
  using primitives::ArtifactHash;

  /// Peers known to provide artifact, advisory, peers in view go first
  using ProviderSet = std::vector<PeerId>;

  /// Identifies outbound artifact request
  using RequestId = uint64_t;

  /// Capability to answer one inbound artifact request
  struct ResponseChannel {
    uint64_t id{};

    bool operator==(const ResponseChannel &other) const {
      return id == other.id;
    }
  };

  const libp2p::peer::Protocol kArtifactExchangeProtocol =
      "/pyrsia/artifact-exchange/1.0.0";

  /// Gossip topic for presence announcements
  constexpr auto kDiscoveryTopic{"pyrsia-discovery"};

  /// Gossip topic for provider announcements and listings
  constexpr auto kBroadcastTopic{"pyrsia-broadcast"};
}  // namespace pyrsia::network::overlay
