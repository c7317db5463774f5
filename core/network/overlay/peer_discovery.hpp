/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/overlay/swarm.hpp"

namespace pyrsia::network::overlay {
  /**
   * Source of peers found outside of connected mesh, e.g. on local network.
   * Owned and called only by overlay engine, discovered peers are delivered
   * on engine's execution context.
   */
  class PeerDiscovery {
   public:
    using Handler = std::function<void(swarm_event::PeerDiscovered)>;

    virtual ~PeerDiscovery() = default;

    virtual outcome::result<void> start(Handler handler) = 0;

    virtual void stop() = 0;

    /// Tells peers on local network about this node
    virtual outcome::result<void> announce() = 0;
  };
}  // namespace pyrsia::network::overlay
