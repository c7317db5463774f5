/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/overlay/types.hpp"

namespace pyrsia::network::overlay {
  /**
   * Remote peer requested artifact. Must be answered with RespondArtifact
   * command referencing channel, before request timeout elapses.
   */
  struct InboundEvent {
    PeerId from;
    ArtifactHash hash;
    ResponseChannel channel;
  };
}  // namespace pyrsia::network::overlay
