/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace pyrsia::network::overlay {
  enum class OverlayError {
    kPeerTimeout = 1,
    kPeerTransferFailed,
    kArtifactNotFound,
    kResponseChannelClosed,
    kChannelClosed,
    kChannelFull,
    kCommandTimeout,
    kInvalidAddress,
    kListenFailed,
    kDialFailed,
    kBroadcastFailed,
    kDiscoveryFailed,
  };
}  // namespace pyrsia::network::overlay

OUTCOME_HPP_DECLARE_ERROR(pyrsia::network::overlay, OverlayError);
