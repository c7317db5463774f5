/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/overlay/overlay_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::network::overlay, OverlayError, e) {
  using pyrsia::network::overlay::OverlayError;
  switch (e) {
    case OverlayError::kPeerTimeout:
      return "OverlayError: peer did not respond in time";
    case OverlayError::kPeerTransferFailed:
      return "OverlayError: transfer from peer failed";
    case OverlayError::kArtifactNotFound:
      return "OverlayError: peer does not have artifact";
    case OverlayError::kResponseChannelClosed:
      return "OverlayError: response channel is closed or expired";
    case OverlayError::kChannelClosed:
      return "OverlayError: overlay engine is stopped";
    case OverlayError::kChannelFull:
      return "OverlayError: command channel is full";
    case OverlayError::kCommandTimeout:
      return "OverlayError: command was not completed in time";
    case OverlayError::kInvalidAddress:
      return "OverlayError: invalid address";
    case OverlayError::kListenFailed:
      return "OverlayError: cannot listen on address";
    case OverlayError::kDialFailed:
      return "OverlayError: cannot dial peer";
    case OverlayError::kBroadcastFailed:
      return "OverlayError: cannot publish broadcast message";
    case OverlayError::kDiscoveryFailed:
      return "OverlayError: local network discovery is not running";
  }
  return "OverlayError: unknown error";
}
