/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace pyrsia::network::overlay {
  struct OverlayConfig {
    /// Outbound requests and inbound response channels expire after it
    std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
    /// Peers not announced within it are removed from view
    std::chrono::milliseconds discovery_ttl{std::chrono::seconds{30}};
    /// Period of presence announcements and view sweeps
    std::chrono::milliseconds announce_interval{std::chrono::seconds{10}};
    /// Commands waiting in channel before send is refused
    size_t command_capacity{1024};
    /// Providers requested from routing table per lookup
    size_t max_providers{20};
    /// Largest artifact exchange frame accepted from peer
    size_t max_frame_size{size_t{1} << 30};
  };
}  // namespace pyrsia::network::overlay
