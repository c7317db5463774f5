/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <libp2p/peer/peer_info.hpp>
#include <libp2p/protocol/gossip/gossip.hpp>
#include <libp2p/protocol/kademlia/config.hpp>

#include "common/logger.hpp"
#include "network/overlay/impl/multicast_discovery.hpp"
#include "network/overlay/overlay_config.hpp"
#include "registry/impl/docker_hub_registry.hpp"
#include "retrieval/retrieval_cascade.hpp"

namespace pyrsia::node {
  using libp2p::multi::Multiaddress;

  struct Config {
    boost::filesystem::path repo_path;
    spdlog::level::level_enum log_level;
    boost::optional<boost::filesystem::path> log_file;
    std::string listen;
    std::vector<libp2p::peer::PeerInfo> bootstrap_list;
    /// Human readable allocation, reported by status
    std::string disk_allocated;
    uint64_t disk_allocated_bytes{};
    size_t request_timeout_sec{};
    size_t discovery_ttl_sec{};
    size_t announce_interval_sec{};
    size_t io_threads{};
    network::overlay::LanDiscoveryConfig lan_discovery;
    std::string origin_registry;
    std::string origin_auth;
    libp2p::protocol::gossip::Config gossip_config;
    libp2p::protocol::kademlia::Config kademlia_config;

    static Config read(int argc, char *argv[]);

    std::string join(const std::string &path) const;
    std::string keyPath() const;
    std::string artifactsPath() const;
    Multiaddress p2pListenAddress() const;

    network::overlay::OverlayConfig overlayConfig() const;
    registry::DockerHubConfig dockerHubConfig() const;
    retrieval::CascadeConfig cascadeConfig() const;
    /// Blocking client calls wait this long for engine reply
    std::chrono::milliseconds commandTimeout() const;
  };
}  // namespace pyrsia::node
