/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/config.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>
#include <fstream>
#include <iostream>

#include "common/byte_size.hpp"
#include "common/outcome.hpp"

namespace libp2p::peer {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       PeerInfo *,
                       long) {
    using namespace boost::program_options;
    check_first_occurrence(out);
    auto &value{get_single_string(values)};
    if (auto _address{multi::Multiaddress::create(value)}) {
      auto &address{_address.value()};
      if (auto base58{address.getPeerId()}) {
        if (auto _id{PeerId::fromBase58(*base58)}) {
          out = PeerInfo{_id.value(), {address}};
          return;
        }
      }
    }
    boost::throw_exception(invalid_option_value{value});
  }
}  // namespace libp2p::peer

namespace pyrsia::node {
  /// Margin over request timeout left for command queueing
  constexpr std::chrono::seconds kCommandTimeoutMargin{5};

  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }

  Config Config::read(int argc, char **argv) {
    Config config;
    struct {
      char log_level;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("Pyrsia node options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("repo", po::value(&config.repo_path)->required());
    option("listen",
           po::value(&config.listen)->default_value("/ip4/0.0.0.0/tcp/44000"),
           "multiaddress to listen to");
    option("peer,p",
           po::value(&config.bootstrap_list)->composing(),
           "remote peer uri with /p2p/<id> to dial on start");
    option("disk-allocated",
           po::value(&config.disk_allocated)->default_value("10 GB"),
           "space allocated for artifacts, e.g. \"10 GB\" or \"512MiB\"");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("log-file", po::value(&config.log_file), "also log to file");
    option("request-timeout",
           po::value(&config.request_timeout_sec)->default_value(30),
           "peer request timeout (seconds)");
    option("discovery-ttl",
           po::value(&config.discovery_ttl_sec)->default_value(30),
           "peer is forgotten when not announced for (seconds)");
    option("announce-interval",
           po::value(&config.announce_interval_sec)->default_value(10),
           "presence announcement period (seconds)");
    option("lan-discovery",
           po::value(&config.lan_discovery.enabled)->default_value(true),
           "announce and discover peers on local network");
    option("lan-group",
           po::value(&config.lan_discovery.group)
               ->default_value(config.lan_discovery.group),
           "multicast group of local network discovery");
    option("lan-port",
           po::value(&config.lan_discovery.port)
               ->default_value(config.lan_discovery.port),
           "udp port of local network discovery");
    option("origin-registry",
           po::value(&config.origin_registry)
               ->default_value("https://registry-1.docker.io"),
           "origin registry url");
    option("origin-auth",
           po::value(&config.origin_auth)
               ->default_value("https://auth.docker.io"),
           "origin registry token service url");
    option("io-threads",
           po::value(&config.io_threads)->default_value(2),
           "threads serving store reads of peer requests");

    po::variables_map vm;
    po::store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    po::notify(vm);
    boost::filesystem::create_directories(config.repo_path);
    std::ifstream config_file{config.join("config.cfg")};
    if (config_file.good()) {
      po::store(po::parse_config_file(config_file, desc), vm);
      po::notify(vm);
    }

    config.log_level = getLogLevel(raw.log_level);
    spdlog::set_level(config.log_level);

    auto allocated{common::parseByteSize(config.disk_allocated)};
    if (!allocated) {
      std::cerr << "Invalid disk allocation \"" << config.disk_allocated
                << "\": " << allocated.error().message() << std::endl;
      exit(EXIT_FAILURE);
    }
    config.disk_allocated_bytes = allocated.value();

    if (!Multiaddress::create(config.listen)) {
      std::cerr << "Invalid listen address " << config.listen << std::endl;
      exit(EXIT_FAILURE);
    }

    config.gossip_config.sign_messages = true;

    return config;
  }

  std::string Config::join(const std::string &path) const {
    return (repo_path / path).string();
  }

  std::string Config::keyPath() const {
    return join("peer_ed25519.key");
  }

  std::string Config::artifactsPath() const {
    return join("artifacts");
  }

  Multiaddress Config::p2pListenAddress() const {
    OUTCOME_EXCEPT(address, Multiaddress::create(listen));
    return address;
  }

  network::overlay::OverlayConfig Config::overlayConfig() const {
    network::overlay::OverlayConfig overlay;
    overlay.request_timeout = std::chrono::seconds{request_timeout_sec};
    overlay.discovery_ttl = std::chrono::seconds{discovery_ttl_sec};
    overlay.announce_interval = std::chrono::seconds{announce_interval_sec};
    return overlay;
  }

  registry::DockerHubConfig Config::dockerHubConfig() const {
    registry::DockerHubConfig docker_hub;
    docker_hub.registry_url = origin_registry;
    docker_hub.auth_url = origin_auth;
    return docker_hub;
  }

  retrieval::CascadeConfig Config::cascadeConfig() const {
    return retrieval::CascadeConfig{};
  }

  std::chrono::milliseconds Config::commandTimeout() const {
    return std::chrono::seconds{request_timeout_sec} + kCommandTimeoutMargin;
  }
}  // namespace pyrsia::node
