/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/builder.hpp"

#include <boost/di/extension/scopes/shared.hpp>
#include <libp2p/injector/host_injector.hpp>

#include <libp2p/crypto/random_generator/boost_generator.hpp>
#include <libp2p/protocol/gossip/gossip.hpp>
#include <libp2p/protocol/kademlia/config.hpp>
#include <libp2p/protocol/kademlia/impl/content_routing_table_impl.hpp>
#include <libp2p/protocol/kademlia/impl/kademlia_impl.hpp>
#include <libp2p/protocol/kademlia/impl/peer_routing_table_impl.hpp>
#include <libp2p/protocol/kademlia/impl/storage_backend_default.hpp>
#include <libp2p/protocol/kademlia/impl/storage_impl.hpp>
#include <libp2p/protocol/kademlia/impl/validator_default.hpp>

#include "common/http_requests/impl/request_factory_impl.hpp"
#include "common/peer_key.hpp"
#include "network/overlay/impl/libp2p_swarm.hpp"
#include "network/overlay/impl/multicast_discovery.hpp"
#include "network/overlay/overlay_engine.hpp"
#include "storage/artifact/impl/filesystem_artifact_store.hpp"

namespace pyrsia::node {
  using network::overlay::Libp2pSwarm;
  using network::overlay::MulticastDiscovery;
  using network::overlay::OverlayEngine;
  using network::overlay::PeerDiscovery;
  using registry::DockerHubRegistry;
  using storage::artifact::FilesystemArtifactStore;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("node");
      return logger;
    }

    std::shared_ptr<libp2p::protocol::kademlia::KademliaImpl> createKademlia(
        Config &config,
        const NodeObjects &o,
        std::shared_ptr<libp2p::peer::IdentityManager> id_manager,
        std::shared_ptr<libp2p::event::Bus> bus) {
      config.kademlia_config.protocolId = "/pyrsia/kad/1.0.0";

      config.kademlia_config.randomWalk.enabled = false;

      std::shared_ptr<libp2p::protocol::kademlia::Storage> kad_storage =
          std::make_shared<libp2p::protocol::kademlia::StorageImpl>(
              config.kademlia_config,
              std::make_shared<
                  libp2p::protocol::kademlia::StorageBackendDefault>(),
              o.scheduler);

      std::shared_ptr<libp2p::protocol::kademlia::ContentRoutingTable>
          content_routing_table = std::make_shared<
              libp2p::protocol::kademlia::ContentRoutingTableImpl>(
              config.kademlia_config, *o.scheduler, bus);

      std::shared_ptr<libp2p::protocol::kademlia::PeerRoutingTable>
          peer_routing_table = std::make_shared<
              libp2p::protocol::kademlia::PeerRoutingTableImpl>(
              config.kademlia_config, id_manager, bus);

      std::shared_ptr<libp2p::protocol::kademlia::Validator> validator =
          std::make_shared<libp2p::protocol::kademlia::ValidatorDefault>();

      std::shared_ptr<libp2p::crypto::random::RandomGenerator>
          random_generator =
              std::make_shared<libp2p::crypto::random::BoostRandomGenerator>();

      return std::make_shared<libp2p::protocol::kademlia::KademliaImpl>(
          config.kademlia_config,
          o.host,
          std::move(kad_storage),
          std::move(content_routing_table),
          std::move(peer_routing_table),
          std::move(validator),
          o.scheduler,
          std::move(bus),
          std::move(random_generator));
    }
  }  // namespace

  outcome::result<NodeObjects> createNodeObjects(Config &config) {
    NodeObjects o;

    log()->debug("Opening artifact store...");

    OUTCOME_TRYA(o.artifact_store,
                 FilesystemArtifactStore::create(config.artifactsPath(),
                                                 config.disk_allocated_bytes));

    log()->debug("Creating host...");

    OUTCOME_TRY(keypair, loadPeerKey(config.keyPath()));

    auto injector = libp2p::injector::makeHostInjector<
        boost::di::extension::shared_config>(
        libp2p::injector::useKeyPair(keypair));

    o.io_context = injector.create<std::shared_ptr<boost::asio::io_context>>();
    o.scheduler = injector.create<std::shared_ptr<Scheduler>>();

    o.host = injector.create<std::shared_ptr<libp2p::Host>>();

    log()->debug("Creating protocols...");

    o.gossip = libp2p::protocol::gossip::create(
        o.scheduler,
        o.host,
        injector.create<std::shared_ptr<libp2p::peer::IdentityManager>>(),
        injector.create<std::shared_ptr<libp2p::crypto::CryptoProvider>>(),
        injector.create<
            std::shared_ptr<libp2p::crypto::marshaller::KeyMarshaller>>(),
        config.gossip_config);

    auto id_manager =
        injector.create<std::shared_ptr<libp2p::peer::IdentityManager>>();

    auto bus = injector.create<std::shared_ptr<libp2p::event::Bus>>();

    o.kademlia =
        createKademlia(config, o, std::move(id_manager), std::move(bus));

    const auto overlay_config{config.overlayConfig()};
    auto swarm{std::make_shared<Libp2pSwarm>(
        overlay_config, o.host, o.gossip, o.kademlia)};
    std::shared_ptr<PeerDiscovery> lan_discovery;
    if (config.lan_discovery.enabled) {
      lan_discovery = std::make_shared<MulticastDiscovery>(
          config.lan_discovery,
          o.io_context,
          o.host->getId(),
          [host{o.host}] { return host->getAddresses(); });
    }
    o.overlay = std::make_shared<OverlayEngine>(overlay_config,
                                                o.io_context,
                                                o.scheduler,
                                                std::move(swarm),
                                                std::move(lan_discovery));

    NetworkClient client{o.overlay->commands(), config.commandTimeout()};

    log()->debug("Creating retrieval...");

    o.origin = std::make_shared<DockerHubRegistry>(
        config.dockerHubConfig(),
        std::make_shared<common::RequestFactoryImpl>());

    o.cascade = std::make_shared<retrieval::RetrievalCascade>(
        o.artifact_store, client, o.origin, config.cascadeConfig());

    o.store_thread = std::make_shared<IoThread>(config.io_threads);
    o.node = std::make_shared<ArtifactNode>(o.cascade,
                                            o.artifact_store,
                                            client,
                                            config.disk_allocated,
                                            o.store_thread->io);

    return o;
  }
}  // namespace pyrsia::node
