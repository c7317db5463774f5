/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sys/resource.h>
#include <iostream>

#include "common/libp2p/soralog.hpp"
#include "common/logger.hpp"
#include "network/overlay/overlay_engine.hpp"
#include "node/main/builder.hpp"

void setFdLimitMax() {
  rlimit r{};
  if (getrlimit(RLIMIT_NOFILE, &r) != 0) {
    return spdlog::error("getrlimit(RLIMIT_NOFILE), errno={}", errno);
  }
  if (r.rlim_max == RLIM_INFINITY) {
    return;
  }
  r.rlim_cur = r.rlim_max;
  if (setrlimit(RLIMIT_NOFILE, &r) != 0) {
    return spdlog::error(
        "setrlimit(RLIMIT_NOFILE, {}), errno={}", r.rlim_cur, errno);
  }
}

namespace pyrsia {
  using libp2p::peer::PeerInfo;
  using network::NetworkClient;
  using node::NodeObjects;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("node");
      return logger.get();
    }

    void suppressVerboseLoggers() {
      common::createLogger("SECCONN")->set_level(spdlog::level::info);
      common::createLogger("SECIO")->set_level(spdlog::level::info);
      common::createLogger("tls")->set_level(spdlog::level::info);
      common::createLogger("gossip")->set_level(spdlog::level::warn);
      common::createLogger("kad")->set_level(spdlog::level::info);
    }
  }  // namespace

  void main(node::Config &config) {
    suppressVerboseLoggers();

    auto res = node::createNodeObjects(config);
    if (!res) {
      log()->error("Cannot initialize node: {}", res.error().message());
      exit(EXIT_FAILURE);
    }
    auto &o{res.value()};

    NetworkClient client{o.overlay->commands(), config.commandTimeout()};

    o.overlay->start();
    o.node->serve(o.overlay->events());

    const auto listen_address{config.p2pListenAddress()};
    client.listen(listen_address, [&](outcome::result<void> listened) {
      if (!listened) {
        log()->error("Cannot listen to {}: {}",
                     listen_address.getStringAddress(),
                     listened.error().message());
        o.io_context->stop();
        return;
      }
      log()->info("Node started, host PeerId {}", o.host->getId().toBase58());
    });

    for (const auto &pi : config.bootstrap_list) {
      client.dial(pi.id,
                  pi.addresses.front(),
                  [peer{pi.id}](outcome::result<void> dialed) {
                    if (!dialed) {
                      log()->warn("Cannot dial {}: {}",
                                  peer.toBase58(),
                                  dialed.error().message());
                    }
                  });
    }

    // gracefully shutdown on signal
    boost::asio::signal_set signals(*o.io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &, int) {
      o.overlay->stop();
      o.io_context->stop();
    });

    // run event loop
    o.io_context->run();
    log()->info("Node stopped");
  }
}  // namespace pyrsia

int main(int argc, char *argv[]) {
  setFdLimitMax();

  auto config{pyrsia::node::Config::read(argc, argv)};
  pyrsia::libp2pSoralog(config.join("libp2p.log"));

  pyrsia::common::setLogFile(
      config.log_file ? config.log_file->string() : config.join("pyrsia.log"));

  pyrsia::main(config);
}
