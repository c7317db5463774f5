/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/config.hpp"

#include <gtest/gtest.h>

#include "testutil/peer_id.hpp"
#include "testutil/storage/base_fs_test.hpp"

namespace pyrsia::node {
  class ConfigTest : public test::BaseFS_Test {
   public:
    ConfigTest() : test::BaseFS_Test("/tmp/pyrsia_test_node_config") {}

    Config read(std::vector<std::string> args) {
      args.insert(args.begin(), {"pyrsia_node", "--repo", base_path.string()});
      std::vector<char *> argv;
      for (auto &arg : args) {
        argv.push_back(arg.data());
      }
      return Config::read(static_cast<int>(argv.size()), argv.data());
    }
  };

  /**
   * @given only repository path
   * @when read config
   * @then defaults are used
   */
  TEST_F(ConfigTest, Defaults) {
    auto config{read({})};
    EXPECT_EQ(config.listen, "/ip4/0.0.0.0/tcp/44000");
    EXPECT_EQ(config.disk_allocated, "10 GB");
    EXPECT_EQ(config.disk_allocated_bytes, 10'000'000'000u);
    EXPECT_EQ(config.log_level, spdlog::level::info);
    EXPECT_TRUE(config.bootstrap_list.empty());
    EXPECT_EQ(config.overlayConfig().request_timeout, std::chrono::seconds{30});
    EXPECT_EQ(config.overlayConfig().discovery_ttl, std::chrono::seconds{30});
    EXPECT_EQ(config.commandTimeout(), std::chrono::seconds{35});
    EXPECT_EQ(config.dockerHubConfig().registry_url,
              "https://registry-1.docker.io");
    EXPECT_EQ(config.artifactsPath(), (base_path / "artifacts").string());
    EXPECT_TRUE(config.lan_discovery.enabled);
    EXPECT_EQ(config.lan_discovery.group, "239.255.70.77");
    EXPECT_EQ(config.lan_discovery.port, 44001);
  }

  /**
   * @given config file in repository and command line options
   * @when read config
   * @then command line overrides file, file overrides defaults
   */
  TEST_F(ConfigTest, ConfigFile) {
    createFile("config.cfg",
               "disk-allocated=1 GiB\n"
               "request-timeout=7\n"
               "io-threads=4\n"
               "lan-discovery=false\n"
               "lan-port=45000\n");
    auto peer{generatePeerId(1)};
    auto config{read({"--io-threads",
                      "3",
                      "-l",
                      "d",
                      "--peer",
                      "/ip4/127.0.0.1/tcp/44001/p2p/" + peer.toBase58()})};
    EXPECT_EQ(config.disk_allocated_bytes, 1ull << 30);
    EXPECT_EQ(config.overlayConfig().request_timeout, std::chrono::seconds{7});
    EXPECT_EQ(config.io_threads, 3u);
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    ASSERT_EQ(config.bootstrap_list.size(), 1u);
    EXPECT_EQ(config.bootstrap_list[0].id, peer);
    EXPECT_FALSE(config.lan_discovery.enabled);
    EXPECT_EQ(config.lan_discovery.port, 45000);
  }
}  // namespace pyrsia::node
