/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "network/overlay/peer_discovery.hpp"

namespace pyrsia::network::overlay {
  class PeerDiscoveryMock : public PeerDiscovery {
   public:
    MOCK_METHOD1(start, outcome::result<void>(Handler));
    MOCK_METHOD0(stop, void());
    MOCK_METHOD0(announce, outcome::result<void>());
  };
}  // namespace pyrsia::network::overlay
