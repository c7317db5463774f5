/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "registry/origin_registry.hpp"

namespace pyrsia::registry {
  class OriginRegistryMock : public OriginRegistry {
   public:
    MOCK_METHOD1(authToken, outcome::result<AuthToken>(const std::string &));
    MOCK_METHOD3(fetchBlob,
                 outcome::result<Bytes>(const std::string &,
                                        const ArtifactHash &,
                                        const AuthToken &));
  };
}  // namespace pyrsia::registry
