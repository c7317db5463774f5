/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "common/http_requests/request_factory.hpp"

namespace pyrsia::common {
  class RequestFactoryMock : public RequestFactory {
   public:
    MOCK_METHOD1(newRequest,
                 outcome::result<std::unique_ptr<Request>>(
                     const std::string &));
  };
}  // namespace pyrsia::common
