/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include "common/http_requests/request.hpp"

namespace pyrsia::common {
  class RequestFactory {
   public:
    virtual ~RequestFactory() = default;

    virtual outcome::result<std::unique_ptr<Request>> newRequest(
        const std::string &url) = 0;
  };
}  // namespace pyrsia::common
