/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/http_requests/request_factory.hpp"

namespace pyrsia::common {
  class RequestFactoryImpl : public RequestFactory {
   public:
    RequestFactoryImpl();
    ~RequestFactoryImpl() override;

    outcome::result<std::unique_ptr<Request>> newRequest(
        const std::string &url) override;
  };

  enum class RequestFactoryErrors {
    UnableInit = 1,
  };
}  // namespace pyrsia::common

OUTCOME_HPP_DECLARE_ERROR(pyrsia::common, RequestFactoryErrors);
