/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace pyrsia::common {

  using HeaderName = std::string;
  using HeaderValue = std::string;

  enum ReqMethod {
    GET,
    PUT,
    POST,
    DELETE,
  };

  struct Response {
    long status_code{};
    std::string content_type;
    Bytes body;

    bool ok() const {
      return status_code >= 200 && status_code < 300;
    }
  };

  enum class RequestError {
    kTransportFailure = 1,
  };

  class Request {
   public:
    virtual ~Request() = default;

    virtual void setupUrl(const std::string &url) = 0;

    virtual void setupMethod(ReqMethod method) = 0;

    virtual void setupHeaders(
        const std::unordered_map<HeaderName, HeaderValue> &headers) = 0;

    virtual void setupHeader(
        const std::pair<HeaderName, HeaderValue> &header) = 0;

    /// Whole transfer timeout, zero means no limit
    virtual void setupTimeout(std::chrono::milliseconds timeout) = 0;

    /**
     * Performs request, response body is collected in memory.
     * @return response of any status or RequestError::kTransportFailure when
     * no response was received
     */
    virtual outcome::result<Response> perform() = 0;
  };

}  // namespace pyrsia::common

OUTCOME_HPP_DECLARE_ERROR(pyrsia::common, RequestError);
