/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/http_requests/request.hpp"

#include <curl/curl.h>

namespace pyrsia::common {

  class RequestFactoryImpl;

  class RequestImpl : public Request {
   public:
    ~RequestImpl() override;

    void setupUrl(const std::string &url) override;

    void setupMethod(ReqMethod method) override;

    void setupHeaders(
        const std::unordered_map<std::string, std::string> &headers) override;

    void setupHeader(
        const std::pair<std::string, std::string> &header) override;

    void setupTimeout(std::chrono::milliseconds timeout) override;

    outcome::result<Response> perform() override;

   private:
    RequestImpl();
    friend class RequestFactoryImpl;

    static size_t writeBody(char *data,
                            size_t size,
                            size_t count,
                            void *output);

    struct curl_slist *headers_;
    CURL *curl_;
  };

}  // namespace pyrsia::common
