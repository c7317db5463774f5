/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/http_requests/impl/request_impl.hpp"

#include "common/logger.hpp"

namespace pyrsia::common {
  namespace {
    auto log() {
      static Logger logger = createLogger("http");
      return logger.get();
    }
  }  // namespace

  size_t RequestImpl::writeBody(char *data,
                                size_t size,
                                size_t count,
                                void *output) {
    auto &body{*static_cast<Bytes *>(output)};
    body.insert(body.end(), data, data + size * count);
    return size * count;
  }

  void RequestImpl::setupUrl(const std::string &url) {
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  }

  void RequestImpl::setupMethod(ReqMethod method) {
    switch (method) {
      case ReqMethod::GET:
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "GET");
        return;
      case ReqMethod::DELETE:
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
        return;
      case ReqMethod::POST:
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "POST");
        return;
      case ReqMethod::PUT:
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "PUT");
        return;
      default:
        return;
    }
  }

  void RequestImpl::setupHeaders(
      const std::unordered_map<std::string, std::string> &headers) {
    for (const auto &header : headers) {
      setupHeader(header);
    }
  }

  void RequestImpl::setupHeader(
      const std::pair<std::string, std::string> &header) {
    headers_ = curl_slist_append(headers_,
                                 (header.first + ": " + header.second).c_str());
  }

  void RequestImpl::setupTimeout(std::chrono::milliseconds timeout) {
    curl_easy_setopt(
        curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  }

  outcome::result<Response> RequestImpl::perform() {
    Response res;

    if (headers_) {
      curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    }
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &RequestImpl::writeBody);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &res.body);
    if (auto code{curl_easy_perform(curl_)}; code != CURLE_OK) {
      log()->debug("request failed: {}", curl_easy_strerror(code));
      return RequestError::kTransportFailure;
    }
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &res.status_code);
    char *content_type{nullptr};
    curl_easy_getinfo(curl_, CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
      res.content_type = content_type;
    }

    return res;
  }

  RequestImpl::~RequestImpl() {
    if (curl_) {
      curl_easy_cleanup(curl_);
    }

    if (headers_) {
      curl_slist_free_all(headers_);
    }
  }

  RequestImpl::RequestImpl() : headers_(nullptr), curl_(curl_easy_init()) {
    if (curl_) {
      curl_easy_setopt(curl_, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_V4);

      // Follow HTTP redirects if necessary
      curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    }
  }

}  // namespace pyrsia::common

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::common, RequestError, e) {
  using pyrsia::common::RequestError;
  switch (e) {
    case RequestError::kTransportFailure:
      return "RequestError: transport failure, no response received";
  }
  return "RequestError: unknown error";
}
