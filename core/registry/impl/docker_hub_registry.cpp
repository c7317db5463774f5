/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/impl/docker_hub_registry.hpp"

#include "codec/json/json.hpp"
#include "common/logger.hpp"

namespace pyrsia::registry {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("origin_registry");
      return logger.get();
    }

    /// Token without expiry is treated as valid for this long
    constexpr std::chrono::seconds kDefaultExpiresIn{60};
  }  // namespace

  DockerHubRegistry::DockerHubRegistry(DockerHubConfig config,
                                       std::shared_ptr<RequestFactory> requests)
      : config_{std::move(config)}, requests_{std::move(requests)} {}

  std::string DockerHubRegistry::tokenUrl(const std::string &name) const {
    return config_.auth_url
           + "/token?client_id=Pyrsia&service=registry.docker.io"
             "&scope=repository:library/"
           + name + ":pull";
  }

  std::string DockerHubRegistry::blobUrl(const std::string &name,
                                         const ArtifactHash &hash) const {
    return config_.registry_url + "/v2/library/" + name + "/blobs/"
           + hash.toString();
  }

  outcome::result<AuthToken> DockerHubRegistry::authToken(
      const std::string &name) {
    {
      std::lock_guard lock{tokens_mutex_};
      auto it{tokens_.find(name)};
      if (it != tokens_.end()) {
        if (it->second.expires > Clock::now()) {
          return it->second.token;
        }
        tokens_.erase(it);
      }
    }

    const auto requested{Clock::now()};
    OUTCOME_TRY(response, get(tokenUrl(name), {}));
    OUTCOME_TRY(checkStatus(response));
    OUTCOME_TRY(token, decodeToken(response.body));

    std::lock_guard lock{tokens_mutex_};
    tokens_[name] = CachedToken{token, requested + token.expires_in};
    log()->debug("got pull token for {}, expires in {}s",
                 name,
                 token.expires_in.count());
    return token;
  }

  outcome::result<Bytes> DockerHubRegistry::fetchBlob(
      const std::string &name,
      const ArtifactHash &hash,
      const AuthToken &token) {
    log()->info("fetching {} of {} from origin registry", hash, name);
    OUTCOME_TRY(response,
                get(blobUrl(name, hash),
                    {{"Authorization", "Bearer " + token.token}}));
    if (auto status{checkStatus(response)}; !status) {
      log()->warn("origin registry responded {} for {} of {}",
                  response.status_code,
                  hash,
                  name);
      if (status.error() == OriginRegistryError::kOriginUnauthorized) {
        std::lock_guard lock{tokens_mutex_};
        tokens_.erase(name);
      }
      return status.error();
    }
    return std::move(response.body);
  }

  outcome::result<common::Response> DockerHubRegistry::get(
      const std::string &url,
      const std::unordered_map<std::string, std::string> &headers) {
    OUTCOME_TRY(request, requests_->newRequest(url));
    request->setupMethod(common::ReqMethod::GET);
    request->setupTimeout(config_.timeout);
    if (!headers.empty()) {
      request->setupHeaders(headers);
    }
    auto response{request->perform()};
    if (!response) {
      log()->warn("GET {} failed: {}", url, response.error().message());
      return OriginRegistryError::kIoError;
    }
    return response;
  }

  outcome::result<void> checkStatus(const common::Response &response) {
    if (response.ok()) {
      return outcome::success();
    }
    switch (response.status_code) {
      case 401:
      case 403:
        return OriginRegistryError::kOriginUnauthorized;
      case 404:
        return OriginRegistryError::kOriginNotFound;
      default:
        return OriginRegistryError::kIoError;
    }
  }

  outcome::result<AuthToken> decodeToken(BytesIn body) {
    using codec::json::jGet;
    auto doc{codec::json::parse(body)};
    if (!doc) {
      return OriginRegistryError::kMalformedResponse;
    }
    const codec::json::JIn j{&doc.value()};
    auto j_token{jGet(j, "token")};
    if (!j_token) {
      return OriginRegistryError::kMalformedResponse;
    }
    auto token{codec::json::jStr(j_token.value())};
    if (!token || token.value().empty()) {
      return OriginRegistryError::kMalformedResponse;
    }
    AuthToken result{std::string{token.value()}, kDefaultExpiresIn};
    if (auto j_expires{jGet(j, "expires_in")}) {
      auto seconds{codec::json::jUint(j_expires.value())};
      if (!seconds) {
        return OriginRegistryError::kMalformedResponse;
      }
      result.expires_in = std::chrono::seconds{seconds.value()};
    }
    return result;
  }
}  // namespace pyrsia::registry
