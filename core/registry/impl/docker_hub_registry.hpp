/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <unordered_map>

#include "common/http_requests/request_factory.hpp"
#include "registry/origin_registry.hpp"

namespace pyrsia::registry {
  using common::RequestFactory;

  struct DockerHubConfig {
    std::string registry_url{"https://registry-1.docker.io"};
    std::string auth_url{"https://auth.docker.io"};
    /// Timeout of one http transfer
    std::chrono::milliseconds timeout{std::chrono::minutes{5}};
  };

  /**
   * Docker Hub over registry v2 http api. Tokens are cached per repository
   * until they expire.
   */
  class DockerHubRegistry : public OriginRegistry {
   public:
    DockerHubRegistry(DockerHubConfig config,
                      std::shared_ptr<RequestFactory> requests);

    outcome::result<AuthToken> authToken(const std::string &name) override;

    outcome::result<Bytes> fetchBlob(const std::string &name,
                                     const ArtifactHash &hash,
                                     const AuthToken &token) override;

    std::string tokenUrl(const std::string &name) const;

    std::string blobUrl(const std::string &name,
                        const ArtifactHash &hash) const;

   private:
    using Clock = std::chrono::steady_clock;

    struct CachedToken {
      AuthToken token;
      Clock::time_point expires;
    };

    outcome::result<common::Response> get(
        const std::string &url,
        const std::unordered_map<std::string, std::string> &headers);

    DockerHubConfig config_;
    std::shared_ptr<RequestFactory> requests_;
    std::mutex tokens_mutex_;
    std::unordered_map<std::string, CachedToken> tokens_;
  };

  /// Maps http status of origin response to error
  outcome::result<void> checkStatus(const common::Response &response);

  /// Parses {"token": "...", "expires_in": N} body of token endpoint
  outcome::result<AuthToken> decodeToken(BytesIn body);
}  // namespace pyrsia::registry
