/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "primitives/artifact_hash/artifact_hash.hpp"
#include "registry/origin_registry_error.hpp"

namespace pyrsia::registry {
  using primitives::ArtifactHash;

  /// Bearer token granting pull access to one repository
  struct AuthToken {
    std::string token;
    std::chrono::seconds expires_in{};
  };

  /**
   * @brief Upstream public registry, last resort source of artifacts.
   * Returned bytes are untrusted until verified by artifact store.
   */
  class OriginRegistry {
   public:
    virtual ~OriginRegistry() = default;

    /**
     * @brief Obtains pull token for repository
     * @param name - repository name, e.g. "alpine"
     */
    virtual outcome::result<AuthToken> authToken(const std::string &name) = 0;

    /**
     * @brief Downloads blob of repository
     * @return bytes, kOriginUnauthorized, kOriginNotFound or kIoError
     */
    virtual outcome::result<Bytes> fetchBlob(const std::string &name,
                                             const ArtifactHash &hash,
                                             const AuthToken &token) = 0;

    /// Obtains token and downloads blob
    outcome::result<Bytes> fetch(const std::string &name,
                                 const ArtifactHash &hash) {
      OUTCOME_TRY(token, authToken(name));
      return fetchBlob(name, hash, token);
    }
  };
}  // namespace pyrsia::registry
