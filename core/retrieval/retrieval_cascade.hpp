/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/network_client.hpp"
#include "registry/origin_registry.hpp"
#include "storage/artifact/artifact_store.hpp"

namespace pyrsia::retrieval {
  using network::NetworkClient;
  using primitives::ArtifactHash;
  using registry::OriginRegistry;
  using storage::artifact::ArtifactStore;

  struct CascadeConfig {
    /// Providers tried before falling back to origin registry
    size_t peer_attempts{1};
  };

  /**
   * @brief Resolves artifact from local store, then from peers, then from
   * origin registry. Fetched content is verified and stored before it is
   * returned, and this node starts providing it.
   * Blocks the calling thread, must not be called on overlay engine thread.
   */
  class RetrievalCascade {
   public:
    RetrievalCascade(std::shared_ptr<ArtifactStore> store,
                     NetworkClient client,
                     std::shared_ptr<OriginRegistry> origin,
                     CascadeConfig config);

    /**
     * @param name - repository name used by origin registry
     * @param hash - artifact hash
     * @return stored bytes or error of origin tier
     */
    outcome::result<Bytes> resolve(const std::string &name,
                                   const ArtifactHash &hash) const;

    /// Same as above, hash given as "sha256:<hex>"
    outcome::result<Bytes> resolve(const std::string &name,
                                   std::string_view id) const;

   private:
    outcome::result<void> fetchFromPeers(const ArtifactHash &hash) const;

    outcome::result<void> fetchFromOrigin(const std::string &name,
                                          const ArtifactHash &hash) const;

    std::shared_ptr<ArtifactStore> store_;
    NetworkClient client_;
    std::shared_ptr<OriginRegistry> origin_;
    CascadeConfig config_;
  };
}  // namespace pyrsia::retrieval
