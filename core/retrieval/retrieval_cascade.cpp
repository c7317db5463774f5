/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "retrieval/retrieval_cascade.hpp"

#include <algorithm>

#include "common/logger.hpp"
#include "retrieval/retrieval_error.hpp"

namespace pyrsia::retrieval {
  using storage::artifact::ArtifactStoreError;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("retrieval");
      return logger.get();
    }
  }  // namespace

  RetrievalCascade::RetrievalCascade(std::shared_ptr<ArtifactStore> store,
                                     NetworkClient client,
                                     std::shared_ptr<OriginRegistry> origin,
                                     CascadeConfig config)
      : store_{std::move(store)},
        client_{std::move(client)},
        origin_{std::move(origin)},
        config_{config} {}

  outcome::result<Bytes> RetrievalCascade::resolve(
      const std::string &name, std::string_view id) const {
    OUTCOME_TRY(hash, ArtifactHash::fromString(id));
    return resolve(name, hash);
  }

  outcome::result<Bytes> RetrievalCascade::resolve(
      const std::string &name, const ArtifactHash &hash) const {
    auto local{store_->get(hash)};
    if (local) {
      log()->debug("{} found locally", hash);
      return local;
    }
    if (local.error() != ArtifactStoreError::kNotFoundLocally) {
      log()->warn("cannot read {} locally: {}", hash, local.error().message());
    }

    if (auto from_peers{fetchFromPeers(hash)}; !from_peers) {
      log()->debug("{} not fetched from peers: {}",
                   hash,
                   from_peers.error().message());
      OUTCOME_TRY(fetchFromOrigin(name, hash));
    }

    if (auto provided{client_.provide(hash)}; !provided) {
      log()->warn("cannot start providing {}: {}",
                  hash,
                  provided.error().message());
    }
    return store_->get(hash);
  }

  outcome::result<void> RetrievalCascade::fetchFromPeers(
      const ArtifactHash &hash) const {
    OUTCOME_TRY(providers, client_.listProviders(hash));
    if (providers.empty()) {
      return RetrievalError::kNoProviders;
    }
    log()->debug("{} providers of {}", providers.size(), hash);

    outcome::result<void> last{RetrievalError::kNoProviders};
    const auto attempts{std::min(providers.size(), config_.peer_attempts)};
    for (size_t i = 0; i < attempts; ++i) {
      const auto &peer{providers[i]};
      log()->info("reading {} from peer {}", hash, peer.toBase58());
      auto bytes{client_.requestArtifact(peer, hash)};
      if (!bytes) {
        log()->debug("peer {} did not send {}: {}",
                     peer.toBase58(),
                     hash,
                     bytes.error().message());
        last = bytes.error();
        continue;
      }
      auto stored{store_->put(hash, bytes.value())};
      if (!stored) {
        if (stored.error() == ArtifactStoreError::kIntegrityMismatch) {
          log()->warn("peer {} sent content not matching {}",
                      peer.toBase58(),
                      hash);
          last = RetrievalError::kPeerIntegrityMismatch;
          continue;
        }
        log()->warn("cannot store {} from peer {}: {}",
                    hash,
                    peer.toBase58(),
                    stored.error().message());
        return stored.error();
      }
      log()->info("{} stored from peer {}", hash, peer.toBase58());
      return outcome::success();
    }
    return last;
  }

  outcome::result<void> RetrievalCascade::fetchFromOrigin(
      const std::string &name, const ArtifactHash &hash) const {
    auto bytes{origin_->fetch(name, hash)};
    if (!bytes) {
      log()->warn("cannot fetch {} of {} from origin registry: {}",
                  hash,
                  name,
                  bytes.error().message());
      return bytes.error();
    }
    if (auto stored{store_->put(hash, bytes.value())}; !stored) {
      log()->warn("cannot store {} from origin registry: {}",
                  hash,
                  stored.error().message());
      return stored.error();
    }
    log()->info("{} of {} stored from origin registry", hash, name);
    return outcome::success();
  }
}  // namespace pyrsia::retrieval
