/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "primitives/artifact_hash/artifact_hash.hpp"
#include "storage/artifact/artifact_store_error.hpp"

namespace pyrsia::storage::artifact {
  using primitives::ArtifactHash;

  struct ArtifactStoreStat {
    uint64_t artifact_count{};
    /// Configured space budget in bytes
    uint64_t allocated{};
    /// Bytes taken by stored artifacts
    uint64_t used{};
  };

  /**
   * @brief Content addressed storage of immutable artifacts. Content is
   * verified against its hash before it becomes visible to readers.
   */
  class ArtifactStore {
   public:
    virtual ~ArtifactStore() = default;

    /**
     * @brief Stores content streamed from input
     * @param hash - expected hash of content
     * @param content - stream read until end
     * @return true if stored, false if artifact was already present,
     * kIntegrityMismatch if content hash differs, kQuotaExceeded if content
     * does not fit into available space
     */
    virtual outcome::result<bool> put(const ArtifactHash &hash,
                                      std::istream &content) = 0;

    /**
     * @brief Stores content held in memory, same semantics as stream version
     */
    virtual outcome::result<bool> put(const ArtifactHash &hash,
                                      BytesIn content) = 0;

    /**
     * @brief Reads artifact
     * @return bytes stored under hash or kNotFoundLocally
     */
    virtual outcome::result<Bytes> get(const ArtifactHash &hash) const = 0;

    virtual outcome::result<bool> contains(const ArtifactHash &hash) const = 0;

    /// Free space left from allocated budget
    virtual uint64_t availableSpace() const = 0;

    virtual ArtifactStoreStat stat() const = 0;
  };
}  // namespace pyrsia::storage::artifact
