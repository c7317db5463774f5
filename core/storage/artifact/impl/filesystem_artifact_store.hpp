/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <mutex>

#include <boost/filesystem/path.hpp>

#include "storage/artifact/artifact_store.hpp"

namespace pyrsia::storage::artifact {
  /**
   * Stores each artifact as a file "<root>/<algorithm>/<hex digest>".
   * Content is written to "<root>/staging/" first, flushed to disk and
   * renamed into place once verified, so readers never observe partial
   * files.
   * Performs blocking disk io.
   */
  class FilesystemArtifactStore : public ArtifactStore {
   public:
    static constexpr size_t kChunkSize{64 << 10};

    /**
     * Opens store, creates directories if missing, removes leftover staging
     * files and recomputes usage of stored artifacts. Files whose content
     * does not match their name are removed.
     * @param root - store directory
     * @param allocated - space budget in bytes
     */
    static outcome::result<std::shared_ptr<FilesystemArtifactStore>> create(
        const boost::filesystem::path &root, uint64_t allocated);

    outcome::result<bool> put(const ArtifactHash &hash,
                              std::istream &content) override;

    outcome::result<bool> put(const ArtifactHash &hash,
                              BytesIn content) override;

    outcome::result<Bytes> get(const ArtifactHash &hash) const override;

    outcome::result<bool> contains(const ArtifactHash &hash) const override;

    uint64_t availableSpace() const override;

    ArtifactStoreStat stat() const override;

    boost::filesystem::path pathOf(const ArtifactHash &hash) const;

   private:
    /// Returns next chunk of content, empty chunk at the end
    using ChunkReader = std::function<outcome::result<BytesIn>()>;

    FilesystemArtifactStore(boost::filesystem::path root, uint64_t allocated);

    outcome::result<void> scan();

    outcome::result<bool> putChunks(const ArtifactHash &hash,
                                    const ChunkReader &next);

    boost::filesystem::path root_;
    boost::filesystem::path staging_;
    uint64_t allocated_;

    mutable std::mutex mutex_;
    uint64_t used_{0};
    uint64_t count_{0};
  };
}  // namespace pyrsia::storage::artifact
