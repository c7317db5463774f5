/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/artifact/impl/filesystem_artifact_store.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <algorithm>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include "common/logger.hpp"

namespace pyrsia::storage::artifact {
  namespace fs = boost::filesystem;
  using primitives::algorithmName;
  using primitives::DigestStream;
  using primitives::HashAlgorithm;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("artifact_store");
      return logger.get();
    }

    constexpr auto kStagingDir{"staging"};

    /// Removes staging file unless it was committed
    struct StagingFile {
      explicit StagingFile(fs::path path) : path{std::move(path)} {}
      StagingFile(const StagingFile &) = delete;
      StagingFile &operator=(const StagingFile &) = delete;
      ~StagingFile() {
        if (!committed) {
          boost::system::error_code ec;
          fs::remove(path, ec);
        }
      }

      fs::path path;
      bool committed{false};
    };

    /// Flushes file or directory entries to disk
    bool syncPath(const fs::path &path) {
      const auto fd{::open(path.c_str(), O_RDONLY)};
      if (fd < 0) {
        return false;
      }
      const auto synced{::fsync(fd) == 0};
      return ::close(fd) == 0 && synced;
    }

    /// Checks that file content hashes to its name
    outcome::result<bool> verifyFile(const fs::path &path,
                                     HashAlgorithm algorithm) {
      auto expected{ArtifactHash::fromString(
          std::string{algorithmName(algorithm)} + ":"
          + path.filename().string())};
      if (!expected) {
        return false;
      }
      fs::ifstream file{path, std::ios::binary};
      if (!file.is_open()) {
        return ArtifactStoreError::kIoError;
      }
      std::vector<char> buffer(FilesystemArtifactStore::kChunkSize);
      DigestStream digest{algorithm};
      while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (file.bad()) {
          return ArtifactStoreError::kIoError;
        }
        OUTCOME_TRY(digest.write(
            asBytes({buffer.data(), static_cast<size_t>(file.gcount())})));
      }
      OUTCOME_TRY(actual, digest.finish());
      return actual == expected.value();
    }
  }  // namespace

  FilesystemArtifactStore::FilesystemArtifactStore(fs::path root,
                                                   uint64_t allocated)
      : root_{std::move(root)},
        staging_{root_ / kStagingDir},
        allocated_{allocated} {}

  outcome::result<std::shared_ptr<FilesystemArtifactStore>>
  FilesystemArtifactStore::create(const fs::path &root, uint64_t allocated) {
    std::shared_ptr<FilesystemArtifactStore> store{
        new FilesystemArtifactStore{root, allocated}};
    OUTCOME_TRY(store->scan());
    log()->info("opened {}: {} artifacts, {} of {} bytes used",
                root.string(),
                store->count_,
                store->used_,
                store->allocated_);
    return store;
  }

  outcome::result<void> FilesystemArtifactStore::scan() {
    boost::system::error_code ec;
    auto artifacts{root_ / std::string{algorithmName(HashAlgorithm::kSha256)}};
    fs::create_directories(artifacts, ec);
    if (!ec) {
      fs::remove_all(staging_, ec);
    }
    if (!ec) {
      fs::create_directories(staging_, ec);
    }
    if (ec) {
      log()->error("cannot prepare {}: {}", root_.string(), ec.message());
      return ArtifactStoreError::kIoError;
    }
    std::vector<fs::path> corrupt;
    for (fs::directory_iterator it{artifacts, ec}, end; !ec && it != end;
         it.increment(ec)) {
      if (!fs::is_regular_file(it->status())) {
        continue;
      }
      OUTCOME_TRY(valid, verifyFile(it->path(), HashAlgorithm::kSha256));
      if (!valid) {
        corrupt.push_back(it->path());
        continue;
      }
      auto size{fs::file_size(it->path(), ec)};
      if (ec) {
        break;
      }
      used_ += size;
      ++count_;
    }
    for (const auto &path : corrupt) {
      if (ec) {
        break;
      }
      log()->warn("removing corrupt artifact file {}", path.string());
      fs::remove(path, ec);
    }
    if (ec) {
      log()->error("cannot scan {}: {}", artifacts.string(), ec.message());
      return ArtifactStoreError::kIoError;
    }
    if (used_ > allocated_) {
      log()->warn("stored artifacts take {} bytes, more than allocated {}",
                  used_,
                  allocated_);
    }
    return outcome::success();
  }

  fs::path FilesystemArtifactStore::pathOf(const ArtifactHash &hash) const {
    return root_ / std::string{algorithmName(hash.algorithm)} / hash.hex();
  }

  outcome::result<bool> FilesystemArtifactStore::put(const ArtifactHash &hash,
                                                     std::istream &content) {
    std::vector<char> buffer(kChunkSize);
    return putChunks(hash, [&]() -> outcome::result<BytesIn> {
      content.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      if (content.bad()) {
        return ArtifactStoreError::kIoError;
      }
      return asBytes({buffer.data(), static_cast<size_t>(content.gcount())});
    });
  }

  outcome::result<bool> FilesystemArtifactStore::put(const ArtifactHash &hash,
                                                     BytesIn content) {
    return putChunks(hash, [&]() -> outcome::result<BytesIn> {
      auto chunk{content.first(
          std::min<size_t>(content.size(), kChunkSize))};
      content = content.subspan(chunk.size());
      return chunk;
    });
  }

  outcome::result<bool> FilesystemArtifactStore::putChunks(
      const ArtifactHash &hash, const ChunkReader &next) {
    const auto path{pathOf(hash)};
    OUTCOME_TRY(present, contains(hash));
    if (present) {
      return false;
    }

    StagingFile staging{staging_ / fs::unique_path("%%%%-%%%%-%%%%-%%%%")};
    fs::ofstream file{staging.path, std::ios::binary | std::ios::trunc};
    if (!file.good()) {
      log()->error("cannot create staging file {}", staging.path.string());
      return ArtifactStoreError::kIoError;
    }
    DigestStream digest{hash.algorithm};
    while (true) {
      OUTCOME_TRY(chunk, next());
      if (chunk.empty()) {
        break;
      }
      OUTCOME_TRY(digest.write(chunk));
      if (digest.size() > availableSpace()) {
        log()->warn("{} does not fit into {} available bytes",
                    hash,
                    availableSpace());
        return ArtifactStoreError::kQuotaExceeded;
      }
      auto str{asString(chunk)};
      file.write(str.data(), static_cast<std::streamsize>(str.size()));
      if (!file.good()) {
        return ArtifactStoreError::kIoError;
      }
    }
    file.close();
    if (file.fail() || !syncPath(staging.path)) {
      log()->error("cannot flush staging file {}", staging.path.string());
      return ArtifactStoreError::kIoError;
    }
    const auto size{digest.size()};
    OUTCOME_TRY(actual, digest.finish());
    if (actual != hash) {
      log()->warn("content of {} hashes to {}", hash, actual);
      return ArtifactStoreError::kIntegrityMismatch;
    }

    std::lock_guard lock{mutex_};
    boost::system::error_code ec;
    if (fs::exists(path, ec)) {
      return false;
    }
    if (size > allocated_ - std::min(used_, allocated_)) {
      log()->warn("{} of {} bytes does not fit anymore", hash, size);
      return ArtifactStoreError::kQuotaExceeded;
    }
    fs::rename(staging.path, path, ec);
    if (ec) {
      log()->error("cannot commit {}: {}", hash, ec.message());
      return ArtifactStoreError::kIoError;
    }
    staging.committed = true;
    if (!syncPath(path.parent_path())) {
      log()->warn("cannot flush directory of {}", path.string());
    }
    used_ += size;
    ++count_;
    log()->debug("stored {}, {} bytes", hash, size);
    return true;
  }

  outcome::result<Bytes> FilesystemArtifactStore::get(
      const ArtifactHash &hash) const {
    const auto path{pathOf(hash)};
    boost::system::error_code ec;
    const auto size{fs::file_size(path, ec)};
    if (ec) {
      if (ec == boost::system::errc::no_such_file_or_directory) {
        return ArtifactStoreError::kNotFoundLocally;
      }
      return ArtifactStoreError::kIoError;
    }
    fs::ifstream file{path, std::ios::binary};
    Bytes bytes(size);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    file.read(reinterpret_cast<char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!file.good() || static_cast<uint64_t>(file.gcount()) != size) {
      log()->error("cannot read {}", path.string());
      return ArtifactStoreError::kIoError;
    }
    return bytes;
  }

  outcome::result<bool> FilesystemArtifactStore::contains(
      const ArtifactHash &hash) const {
    boost::system::error_code ec;
    auto exists{fs::exists(pathOf(hash), ec)};
    if (ec) {
      return ArtifactStoreError::kIoError;
    }
    return exists;
  }

  uint64_t FilesystemArtifactStore::availableSpace() const {
    std::lock_guard lock{mutex_};
    return used_ < allocated_ ? allocated_ - used_ : 0;
  }

  ArtifactStoreStat FilesystemArtifactStore::stat() const {
    std::lock_guard lock{mutex_};
    return {count_, allocated_, used_};
  }
}  // namespace pyrsia::storage::artifact
