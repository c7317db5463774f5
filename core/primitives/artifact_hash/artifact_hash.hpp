/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/crypto/sha/sha256.hpp>
#include <spdlog/fmt/fmt.h>
#include <tuple>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace pyrsia::primitives {
  /// Digest algorithms artifacts may be addressed with
  enum class HashAlgorithm : uint8_t {
    kSha256 = 1,
  };

  /// Lowercase algorithm name, used as identifier prefix and directory name
  std::string_view algorithmName(HashAlgorithm algorithm);

  size_t digestSize(HashAlgorithm algorithm);

  enum class ArtifactHashError {
    kInvalidPrefix = 1,
    kInvalidHex,
    kInvalidDigestLength,
  };

  /**
   * Content address of artifact: algorithm and raw digest of artifact bytes.
   * Identifiers exchanged with peers and registries have the form
   * "sha256:<hex digest>".
   */
  struct ArtifactHash {
    /// Length of "sha256:" prefix stripped from identifiers
    static constexpr size_t kPrefixSize{7};

    HashAlgorithm algorithm{HashAlgorithm::kSha256};
    Bytes digest;

    /**
     * @brief decodes "sha256:<hex>" identifier
     * @param id - identifier string
     * @return hash or ArtifactHashError
     */
    static outcome::result<ArtifactHash> fromString(std::string_view id);

    /// Computes hash of content in one go
    static ArtifactHash of(BytesIn content);

    std::string toString() const;

    std::string hex() const;

    bool operator==(const ArtifactHash &other) const {
      return algorithm == other.algorithm && digest == other.digest;
    }
    bool operator!=(const ArtifactHash &other) const {
      return !(*this == other);
    }
    bool operator<(const ArtifactHash &other) const {
      return std::tie(algorithm, digest)
             < std::tie(other.algorithm, other.digest);
    }
  };

  /**
   * Incremental hasher used to verify streamed content.
   */
  class DigestStream {
   public:
    explicit DigestStream(HashAlgorithm algorithm = HashAlgorithm::kSha256);

    outcome::result<void> write(BytesIn bytes);

    /// Total bytes written so far
    uint64_t size() const {
      return size_;
    }

    outcome::result<ArtifactHash> finish();

   private:
    HashAlgorithm algorithm_;
    libp2p::crypto::Sha256 sha256_;
    uint64_t size_{0};
  };
}  // namespace pyrsia::primitives

namespace std {
  template <>
  struct hash<pyrsia::primitives::ArtifactHash> {
    size_t operator()(const pyrsia::primitives::ArtifactHash &hash) const {
      size_t seed{static_cast<size_t>(hash.algorithm)};
      // digest is uniformly distributed, its prefix is good enough
      for (size_t i = 0; i < hash.digest.size() && i < sizeof(size_t); ++i) {
        seed = (seed << 8) | hash.digest[i];
      }
      return seed;
    }
  };
}  // namespace std

template <>
struct fmt::formatter<pyrsia::primitives::ArtifactHash>
    : formatter<std::string_view> {
  template <typename C>
  auto format(const pyrsia::primitives::ArtifactHash &hash, C &ctx) const {
    return formatter<std::string_view>::format(hash.toString(), ctx);
  }
};

OUTCOME_HPP_DECLARE_ERROR(pyrsia::primitives, ArtifactHashError);
