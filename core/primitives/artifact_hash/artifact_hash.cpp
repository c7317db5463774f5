/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/artifact_hash/artifact_hash.hpp"

#include "common/hexutil.hpp"

namespace pyrsia::primitives {
  namespace {
    constexpr std::string_view kSha256Prefix{"sha256:"};
    static_assert(kSha256Prefix.size() == ArtifactHash::kPrefixSize);
  }  // namespace

  std::string_view algorithmName(HashAlgorithm algorithm) {
    switch (algorithm) {
      case HashAlgorithm::kSha256:
        return "sha256";
    }
    return "unknown";
  }

  size_t digestSize(HashAlgorithm algorithm) {
    switch (algorithm) {
      case HashAlgorithm::kSha256:
        return 32;
    }
    return 0;
  }

  outcome::result<ArtifactHash> ArtifactHash::fromString(std::string_view id) {
    if (id.size() < kPrefixSize || id.substr(0, kPrefixSize) != kSha256Prefix) {
      return ArtifactHashError::kInvalidPrefix;
    }
    auto digest{common::unhex(id.substr(kPrefixSize))};
    if (!digest) {
      return ArtifactHashError::kInvalidHex;
    }
    if (digest.value().size() != digestSize(HashAlgorithm::kSha256)) {
      return ArtifactHashError::kInvalidDigestLength;
    }
    return ArtifactHash{HashAlgorithm::kSha256, std::move(digest.value())};
  }

  ArtifactHash ArtifactHash::of(BytesIn content) {
    DigestStream stream;
    OUTCOME_EXCEPT(stream.write(content));
    OUTCOME_EXCEPT(hash, stream.finish());
    return hash;
  }

  std::string ArtifactHash::toString() const {
    return std::string{algorithmName(algorithm)} + ":" + hex();
  }

  std::string ArtifactHash::hex() const {
    return common::hex_lower(digest);
  }

  DigestStream::DigestStream(HashAlgorithm algorithm) : algorithm_{algorithm} {}

  outcome::result<void> DigestStream::write(BytesIn bytes) {
    OUTCOME_TRY(sha256_.write(bytes));
    size_ += bytes.size();
    return outcome::success();
  }

  outcome::result<ArtifactHash> DigestStream::finish() {
    ArtifactHash hash{algorithm_, Bytes(sha256_.digestSize())};
    OUTCOME_TRY(sha256_.digestOut(hash.digest));
    OUTCOME_TRY(sha256_.reset());
    size_ = 0;
    return hash;
  }
}  // namespace pyrsia::primitives

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::primitives, ArtifactHashError, e) {
  using pyrsia::primitives::ArtifactHashError;
  switch (e) {
    case ArtifactHashError::kInvalidPrefix:
      return "ArtifactHashError: identifier must start with \"sha256:\"";
    case ArtifactHashError::kInvalidHex:
      return "ArtifactHashError: digest is not valid hex";
    case ArtifactHashError::kInvalidDigestLength:
      return "ArtifactHashError: digest has wrong length";
  }
  return "ArtifactHashError: unknown error";
}
