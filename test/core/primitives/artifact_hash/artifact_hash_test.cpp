/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/artifact_hash/artifact_hash.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "testutil/outcome.hpp"

namespace pyrsia::primitives {
  const std::string kAbcId{
      "sha256:"
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"};

  /**
   * @given identifier of "abc"
   * @when parse it and hash "abc"
   * @then both hashes are equal and print as the identifier
   */
  TEST(ArtifactHashTest, ParseMatchesDigest) {
    EXPECT_OUTCOME_TRUE(hash, ArtifactHash::fromString(kAbcId));
    EXPECT_EQ(hash.algorithm, HashAlgorithm::kSha256);
    EXPECT_EQ(hash.digest.size(), 32u);
    EXPECT_EQ(hash, ArtifactHash::of(asBytes("abc")));
    EXPECT_EQ(hash.toString(), kAbcId);
    EXPECT_EQ(hash.hex(), kAbcId.substr(ArtifactHash::kPrefixSize));
  }

  /**
   * @given uppercase hex digest
   * @when parse it
   * @then hash prints back lowercase
   */
  TEST(ArtifactHashTest, UppercaseHex) {
    std::string id{kAbcId};
    std::transform(id.begin() + ArtifactHash::kPrefixSize,
                   id.end(),
                   id.begin() + ArtifactHash::kPrefixSize,
                   ::toupper);
    EXPECT_OUTCOME_TRUE(hash, ArtifactHash::fromString(id));
    EXPECT_EQ(hash.toString(), kAbcId);
  }

  /**
   * @given malformed identifiers
   * @when parse them
   * @then each fails with matching error
   */
  TEST(ArtifactHashTest, Malformed) {
    EXPECT_OUTCOME_ERROR(ArtifactHashError::kInvalidPrefix,
                         ArtifactHash::fromString(""));
    EXPECT_OUTCOME_ERROR(ArtifactHashError::kInvalidPrefix,
                         ArtifactHash::fromString("md5:abcd"));
    EXPECT_OUTCOME_ERROR(
        ArtifactHashError::kInvalidPrefix,
        ArtifactHash::fromString(kAbcId.substr(ArtifactHash::kPrefixSize)));
    EXPECT_OUTCOME_ERROR(ArtifactHashError::kInvalidHex,
                         ArtifactHash::fromString("sha256:zz"));
    EXPECT_OUTCOME_ERROR(ArtifactHashError::kInvalidHex,
                         ArtifactHash::fromString("sha256:abc"));
    EXPECT_OUTCOME_ERROR(ArtifactHashError::kInvalidDigestLength,
                         ArtifactHash::fromString("sha256:abcd"));
  }

  /**
   * @given content written in several chunks
   * @when finish digest stream
   * @then hash equals one shot hash and stream is reset
   */
  TEST(ArtifactHashTest, DigestStream) {
    DigestStream stream;
    EXPECT_OUTCOME_TRUE_1(stream.write(asBytes("a")));
    EXPECT_OUTCOME_TRUE_1(stream.write(asBytes("bc")));
    EXPECT_EQ(stream.size(), 3u);
    EXPECT_OUTCOME_EQ(stream.finish(), ArtifactHash::of(asBytes("abc")));
    EXPECT_EQ(stream.size(), 0u);
    EXPECT_OUTCOME_EQ(stream.finish(), ArtifactHash::of({}));
  }

  /**
   * @given hashes of different content
   * @when put them into hash set
   * @then they are distinct keys
   */
  TEST(ArtifactHashTest, HashKey) {
    std::unordered_set<ArtifactHash> set;
    set.insert(ArtifactHash::of(asBytes("a")));
    set.insert(ArtifactHash::of(asBytes("b")));
    set.insert(ArtifactHash::of(asBytes("a")));
    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(set.count(ArtifactHash::of(asBytes("b"))), 1u);
  }
}  // namespace pyrsia::primitives
