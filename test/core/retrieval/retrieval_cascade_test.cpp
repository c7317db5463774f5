/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "retrieval/retrieval_cascade.hpp"

#include <gtest/gtest.h>

#include "storage/artifact/impl/filesystem_artifact_store.hpp"
#include "testutil/mocks/registry/origin_registry_mock.hpp"
#include "testutil/mocks/storage/artifact_store_mock.hpp"
#include "testutil/network/fake_overlay.hpp"
#include "testutil/outcome.hpp"
#include "testutil/peer_id.hpp"
#include "testutil/storage/base_fs_test.hpp"

namespace pyrsia::retrieval {
  using registry::AuthToken;
  using registry::OriginRegistryError;
  using registry::OriginRegistryMock;
  using storage::artifact::ArtifactStoreError;
  using storage::artifact::ArtifactStoreMock;
  using storage::artifact::FilesystemArtifactStore;
  using testing::_;
  using testing::Return;

  class RetrievalCascadeTest : public test::BaseFS_Test {
   public:
    RetrievalCascadeTest()
        : test::BaseFS_Test("/tmp/pyrsia_test_retrieval_cascade") {}

    void SetUp() override {
      BaseFS_Test::SetUp();
      store = FilesystemArtifactStore::create(base_path, 1 << 20).value();
    }

    /// Creates cascade once fake overlay state is set up
    std::shared_ptr<RetrievalCascade> cascade(size_t peer_attempts = 1) {
      overlay.start();
      return std::make_shared<RetrievalCascade>(
          store, overlay.client(), origin, CascadeConfig{peer_attempts});
    }

    void expectOrigin(outcome::result<Bytes> blob) {
      EXPECT_CALL(*origin, authToken(kName))
          .WillOnce(Return(AuthToken{"abc", std::chrono::seconds{60}}));
      EXPECT_CALL(*origin, fetchBlob(kName, hash, _)).WillOnce(Return(blob));
    }

    void expectNoOrigin() {
      EXPECT_CALL(*origin, authToken(_)).Times(0);
      EXPECT_CALL(*origin, fetchBlob(_, _, _)).Times(0);
    }

    const std::string kName{"alpine"};
    Bytes content{copy(asBytes("layer content"))};
    ArtifactHash hash{ArtifactHash::of(content)};
    PeerId peer_a{generatePeerId(1)};
    PeerId peer_b{generatePeerId(2)};

    std::shared_ptr<FilesystemArtifactStore> store;
    std::shared_ptr<OriginRegistryMock> origin{
        std::make_shared<OriginRegistryMock>()};
    test::FakeOverlay overlay;
  };

  /**
   * @given artifact in local store
   * @when resolve it
   * @then it is returned without network or origin access
   */
  TEST_F(RetrievalCascadeTest, LocalHit) {
    EXPECT_OUTCOME_TRUE_1(store->put(hash, content));
    expectNoOrigin();
    EXPECT_OUTCOME_EQ(cascade()->resolve(kName, hash), content);
    EXPECT_EQ(overlay.commandCount(), 0u);
  }

  /**
   * @given peer providing artifact
   * @when resolve it
   * @then bytes of peer are stored and provided, origin is not used
   */
  TEST_F(RetrievalCascadeTest, PeerHit) {
    overlay.providers = {peer_a};
    overlay.served.emplace(peer_a, content);
    expectNoOrigin();
    EXPECT_OUTCOME_EQ(cascade()->resolve(kName, hash), content);
    EXPECT_OUTCOME_EQ(store->contains(hash), true);
    EXPECT_EQ(overlay.providedHashes(), std::vector<ArtifactHash>{hash});
  }

  /**
   * @given no providers of artifact
   * @when resolve it
   * @then origin bytes are stored and provided
   */
  TEST_F(RetrievalCascadeTest, OriginFallback) {
    expectOrigin(content);
    EXPECT_OUTCOME_EQ(cascade()->resolve(kName, hash.toString()), content);
    EXPECT_OUTCOME_EQ(store->get(hash), content);
    EXPECT_EQ(overlay.providedHashes(), std::vector<ArtifactHash>{hash});
  }

  /**
   * @given provider sending wrong content
   * @when resolve artifact
   * @then wrong content is discarded and origin bytes are returned
   */
  TEST_F(RetrievalCascadeTest, PeerIntegrityMismatch) {
    overlay.providers = {peer_a};
    overlay.served.emplace(peer_a, copy(asBytes("forged")));
    expectOrigin(content);
    EXPECT_OUTCOME_EQ(cascade()->resolve(kName, hash), content);
    EXPECT_EQ(store->stat().artifact_count, 1u);
  }

  /**
   * @given first provider without artifact, second with it
   * @when resolve with two peer attempts
   * @then second provider's bytes are used
   */
  TEST_F(RetrievalCascadeTest, NextPeer) {
    overlay.providers = {peer_a, peer_b};
    overlay.served.emplace(peer_b, content);
    expectNoOrigin();
    EXPECT_OUTCOME_EQ(cascade(2)->resolve(kName, hash), content);
  }

  /**
   * @given first provider without artifact and one peer attempt
   * @when resolve artifact
   * @then origin is used without asking second provider
   */
  TEST_F(RetrievalCascadeTest, PeerAttemptsLimit) {
    overlay.providers = {peer_a, peer_b};
    overlay.served.emplace(peer_b, copy(asBytes("unused")));
    expectOrigin(content);
    EXPECT_OUTCOME_EQ(cascade()->resolve(kName, hash), content);
  }

  /**
   * @given origin without artifact
   * @when resolve it
   * @then origin error is returned, nothing is stored or provided
   */
  TEST_F(RetrievalCascadeTest, OriginNotFound) {
    expectOrigin(OriginRegistryError::kOriginNotFound);
    EXPECT_OUTCOME_ERROR(OriginRegistryError::kOriginNotFound,
                         cascade()->resolve(kName, hash));
    EXPECT_OUTCOME_EQ(store->contains(hash), false);
    EXPECT_TRUE(overlay.providedHashes().empty());
  }

  /**
   * @given origin sending wrong content
   * @when resolve artifact
   * @then kIntegrityMismatch is returned and nothing is stored
   */
  TEST_F(RetrievalCascadeTest, OriginIntegrityMismatch) {
    expectOrigin(copy(asBytes("forged")));
    EXPECT_OUTCOME_ERROR(ArtifactStoreError::kIntegrityMismatch,
                         cascade()->resolve(kName, hash));
    EXPECT_EQ(store->stat().artifact_count, 0u);
  }

  /**
   * @given malformed identifier
   * @when resolve it
   * @then parse error is returned
   */
  TEST_F(RetrievalCascadeTest, MalformedId) {
    expectNoOrigin();
    EXPECT_OUTCOME_ERROR(primitives::ArtifactHashError::kInvalidPrefix,
                         cascade()->resolve(kName, "layer"));
  }

  /**
   * @given local store failing to read artifact
   * @when resolve it
   * @then read error is not fatal and artifact is fetched from origin
   */
  TEST(RetrievalCascadeStoreTest, LocalReadError) {
    auto content{copy(asBytes("layer content"))};
    auto hash{ArtifactHash::of(content)};
    auto store{std::make_shared<ArtifactStoreMock>()};
    auto origin{std::make_shared<OriginRegistryMock>()};
    test::FakeOverlay overlay;
    overlay.start();

    testing::InSequence sequence;
    outcome::result<Bytes> read_error{ArtifactStoreError::kIoError};
    EXPECT_CALL(*store, get(hash)).WillOnce(Return(read_error));
    EXPECT_CALL(*origin, authToken("alpine"))
        .WillOnce(Return(AuthToken{"abc", std::chrono::seconds{60}}));
    EXPECT_CALL(*origin, fetchBlob("alpine", hash, _))
        .WillOnce(Return(content));
    EXPECT_CALL(*store, put(hash, testing::An<BytesIn>()))
        .WillOnce(Return(true));
    EXPECT_CALL(*store, get(hash)).WillOnce(Return(content));

    RetrievalCascade cascade{store, overlay.client(), origin, CascadeConfig{}};
    EXPECT_OUTCOME_EQ(cascade.resolve("alpine", hash), content);
    EXPECT_EQ(overlay.providedHashes(), std::vector<ArtifactHash>{hash});
  }
}  // namespace pyrsia::retrieval
