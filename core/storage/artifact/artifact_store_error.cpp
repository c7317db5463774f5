/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/artifact/artifact_store_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::storage::artifact, ArtifactStoreError, e) {
  using pyrsia::storage::artifact::ArtifactStoreError;

  switch (e) {
    case (ArtifactStoreError::kIntegrityMismatch):
      return "ArtifactStoreError: content does not match its hash";
    case (ArtifactStoreError::kQuotaExceeded):
      return "ArtifactStoreError: quota exceeded";
    case (ArtifactStoreError::kNotFoundLocally):
      return "ArtifactStoreError: artifact not found locally";
    case (ArtifactStoreError::kIoError):
      return "ArtifactStoreError: io error";
    default:
      return "ArtifactStoreError: unknown error";
  }
}
