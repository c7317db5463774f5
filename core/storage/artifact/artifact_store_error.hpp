/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace pyrsia::storage::artifact {
  enum class ArtifactStoreError {
    kIntegrityMismatch = 1,
    kQuotaExceeded,
    kNotFoundLocally,
    kIoError,
  };
}  // namespace pyrsia::storage::artifact

OUTCOME_HPP_DECLARE_ERROR(pyrsia::storage::artifact, ArtifactStoreError);
