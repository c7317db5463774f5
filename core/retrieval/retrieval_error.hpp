/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace pyrsia::retrieval {
  /// Failures of peer tier, absorbed by cascade and never returned to caller
  enum class RetrievalError {
    kNoProviders = 1,
    kPeerIntegrityMismatch,
  };
}  // namespace pyrsia::retrieval

OUTCOME_HPP_DECLARE_ERROR(pyrsia::retrieval, RetrievalError);
