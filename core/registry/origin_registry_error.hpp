/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace pyrsia::registry {
  enum class OriginRegistryError {
    kOriginUnauthorized = 1,
    kOriginNotFound,
    kIoError,
    kMalformedResponse,
  };
}  // namespace pyrsia::registry

OUTCOME_HPP_DECLARE_ERROR(pyrsia::registry, OriginRegistryError);
