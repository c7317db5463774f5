/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace pyrsia::codec::json {
  enum class JsonError {
    kParseError = 1,
    kMissingField,
    kWrongType,
    kWrongEnum,
  };
}  // namespace pyrsia::codec::json

OUTCOME_HPP_DECLARE_ERROR(pyrsia::codec::json, JsonError);
