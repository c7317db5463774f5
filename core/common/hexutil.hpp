/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace pyrsia::common {
  enum class UnhexError {
    kNonHexInput = 1,
    kOddLength,
  };

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes to convert
   * @return hex string, two characters per byte
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex string of either case, with even length
   * @return bytes or UnhexError
   */
  outcome::result<Bytes> unhex(std::string_view hex);
}  // namespace pyrsia::common

OUTCOME_HPP_DECLARE_ERROR(pyrsia::common, UnhexError);
