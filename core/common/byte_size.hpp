/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/outcome.hpp"

namespace pyrsia::common {
  enum class ByteSizeError {
    kInvalidFormat = 1,
    kUnknownUnit,
    kOverflow,
  };

  /**
   * Parses human readable size like "10 GB", "512MiB" or "1024".
   * Decimal units (KB, MB, GB, TB) are powers of 1000, binary units (KiB,
   * MiB, GiB, TiB) powers of 1024. Units are case insensitive, fraction is
   * allowed ("1.5 GB").
   * @param str - size string
   * @return size in bytes
   */
  outcome::result<uint64_t> parseByteSize(std::string_view str);
}  // namespace pyrsia::common

OUTCOME_HPP_DECLARE_ERROR(pyrsia::common, ByteSizeError);
