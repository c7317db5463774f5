/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/byte_size.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace pyrsia::common {
  /**
   * @given sizes with decimal, binary and missing units
   * @when parse them
   * @then byte counts use matching powers
   */
  TEST(ByteSizeTest, Units) {
    EXPECT_OUTCOME_EQ(parseByteSize("1024"), 1024u);
    EXPECT_OUTCOME_EQ(parseByteSize("10 B"), 10u);
    EXPECT_OUTCOME_EQ(parseByteSize("10 GB"), 10'000'000'000u);
    EXPECT_OUTCOME_EQ(parseByteSize("10gb"), 10'000'000'000u);
    EXPECT_OUTCOME_EQ(parseByteSize("2 KB"), 2000u);
    EXPECT_OUTCOME_EQ(parseByteSize("512MiB"), 512ull << 20);
    EXPECT_OUTCOME_EQ(parseByteSize(" 1 TiB "), 1ull << 40);
  }

  /**
   * @given size with fraction
   * @when parse it
   * @then fraction of unit is counted
   */
  TEST(ByteSizeTest, Fraction) {
    EXPECT_OUTCOME_EQ(parseByteSize("1.5 GB"), 1'500'000'000u);
    EXPECT_OUTCOME_EQ(parseByteSize("0.5KiB"), 512u);
  }

  /**
   * @given malformed sizes
   * @when parse them
   * @then matching error is returned
   */
  TEST(ByteSizeTest, Malformed) {
    EXPECT_OUTCOME_ERROR(ByteSizeError::kInvalidFormat, parseByteSize(""));
    EXPECT_OUTCOME_ERROR(ByteSizeError::kInvalidFormat, parseByteSize("GB"));
    EXPECT_OUTCOME_ERROR(ByteSizeError::kInvalidFormat, parseByteSize("1. GB"));
    EXPECT_OUTCOME_ERROR(ByteSizeError::kUnknownUnit, parseByteSize("10 PB"));
    EXPECT_OUTCOME_ERROR(ByteSizeError::kOverflow,
                         parseByteSize("99999999999999999999"));
    EXPECT_OUTCOME_ERROR(ByteSizeError::kOverflow,
                         parseByteSize("99999999999 GB"));
  }

  /**
   * @given sizes with non-ascii bytes in number and unit
   * @when parse them
   * @then they are rejected as malformed
   */
  TEST(ByteSizeTest, NonAscii) {
    EXPECT_OUTCOME_ERROR(ByteSizeError::kInvalidFormat,
                         parseByteSize("\xc2\xb2 GB"));
    EXPECT_OUTCOME_ERROR(ByteSizeError::kInvalidFormat,
                         parseByteSize("\xff\xfe"));
    EXPECT_OUTCOME_ERROR(ByteSizeError::kInvalidFormat,
                         parseByteSize("1.\xd9\xa3 GB"));
    EXPECT_OUTCOME_ERROR(ByteSizeError::kUnknownUnit,
                         parseByteSize("10 \xc3\x9f" "B"));
  }
}  // namespace pyrsia::common
