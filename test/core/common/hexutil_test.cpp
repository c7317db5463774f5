/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace pyrsia::common {
  /**
   * @given bytes
   * @when convert to hex
   * @then hex is lowercase, two characters per byte
   */
  TEST(HexUtilTest, HexLower) {
    EXPECT_EQ(hex_lower(Bytes{0x00, 0x0a, 0xff}), "000aff");
    EXPECT_EQ(hex_lower({}), "");
  }

  /**
   * @given hex of either case
   * @when unhex it
   * @then same bytes are returned
   */
  TEST(HexUtilTest, Unhex) {
    EXPECT_OUTCOME_EQ(unhex("000aFF"), (Bytes{0x00, 0x0a, 0xff}));
    EXPECT_OUTCOME_EQ(unhex(""), Bytes{});
  }

  /**
   * @given malformed hex
   * @when unhex it
   * @then error is returned
   */
  TEST(HexUtilTest, UnhexMalformed) {
    EXPECT_OUTCOME_ERROR(UnhexError::kOddLength, unhex("abc"));
    EXPECT_OUTCOME_ERROR(UnhexError::kNonHexInput, unhex("zz"));
  }
}  // namespace pyrsia::common
