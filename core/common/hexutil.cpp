/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <boost/algorithm/hex.hpp>

namespace pyrsia::common {
  std::string hex_lower(BytesIn bytes) {
    std::string res(bytes.size() * 2, '\x00');
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), res.begin());
    return res;
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
      return UnhexError::kOddLength;
    }
    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(
          hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::hex_decode_error &) {
      return UnhexError::kNonHexInput;
    }
    return bytes;
  }
}  // namespace pyrsia::common

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::common, UnhexError, e) {
  using pyrsia::common::UnhexError;
  switch (e) {
    case UnhexError::kNonHexInput:
      return "UnhexError: input is not a valid hex string";
    case UnhexError::kOddLength:
      return "UnhexError: input has odd length";
  }
  return "UnhexError: unknown error";
}
