/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/byte_size.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/optional.hpp>
#include <cctype>
#include <cmath>
#include <limits>
#include <string>

namespace pyrsia::common {
  namespace {
    constexpr uint64_t kKilo{1000};
    constexpr uint64_t kKibi{1024};

    boost::optional<uint64_t> unitMultiplier(const std::string &unit) {
      if (unit.empty() || unit == "b") {
        return 1;
      }
      if (unit == "kb") {
        return kKilo;
      }
      if (unit == "mb") {
        return kKilo * kKilo;
      }
      if (unit == "gb") {
        return kKilo * kKilo * kKilo;
      }
      if (unit == "tb") {
        return kKilo * kKilo * kKilo * kKilo;
      }
      if (unit == "kib") {
        return kKibi;
      }
      if (unit == "mib") {
        return kKibi * kKibi;
      }
      if (unit == "gib") {
        return kKibi * kKibi * kKibi;
      }
      if (unit == "tib") {
        return kKibi * kKibi * kKibi * kKibi;
      }
      return boost::none;
    }

    bool isDigit(char c) {
      return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }
  }  // namespace

  outcome::result<uint64_t> parseByteSize(std::string_view str) {
    auto input{boost::algorithm::trim_copy(std::string{str})};
    size_t pos{0};
    uint64_t whole{0};
    while (pos < input.size() && isDigit(input[pos])) {
      const uint64_t digit = input[pos] - '0';
      if (whole > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
        return ByteSizeError::kOverflow;
      }
      whole = whole * 10 + digit;
      ++pos;
    }
    if (pos == 0) {
      return ByteSizeError::kInvalidFormat;
    }
    long double fraction{0};
    if (pos < input.size() && input[pos] == '.') {
      ++pos;
      long double scale{0.1};
      const auto fraction_begin{pos};
      while (pos < input.size() && isDigit(input[pos])) {
        fraction += scale * (input[pos] - '0');
        scale /= 10;
        ++pos;
      }
      if (pos == fraction_begin) {
        return ByteSizeError::kInvalidFormat;
      }
    }
    auto unit{boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy(input.substr(pos)))};
    auto multiplier{unitMultiplier(unit)};
    if (!multiplier) {
      return ByteSizeError::kUnknownUnit;
    }
    if (whole > std::numeric_limits<uint64_t>::max() / *multiplier) {
      return ByteSizeError::kOverflow;
    }
    const auto extra{
        static_cast<uint64_t>(std::floor(fraction * (*multiplier)))};
    const auto bytes{whole * *multiplier};
    if (bytes > std::numeric_limits<uint64_t>::max() - extra) {
      return ByteSizeError::kOverflow;
    }
    return bytes + extra;
  }
}  // namespace pyrsia::common

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::common, ByteSizeError, e) {
  using pyrsia::common::ByteSizeError;
  switch (e) {
    case ByteSizeError::kInvalidFormat:
      return "ByteSizeError: size must start with a number";
    case ByteSizeError::kUnknownUnit:
      return "ByteSizeError: unknown size unit";
    case ByteSizeError::kOverflow:
      return "ByteSizeError: size does not fit 64 bits";
  }
  return "ByteSizeError: unknown error";
}
