/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::codec::json, JsonError, e) {
  using E = pyrsia::codec::json::JsonError;
  switch (e) {
    case E::kParseError:
      return "JsonError: malformed json";
    case E::kMissingField:
      return "JsonError: missing field";
    case E::kWrongType:
      return "JsonError: wrong type";
    case E::kWrongEnum:
      return "JsonError: wrong enum";
  }

  return "JsonError: unknown error";
}
