/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include "codec/json/json_errors.hpp"
#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace pyrsia::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;
  using JIn = const Value *;

  outcome::result<Document> parse(std::string_view input);

  outcome::result<Document> parse(BytesIn input);

  Bytes format(const Value &j);

  outcome::result<JIn> jGet(JIn j, std::string_view key);

  outcome::result<std::string_view> jStr(JIn j);

  outcome::result<uint64_t> jUint(JIn j);

  template <typename F,
            typename T = typename std::invoke_result_t<F &, JIn>::value_type>
  inline outcome::result<std::vector<T>> jList(JIn j, F &&f) {
    if (!j->IsArray()) {
      return JsonError::kWrongType;
    }
    std::vector<T> list;
    list.reserve(j->Size());
    for (const auto &it : j->GetArray()) {
      OUTCOME_TRY(item, f(&it));
      list.push_back(std::move(item));
    }
    return list;
  }

  /// Creates string value owned by allocator of document
  inline Value jString(std::string_view str, Document::AllocatorType &alloc) {
    return Value{str.data(), static_cast<rapidjson::SizeType>(str.size()),
                 alloc};
  }
}  // namespace pyrsia::codec::json
