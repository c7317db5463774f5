/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace pyrsia::codec::json {
  using rapidjson::StringBuffer;

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse(input.data(), input.size());
    if (doc.HasParseError()) {
      return JsonError::kParseError;
    }
    return std::move(doc);
  }

  outcome::result<Document> parse(BytesIn input) {
    return parse(asString(input));
  }

  Bytes format(const Value &j) {
    StringBuffer buffer;
    rapidjson::Writer<StringBuffer> writer{buffer};
    j.Accept(writer);
    std::string_view s{buffer.GetString(), buffer.GetSize()};
    return Bytes(s.begin(), s.end());
  }

  outcome::result<JIn> jGet(JIn j, std::string_view key) {
    if (j->IsObject()) {
      auto it{j->FindMember(
          Value{rapidjson::StringRef(key.data(), key.size())})};
      if (it != j->MemberEnd()) {
        return &it->value;
      }
    }
    return JsonError::kMissingField;
  }

  outcome::result<std::string_view> jStr(JIn j) {
    if (j->IsString()) {
      return std::string_view{j->GetString(), j->GetStringLength()};
    }
    return JsonError::kWrongType;
  }

  outcome::result<uint64_t> jUint(JIn j) {
    if (j->IsUint64()) {
      return j->GetUint64();
    }
    return JsonError::kWrongType;
  }
}  // namespace pyrsia::codec::json
