/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/overlay/broadcast_message.hpp"

#include "codec/json/json.hpp"
#include "common/visitor.hpp"

namespace pyrsia::network::overlay {
  using codec::json::Document;
  using codec::json::jGet;
  using codec::json::JIn;
  using codec::json::jList;
  using codec::json::JsonError;
  using codec::json::jStr;
  using codec::json::jString;
  using codec::json::Value;

  namespace {
    constexpr auto kType{"type"};
    constexpr auto kAnnounce{"announce"};
    constexpr auto kProvide{"provide"};
    constexpr auto kWithdraw{"withdraw"};
    constexpr auto kListRequest{"list_request"};
    constexpr auto kListResponse{"list_response"};

    outcome::result<ArtifactHash> jHash(JIn j) {
      OUTCOME_TRY(str, jStr(j));
      return ArtifactHash::fromString(str);
    }

    outcome::result<std::string> jAddress(JIn j) {
      OUTCOME_TRY(str, jStr(j));
      return std::string{str};
    }

    outcome::result<PeerId> jPeer(JIn j) {
      OUTCOME_TRY(str, jStr(j));
      return PeerId::fromBase58(std::string{str});
    }

    Value hashList(const std::vector<ArtifactHash> &hashes,
                   Document::AllocatorType &alloc) {
      Value list{rapidjson::kArrayType};
      for (const auto &hash : hashes) {
        list.PushBack(jString(hash.toString(), alloc), alloc);
      }
      return list;
    }
  }  // namespace

  Bytes encodeBroadcast(const BroadcastMessage &message) {
    Document doc{rapidjson::kObjectType};
    auto &alloc{doc.GetAllocator()};
    auto set{[&](const char *key, Value value) {
      doc.AddMember(rapidjson::StringRef(key), value, alloc);
    }};
    visit_in_place(
        message,
        [&](const broadcast::Announce &announce) {
          set(kType, jString(kAnnounce, alloc));
          Value addresses{rapidjson::kArrayType};
          for (const auto &address : announce.addresses) {
            addresses.PushBack(jString(address, alloc), alloc);
          }
          set("addresses", std::move(addresses));
        },
        [&](const broadcast::Provide &provide) {
          set(kType, jString(kProvide, alloc));
          set("hash", jString(provide.hash.toString(), alloc));
        },
        [&](const broadcast::Withdraw &withdraw) {
          set(kType, jString(kWithdraw, alloc));
          set("hash", jString(withdraw.hash.toString(), alloc));
        },
        [&](const broadcast::ListRequest &request) {
          set(kType, jString(kListRequest, alloc));
          if (request.peer) {
            set("peer", jString(request.peer->toBase58(), alloc));
          }
        },
        [&](const broadcast::ListResponse &response) {
          set(kType, jString(kListResponse, alloc));
          set("receiver", jString(response.receiver.toBase58(), alloc));
          set("hashes", hashList(response.hashes, alloc));
        });
    return codec::json::format(doc);
  }

  outcome::result<BroadcastMessage> decodeBroadcast(BytesIn bytes) {
    OUTCOME_TRY(doc, codec::json::parse(bytes));
    const JIn j{&doc};
    OUTCOME_TRY(j_type, jGet(j, kType));
    OUTCOME_TRY(type, jStr(j_type));
    if (type == kAnnounce) {
      OUTCOME_TRY(j_addresses, jGet(j, "addresses"));
      OUTCOME_TRY(addresses, jList(j_addresses, jAddress));
      return broadcast::Announce{std::move(addresses)};
    }
    if (type == kProvide || type == kWithdraw) {
      OUTCOME_TRY(j_hash, jGet(j, "hash"));
      OUTCOME_TRY(hash, jHash(j_hash));
      if (type == kProvide) {
        return broadcast::Provide{std::move(hash)};
      }
      return broadcast::Withdraw{std::move(hash)};
    }
    if (type == kListRequest) {
      broadcast::ListRequest request;
      if (auto j_peer{jGet(j, "peer")}) {
        OUTCOME_TRY(peer, jPeer(j_peer.value()));
        request.peer = std::move(peer);
      }
      return request;
    }
    if (type == kListResponse) {
      OUTCOME_TRY(j_receiver, jGet(j, "receiver"));
      OUTCOME_TRY(receiver, jPeer(j_receiver));
      OUTCOME_TRY(j_hashes, jGet(j, "hashes"));
      OUTCOME_TRY(hashes, jList(j_hashes, jHash));
      return broadcast::ListResponse{std::move(receiver), std::move(hashes)};
    }
    return JsonError::kWrongEnum;
  }
}  // namespace pyrsia::network::overlay
