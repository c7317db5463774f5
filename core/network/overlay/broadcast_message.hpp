/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "network/overlay/types.hpp"

namespace pyrsia::network::overlay {
  namespace broadcast {
    /// Presence of peer, published periodically on discovery topic
    struct Announce {
      std::vector<std::string> addresses;
    };

    /// Sender started providing artifact
    struct Provide {
      ArtifactHash hash;
    };

    /// Sender no longer provides artifact
    struct Withdraw {
      ArtifactHash hash;
    };

    /// Asks all peers, or one peer, to list provided artifacts
    struct ListRequest {
      boost::optional<PeerId> peer;
    };

    /// Artifacts provided by sender, in reply to receiver's request
    struct ListResponse {
      PeerId receiver;
      std::vector<ArtifactHash> hashes;
    };
  }  // namespace broadcast

  using BroadcastMessage = boost::variant<broadcast::Announce,
                                          broadcast::Provide,
                                          broadcast::Withdraw,
                                          broadcast::ListRequest,
                                          broadcast::ListResponse>;

  /// Encodes message as json object with "type" field
  Bytes encodeBroadcast(const BroadcastMessage &message);

  outcome::result<BroadcastMessage> decodeBroadcast(BytesIn bytes);
}  // namespace pyrsia::network::overlay
