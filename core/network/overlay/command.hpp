/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>

#include "network/overlay/artifact_exchange.hpp"
#include "network/overlay/reply_slot.hpp"
#include "network/overlay/types.hpp"

namespace pyrsia::network::overlay {
  namespace command {
    struct Listen {
      Multiaddress address;
      ReplySlot<void> reply;
    };

    struct Dial {
      PeerId peer;
      Multiaddress address;
      ReplySlot<void> reply;
    };

    struct StartProviding {
      ArtifactHash hash;
      ReplySlot<void> reply;
    };

    struct StopProviding {
      ArtifactHash hash;
      ReplySlot<void> reply;
    };

    struct GetProviders {
      ArtifactHash hash;
      ReplySlot<ProviderSet> reply;
    };

    struct RequestArtifact {
      PeerId peer;
      ArtifactHash hash;
      ReplySlot<Bytes> reply;
    };

    /// Answers inbound request, with bytes or not found/error indication
    struct RespondArtifact {
      ResponseChannel channel;
      ArtifactResponse response;
      ReplySlot<void> reply;
    };

    struct ListPeers {
      ReplySlot<std::vector<PeerId>> reply;
    };
  }  // namespace command

  /// Operations accepted by overlay engine
  using Command = boost::variant<command::Listen,
                                 command::Dial,
                                 command::StartProviding,
                                 command::StopProviding,
                                 command::GetProviders,
                                 command::RequestArtifact,
                                 command::RespondArtifact,
                                 command::ListPeers>;

  /// Completes reply slot of command with error
  inline void failCommand(const Command &command,
                          const std::error_code &error) {
    boost::apply_visitor([&](const auto &cmd) { cmd.reply.complete(error); },
                         command);
  }
}  // namespace pyrsia::network::overlay
