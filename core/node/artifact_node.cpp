/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/artifact_node.hpp"

#include <boost/asio/post.hpp>

#include "common/logger.hpp"
#include "common/ptr.hpp"

namespace pyrsia::node {
  using network::overlay::ArtifactResponse;
  using storage::artifact::ArtifactStoreError;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("node");
      return logger.get();
    }
  }  // namespace

  ArtifactNode::ArtifactNode(std::shared_ptr<RetrievalCascade> cascade,
                             std::shared_ptr<ArtifactStore> store,
                             NetworkClient client,
                             std::string disk_allocated,
                             std::shared_ptr<boost::asio::io_context> io)
      : cascade_{std::move(cascade)},
        store_{std::move(store)},
        client_{std::move(client)},
        disk_allocated_{std::move(disk_allocated)},
        io_{std::move(io)} {}

  outcome::result<Bytes> ArtifactNode::resolve(const std::string &name,
                                               const ArtifactHash &hash) const {
    return cascade_->resolve(name, hash);
  }

  outcome::result<Bytes> ArtifactNode::resolve(const std::string &name,
                                               std::string_view id) const {
    return cascade_->resolve(name, id);
  }

  outcome::result<std::vector<PeerId>> ArtifactNode::listPeers() const {
    return client_.listPeers();
  }

  outcome::result<NodeStatus> ArtifactNode::status() const {
    OUTCOME_TRY(peers, client_.listPeers());
    const auto stat{store_->stat()};
    double usage{};
    if (stat.allocated != 0) {
      usage = 100.0 * static_cast<double>(stat.used)
              / static_cast<double>(stat.allocated);
    }
    return NodeStatus{stat.artifact_count,
                      peers.size(),
                      disk_allocated_,
                      fmt::format("{:.4f}", usage)};
  }

  void ArtifactNode::serve(
      const std::shared_ptr<adt::Channel<InboundEvent>> &events) {
    events->read([weak{weak_from_this()}](
                     boost::optional<InboundEvent> event) {
      auto self{weak.lock()};
      if (!self) {
        return false;
      }
      if (!event) {
        log()->info("inbound requests closed");
        return false;
      }
      boost::asio::post(
          *self->io_,
          weakCb(*self,
                 [event{std::move(*event)}](
                     std::shared_ptr<ArtifactNode> &&self) {
                   self->answer(event);
                 }));
      return true;
    });
  }

  void ArtifactNode::answer(const InboundEvent &event) const {
    auto bytes{store_->get(event.hash)};
    ArtifactResponse response;
    if (bytes) {
      log()->debug("sending {} to {}", event.hash, event.from.toBase58());
      response = ArtifactResponse::ok(std::move(bytes.value()));
    } else if (bytes.error() == ArtifactStoreError::kNotFoundLocally) {
      log()->debug("{} requested by {} not found",
                   event.hash,
                   event.from.toBase58());
      response = ArtifactResponse::notFound();
    } else {
      log()->warn("cannot read {} requested by {}: {}",
                  event.hash,
                  event.from.toBase58(),
                  bytes.error().message());
      response = ArtifactResponse::error(bytes.error().message());
    }
    client_.respondArtifact(
        event.channel,
        std::move(response),
        [hash{event.hash}, from{event.from}](outcome::result<void> res) {
          if (!res) {
            log()->debug("cannot answer request of {} for {}: {}",
                         from.toBase58(),
                         hash,
                         res.error().message());
          }
        });
  }
}  // namespace pyrsia::node
