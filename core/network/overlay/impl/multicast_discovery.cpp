/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/overlay/impl/multicast_discovery.hpp"

#include <boost/asio/ip/multicast.hpp>

#include "codec/json/json.hpp"
#include "common/logger.hpp"
#include "common/ptr.hpp"
#include "network/overlay/overlay_error.hpp"

namespace pyrsia::network::overlay {
  using boost::asio::ip::udp;
  using codec::json::Document;
  using codec::json::jGet;
  using codec::json::JIn;
  using codec::json::jList;
  using codec::json::jStr;
  using codec::json::jString;
  using codec::json::Value;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("lan_discovery");
      return logger.get();
    }

    constexpr std::string_view kUnspecifiedIp4{"/ip4/0.0.0.0/"};

    outcome::result<Multiaddress> jAddress(JIn j) {
      OUTCOME_TRY(str, jStr(j));
      return Multiaddress::create(str);
    }

    /// Listen address on all interfaces is reachable at sender address
    Multiaddress withSenderHost(const Multiaddress &address,
                                const boost::asio::ip::address &sender) {
      std::string str{address.getStringAddress()};
      if (!sender.is_v4() || str.rfind(kUnspecifiedIp4, 0) != 0) {
        return address;
      }
      str.replace(0,
                  kUnspecifiedIp4.size(),
                  "/ip4/" + sender.to_string() + "/");
      if (auto replaced{Multiaddress::create(str)}) {
        return std::move(replaced.value());
      }
      return address;
    }
  }  // namespace

  Bytes encodeLanAnnouncement(const LanAnnouncement &announcement) {
    Document doc{rapidjson::kObjectType};
    auto &alloc{doc.GetAllocator()};
    doc.AddMember("peer", jString(announcement.peer.toBase58(), alloc), alloc);
    Value addresses{rapidjson::kArrayType};
    for (const auto &address : announcement.addresses) {
      addresses.PushBack(jString(address.getStringAddress(), alloc), alloc);
    }
    doc.AddMember("addresses", addresses, alloc);
    return codec::json::format(doc);
  }

  outcome::result<LanAnnouncement> decodeLanAnnouncement(BytesIn datagram) {
    OUTCOME_TRY(doc, codec::json::parse(datagram));
    const JIn j{&doc};
    OUTCOME_TRY(j_peer, jGet(j, "peer"));
    OUTCOME_TRY(peer_str, jStr(j_peer));
    OUTCOME_TRY(peer, PeerId::fromBase58(std::string{peer_str}));
    OUTCOME_TRY(j_addresses, jGet(j, "addresses"));
    OUTCOME_TRY(addresses, jList(j_addresses, jAddress));
    return LanAnnouncement{std::move(peer), std::move(addresses)};
  }

  MulticastDiscovery::MulticastDiscovery(
      LanDiscoveryConfig config,
      std::shared_ptr<boost::asio::io_context> io,
      PeerId self,
      AddressesFn addresses)
      : config_{std::move(config)},
        io_{std::move(io)},
        self_{std::move(self)},
        addresses_{std::move(addresses)},
        socket_{*io_},
        buffer_(kMaxDatagramSize) {}

  outcome::result<void> MulticastDiscovery::start(Handler handler) {
    boost::system::error_code ec;
    const auto group{boost::asio::ip::make_address(config_.group, ec)};
    if (ec || !group.is_multicast()) {
      log()->error("invalid multicast group {}", config_.group);
      return OverlayError::kInvalidAddress;
    }
    group_endpoint_ = udp::endpoint{group, config_.port};
    auto fail{[&](std::string_view step) -> outcome::result<void> {
      log()->error("cannot {} multicast socket on {}:{}: {}",
                   step,
                   config_.group,
                   config_.port,
                   ec.message());
      socket_.close(ec);
      return OverlayError::kDiscoveryFailed;
    }};
    socket_.open(group_endpoint_.protocol(), ec);
    if (ec) {
      return fail("open");
    }
    socket_.set_option(udp::socket::reuse_address(true), ec);
    if (ec) {
      return fail("configure");
    }
    socket_.bind(udp::endpoint{group_endpoint_.protocol(), config_.port}, ec);
    if (ec) {
      return fail("bind");
    }
    socket_.set_option(boost::asio::ip::multicast::join_group(group), ec);
    if (ec) {
      return fail("join group of");
    }
    socket_.set_option(boost::asio::ip::multicast::enable_loopback(true), ec);
    if (ec) {
      return fail("configure");
    }
    handler_ = std::move(handler);
    receive();
    log()->info("local network discovery on {}:{}",
                config_.group,
                config_.port);
    return outcome::success();
  }

  void MulticastDiscovery::stop() {
    handler_ = nullptr;
    boost::system::error_code ec;
    socket_.close(ec);
  }

  outcome::result<void> MulticastDiscovery::announce() {
    if (!socket_.is_open()) {
      return OverlayError::kDiscoveryFailed;
    }
    auto datagram{std::make_shared<Bytes>(
        encodeLanAnnouncement({self_, addresses_()}))};
    if (datagram->size() > kMaxDatagramSize) {
      log()->warn("announcement of {} bytes does not fit datagram",
                  datagram->size());
      return OverlayError::kDiscoveryFailed;
    }
    socket_.async_send_to(
        boost::asio::buffer(*datagram),
        group_endpoint_,
        [datagram](const boost::system::error_code &ec, size_t) {
          if (ec) {
            log()->debug("cannot send announcement: {}", ec.message());
          }
        });
    return outcome::success();
  }

  boost::optional<swarm_event::PeerDiscovered>
  MulticastDiscovery::handleDatagram(
      BytesIn datagram, const boost::asio::ip::address &sender) const {
    auto announcement{decodeLanAnnouncement(datagram)};
    if (!announcement) {
      log()->debug("malformed announcement from {}: {}",
                   sender.to_string(),
                   announcement.error().message());
      return boost::none;
    }
    auto &peer{announcement.value().peer};
    if (peer == self_) {
      return boost::none;
    }
    std::vector<Multiaddress> addresses;
    for (const auto &address : announcement.value().addresses) {
      addresses.push_back(withSenderHost(address, sender));
    }
    return swarm_event::PeerDiscovered{peer, std::move(addresses)};
  }

  void MulticastDiscovery::receive() {
    socket_.async_receive_from(
        boost::asio::buffer(buffer_),
        sender_,
        weakCb(*this,
               [](std::shared_ptr<MulticastDiscovery> &&self,
                  const boost::system::error_code &ec,
                  size_t size) {
                 if (ec == boost::asio::error::operation_aborted
                     || !self->socket_.is_open()) {
                   return;
                 }
                 if (ec) {
                   log()->debug("receive failed: {}", ec.message());
                 } else if (auto discovered{self->handleDatagram(
                                BytesIn{self->buffer_.data(), size},
                                self->sender_.address())};
                            discovered && self->handler_) {
                   self->handler_(std::move(*discovered));
                 }
                 self->receive();
               }));
  }
}  // namespace pyrsia::network::overlay
