/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/overlay/artifact_exchange.hpp"

#include "common/logger.hpp"
#include "network/overlay/overlay_error.hpp"

namespace pyrsia::network::overlay {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("overlay");
      return logger.get();
    }
  }  // namespace

  ArtifactResponse ArtifactResponse::ok(Bytes bytes) {
    return {ResponseStatus::kOk, std::move(bytes)};
  }

  ArtifactResponse ArtifactResponse::notFound() {
    return {ResponseStatus::kNotFound, {}};
  }

  ArtifactResponse ArtifactResponse::error(std::string_view message) {
    return {ResponseStatus::kError, copy(asBytes(message))};
  }

  outcome::result<void> checkFrameSize(uint64_t size, size_t max_size) {
    if (size == 0) {
      return ArtifactExchangeError::kEmptyFrame;
    }
    if (size > max_size) {
      return ArtifactExchangeError::kFrameTooLarge;
    }
    return outcome::success();
  }

  Bytes encodeRequest(const ArtifactHash &hash) {
    return copy(asBytes(hash.toString()));
  }

  outcome::result<ArtifactHash> decodeRequest(BytesIn frame) {
    return ArtifactHash::fromString(asString(frame));
  }

  Bytes encodeResponse(const ArtifactResponse &response) {
    Bytes frame;
    frame.reserve(response.payload.size() + 1);
    frame.push_back(static_cast<uint8_t>(response.status));
    append(frame, response.payload);
    return frame;
  }

  outcome::result<ArtifactResponse> decodeResponse(BytesIn frame) {
    if (frame.empty()) {
      return ArtifactExchangeError::kEmptyFrame;
    }
    const auto status{static_cast<ResponseStatus>(frame[0])};
    switch (status) {
      case ResponseStatus::kOk:
      case ResponseStatus::kNotFound:
      case ResponseStatus::kError:
        return ArtifactResponse{status, copy(frame.subspan(1))};
    }
    return ArtifactExchangeError::kUnknownStatus;
  }

  outcome::result<Bytes> responseResult(ArtifactResponse response) {
    switch (response.status) {
      case ResponseStatus::kOk:
        return std::move(response.payload);
      case ResponseStatus::kNotFound:
        return OverlayError::kArtifactNotFound;
      case ResponseStatus::kError:
        log()->debug("peer error: {}", asString(response.payload));
        return OverlayError::kPeerTransferFailed;
    }
    return OverlayError::kPeerTransferFailed;
  }
}  // namespace pyrsia::network::overlay

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::network::overlay,
                            ArtifactExchangeError,
                            e) {
  using pyrsia::network::overlay::ArtifactExchangeError;
  switch (e) {
    case ArtifactExchangeError::kEmptyFrame:
      return "ArtifactExchangeError: empty frame";
    case ArtifactExchangeError::kUnknownStatus:
      return "ArtifactExchangeError: unknown response status";
    case ArtifactExchangeError::kFrameTooLarge:
      return "ArtifactExchangeError: frame exceeds size limit";
  }
  return "ArtifactExchangeError: unknown error";
}
