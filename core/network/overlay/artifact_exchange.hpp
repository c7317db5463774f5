/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/overlay/types.hpp"

namespace pyrsia::network::overlay {
  /**
   * Frames of artifact exchange protocol. Request frame is artifact
   * identifier string "sha256:<hex>". Response frame is status byte followed
   * by artifact bytes (kOk) or error message (kError).
   * Each frame is sent with unsigned varint length prefix.
   */
  /// Request frame carries only identifier, anything longer is refused
  constexpr size_t kMaxRequestFrameSize{128};

  /// Frame payload is read in chunks of this size as it arrives
  constexpr size_t kReadChunkSize{size_t{1} << 20};

  enum class ResponseStatus : uint8_t {
    kOk = 0,
    kNotFound = 1,
    kError = 2,
  };

  struct ArtifactResponse {
    ResponseStatus status{ResponseStatus::kOk};
    /// Artifact bytes or error message
    Bytes payload;

    static ArtifactResponse ok(Bytes bytes);
    static ArtifactResponse notFound();
    static ArtifactResponse error(std::string_view message);
  };

  enum class ArtifactExchangeError {
    kEmptyFrame = 1,
    kUnknownStatus,
    kFrameTooLarge,
  };

  /**
   * Checks length prefix of frame before any payload is read
   * @param size - length announced by peer
   * @param max_size - largest length accepted for this kind of frame
   */
  outcome::result<void> checkFrameSize(uint64_t size, size_t max_size);

  Bytes encodeRequest(const ArtifactHash &hash);

  outcome::result<ArtifactHash> decodeRequest(BytesIn frame);

  Bytes encodeResponse(const ArtifactResponse &response);

  outcome::result<ArtifactResponse> decodeResponse(BytesIn frame);

  /**
   * Converts peer response to result of artifact request
   * @return bytes, kArtifactNotFound or kPeerTransferFailed
   */
  outcome::result<Bytes> responseResult(ArtifactResponse response);
}  // namespace pyrsia::network::overlay

OUTCOME_HPP_DECLARE_ERROR(pyrsia::network::overlay, ArtifactExchangeError);
