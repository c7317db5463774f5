/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/origin_registry_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::registry, OriginRegistryError, e) {
  using pyrsia::registry::OriginRegistryError;

  switch (e) {
    case (OriginRegistryError::kOriginUnauthorized):
      return "OriginRegistryError: access to origin registry denied";
    case (OriginRegistryError::kOriginNotFound):
      return "OriginRegistryError: artifact not found in origin registry";
    case (OriginRegistryError::kIoError):
      return "OriginRegistryError: origin registry request failed";
    case (OriginRegistryError::kMalformedResponse):
      return "OriginRegistryError: malformed response of origin registry";
    default:
      return "OriginRegistryError: unknown error";
  }
}
