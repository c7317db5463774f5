/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "retrieval/retrieval_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(pyrsia::retrieval, RetrievalError, e) {
  using pyrsia::retrieval::RetrievalError;

  switch (e) {
    case (RetrievalError::kNoProviders):
      return "RetrievalError: no peer provides artifact";
    case (RetrievalError::kPeerIntegrityMismatch):
      return "RetrievalError: peer sent content not matching hash";
    default:
      return "RetrievalError: unknown error";
  }
}
