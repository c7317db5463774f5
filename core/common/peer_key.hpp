/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/string_file.hpp>
#include <libp2p/crypto/ed25519_provider/ed25519_provider_impl.hpp>
#include <libp2p/crypto/key.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace pyrsia {
  /**
   * Loads ed25519 private key of this node, generates and saves it on first
   * run. Peer identity is derived from the key, so it stays stable across
   * restarts.
   * @param path - raw 32 byte private key file
   */
  inline outcome::result<libp2p::crypto::KeyPair> loadPeerKey(
      const boost::filesystem::path &path) {
    libp2p::crypto::ed25519::Ed25519ProviderImpl provider;
    libp2p::crypto::ed25519::Keypair ed;
    std::string str;
    if (boost::filesystem::exists(path)) {
      boost::filesystem::load_string_file(path, str);
    }
    if (str.size() == ed.private_key.size()) {
      std::copy(str.begin(), str.end(), ed.private_key.begin());
      OUTCOME_TRYA(ed.public_key, provider.derive(ed.private_key));
    } else {
      OUTCOME_TRYA(ed, provider.generate());
      boost::filesystem::save_string_file(
          path, std::string{asString(ed.private_key)});
    }
    libp2p::crypto::KeyPair keys;
    keys.privateKey.type = keys.publicKey.type =
        libp2p::crypto::Key::Type::Ed25519;
    keys.privateKey.data.assign(ed.private_key.begin(), ed.private_key.end());
    keys.publicKey.data.assign(ed.public_key.begin(), ed.public_key.end());
    return keys;
  }
}  // namespace pyrsia
