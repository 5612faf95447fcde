// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keypair.hpp"

#include <compare>
#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace peernet {
namespace network {

// PeerIdentity - identifier of a network participant, derived from its
// Ed25519 public key. Immutable value type; equality, ordering and hashing
// are over the raw key bytes, so two peers compare identically on both
// ends of a connection (used by the duplicate-connection tie-break).
class PeerIdentity {
public:
  // nullopt if the bytes are not a well-formed public key (InvalidKey)
  static std::optional<PeerIdentity> FromPublicKey(std::span<const uint8_t> public_key);

  static PeerIdentity FromKeyPair(const crypto::KeyPair& keypair);

  // Parse the lowercase/uppercase hex form produced by ToString()
  static std::optional<PeerIdentity> FromHex(const std::string& hex);

  const crypto::PublicKey& bytes() const { return public_key_; }

  std::string ToString() const;

  // Abbreviated form for log lines
  std::string ShortString() const;

  auto operator<=>(const PeerIdentity&) const = default;
  bool operator==(const PeerIdentity&) const = default;

  struct Hasher {
    size_t operator()(const PeerIdentity& id) const noexcept;
  };

private:
  explicit PeerIdentity(const crypto::PublicKey& public_key) : public_key_(public_key) {}

  crypto::PublicKey public_key_;
};

}  // namespace network
}  // namespace peernet
