// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

// Forward declaration (OpenSSL)
struct evp_pkey_st;

namespace peernet {
namespace crypto {

constexpr size_t PUBLIC_KEY_SIZE = 32;
constexpr size_t PRIVATE_KEY_SIZE = 32;
constexpr size_t SIGNATURE_SIZE = 64;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

// KeyPair - Ed25519 signing key backed by OpenSSL EVP
//
// Copies share the underlying EVP_PKEY (immutable after construction), so a
// KeyPair can be handed to several components without duplicating key
// material. Sign() and Verify() are safe to call concurrently.
class KeyPair {
public:
  // Generate a fresh random key pair. Throws std::runtime_error if OpenSSL
  // cannot produce a key (entropy or provider failure).
  static KeyPair Generate();

  // Rebuild a key pair from a raw 32-byte private seed. nullopt if malformed.
  static std::optional<KeyPair> FromPrivateKey(std::span<const uint8_t> private_key);

  const PublicKey& public_key() const { return public_key_; }

  // Sign an arbitrary message (Ed25519 is pure: no pre-hash).
  // Throws std::runtime_error on an internal OpenSSL failure.
  Signature Sign(std::span<const uint8_t> message) const;

  // Verify a signature made by the holder of public_key.
  static bool Verify(const PublicKey& public_key, std::span<const uint8_t> message, const Signature& signature);

  // True if the bytes are the canonical encoding of a curve point outside
  // the small-order subgroup. Length alone is not enough: OpenSSL accepts
  // any 32 bytes as a raw public key without decoding the point.
  static bool IsValidPublicKey(std::span<const uint8_t> public_key);

private:
  explicit KeyPair(std::shared_ptr<evp_pkey_st> pkey);

  std::shared_ptr<evp_pkey_st> pkey_;
  PublicKey public_key_{};
};

}  // namespace crypto
}  // namespace peernet
