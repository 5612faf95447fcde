// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_identity.hpp"

#include <algorithm>
#include <cstring>

namespace peernet {
namespace network {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

}  // namespace

std::optional<PeerIdentity> PeerIdentity::FromPublicKey(std::span<const uint8_t> public_key) {
  if (!crypto::KeyPair::IsValidPublicKey(public_key)) {
    return std::nullopt;
  }
  crypto::PublicKey key{};
  std::copy(public_key.begin(), public_key.end(), key.begin());
  return PeerIdentity(key);
}

PeerIdentity PeerIdentity::FromKeyPair(const crypto::KeyPair& keypair) {
  return PeerIdentity(keypair.public_key());
}

std::optional<PeerIdentity> PeerIdentity::FromHex(const std::string& hex) {
  if (hex.size() != crypto::PUBLIC_KEY_SIZE * 2) {
    return std::nullopt;
  }
  crypto::PublicKey key{};
  for (size_t i = 0; i < key.size(); ++i) {
    int hi = HexValue(hex[2 * i]);
    int lo = HexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    key[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return FromPublicKey(key);
}

std::string PeerIdentity::ToString() const {
  std::string out;
  out.reserve(public_key_.size() * 2);
  for (uint8_t b : public_key_) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0f]);
  }
  return out;
}

std::string PeerIdentity::ShortString() const {
  return ToString().substr(0, 12);
}

size_t PeerIdentity::Hasher::operator()(const PeerIdentity& id) const noexcept {
  // Keys are uniformly distributed; the first word is a good hash
  size_t h = 0;
  std::memcpy(&h, id.public_key_.data(), sizeof(h));
  return h;
}

}  // namespace network
}  // namespace peernet
