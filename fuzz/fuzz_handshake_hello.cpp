// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Fuzz target for handshake HELLO decoding
//
// The HELLO frame is the first thing an unauthenticated peer sends, so the
// decoder sees fully attacker-controlled bytes. Checks:
// - DecodeHello never crashes or throws on arbitrary input
// - an accepted HELLO re-encodes to exactly the input bytes
// - identity derivation from the advertised key never throws
//
// Target code:
// - src/network/handshake.cpp (DecodeHello, EncodeHello)
// - src/network/peer_identity.cpp (FromPublicKey)

#include "network/handshake.hpp"
#include "network/peer_identity.hpp"
#include "network/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>

using namespace peernet::network;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  std::string error;
  auto hello = DecodeHello(std::span<const uint8_t>(data, size), &error);
  if (!hello) {
    if (error.empty())
      abort();  // Rejections must say why
    return 0;
  }

  if (size != protocol::HELLO_SIZE)
    abort();

  auto encoded = EncodeHello(*hello);
  if (encoded.size() != size || std::memcmp(encoded.data(), data, size) != 0)
    abort();

  // Off-curve keys are refused later by the session; only exercise the check
  auto identity = PeerIdentity::FromPublicKey(hello->public_key);
  if (identity && identity->bytes() != hello->public_key)
    abort();

  return 0;
}
