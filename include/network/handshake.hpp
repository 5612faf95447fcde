// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Identity handshake run on every new transport connection before it is
 registered. Symmetric: both sides send the same two frames.

   HELLO  = "PNET" | version | public key (32) | nonce (32)
   PROOF  = Ed25519 signature over
            HANDSHAKE_CONTEXT | peer nonce | own public key | peer public key

 Each side proves possession of its key by signing the nonce the other side
 chose, so a PROOF cannot be replayed on another connection. A peer whose
 HELLO carries our own key is rejected (self-connection).

 Failure reporting:
 - malformed/unexpected frames, bad key, bad signature -> HandshakeFailed
 - socket error or EOF                                 -> Io
 - deadline expiry: DialTimedOut for outbound attempts,
   HandshakeFailed for inbound ones
*/

#include "crypto/keypair.hpp"
#include "network/connection_types.hpp"
#include "network/net_error.hpp"
#include "network/peer_identity.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <asio.hpp>

namespace peernet {
namespace network {

using HandshakeNonce = std::array<uint8_t, protocol::NONCE_SIZE>;

struct HelloMessage {
  crypto::PublicKey public_key{};
  HandshakeNonce nonce{};
};

// Serialize HELLO payload (without frame header)
std::vector<uint8_t> EncodeHello(const HelloMessage& hello);

// Parse a HELLO payload. Checks size, magic and version only; key validity
// is checked separately. On failure returns nullopt and sets *error if given.
std::optional<HelloMessage> DecodeHello(std::span<const uint8_t> payload, std::string* error = nullptr);

// Bytes covered by a PROOF signature
std::vector<uint8_t> BuildProofTranscript(const HandshakeNonce& peer_nonce, const crypto::PublicKey& signer_key,
                                          const crypto::PublicKey& peer_key);

// Completed handshake: the socket plus the verified remote identity
struct HandshakeResult {
  RawSocket socket;
  PeerIdentity remote_identity;
  NetworkAddress remote_address;
  Direction direction;
};

// HandshakeSession - one asynchronous handshake on one socket.
// Owns the socket until completion. The completion handler is invoked
// exactly once, on the session strand.
class HandshakeSession : public std::enable_shared_from_this<HandshakeSession> {
public:
  using CompletionHandler = std::function<void(Status status, std::optional<HandshakeResult> result)>;

  static std::shared_ptr<HandshakeSession> Create(RawSocket socket, Direction direction,
                                                  const crypto::KeyPair& local_keypair,
                                                  std::chrono::steady_clock::time_point deadline);

  void Start(CompletionHandler handler);

  ConnectionState state() const { return state_; }

private:
  HandshakeSession(RawSocket socket, Direction direction, const crypto::KeyPair& local_keypair,
                   std::chrono::steady_clock::time_point deadline);

  void SendHello();
  void ReadFrame(size_t expected_size, std::function<void()> on_payload);
  void OnHello();
  void OnProof();

  void Fail(Status status);
  void Succeed();

  RawSocket socket_;
  asio::strand<asio::any_io_executor> strand_;
  asio::steady_timer timer_;
  const Direction direction_;
  const crypto::KeyPair local_keypair_;
  const std::chrono::steady_clock::time_point deadline_;
  NetworkAddress remote_address_;

  HandshakeNonce local_nonce_{};
  std::optional<HelloMessage> remote_hello_;
  std::optional<PeerIdentity> remote_identity_;

  std::vector<uint8_t> write_buffer_;
  std::array<uint8_t, protocol::FRAME_HEADER_SIZE> header_buffer_{};
  std::vector<uint8_t> payload_buffer_;

  CompletionHandler handler_;
  ConnectionState state_{ConnectionState::RESERVED};
  bool done_{false};
};

}  // namespace network
}  // namespace peernet
