// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/handshake.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include <openssl/rand.h>

namespace peernet {
namespace network {

std::vector<uint8_t> EncodeHello(const HelloMessage& hello) {
  std::vector<uint8_t> payload;
  payload.reserve(protocol::HELLO_SIZE);
  payload.insert(payload.end(), protocol::HANDSHAKE_MAGIC.begin(), protocol::HANDSHAKE_MAGIC.end());
  payload.push_back(protocol::HANDSHAKE_VERSION);
  payload.insert(payload.end(), hello.public_key.begin(), hello.public_key.end());
  payload.insert(payload.end(), hello.nonce.begin(), hello.nonce.end());
  return payload;
}

std::optional<HelloMessage> DecodeHello(std::span<const uint8_t> payload, std::string* error) {
  auto reject = [error](const char* reason) -> std::optional<HelloMessage> {
    if (error)
      *error = reason;
    return std::nullopt;
  };

  if (payload.size() != protocol::HELLO_SIZE) {
    return reject("hello has wrong size");
  }
  if (!std::equal(protocol::HANDSHAKE_MAGIC.begin(), protocol::HANDSHAKE_MAGIC.end(), payload.begin())) {
    return reject("bad magic");
  }
  size_t offset = protocol::HANDSHAKE_MAGIC.size();
  if (payload[offset] != protocol::HANDSHAKE_VERSION) {
    return reject("unsupported handshake version");
  }
  ++offset;

  HelloMessage hello;
  std::memcpy(hello.public_key.data(), payload.data() + offset, hello.public_key.size());
  offset += hello.public_key.size();
  std::memcpy(hello.nonce.data(), payload.data() + offset, hello.nonce.size());
  return hello;
}

std::vector<uint8_t> BuildProofTranscript(const HandshakeNonce& peer_nonce, const crypto::PublicKey& signer_key,
                                          const crypto::PublicKey& peer_key) {
  const size_t context_len = sizeof(protocol::HANDSHAKE_CONTEXT) - 1;
  std::vector<uint8_t> transcript;
  transcript.reserve(context_len + peer_nonce.size() + signer_key.size() + peer_key.size());
  transcript.insert(transcript.end(), protocol::HANDSHAKE_CONTEXT, protocol::HANDSHAKE_CONTEXT + context_len);
  transcript.insert(transcript.end(), peer_nonce.begin(), peer_nonce.end());
  transcript.insert(transcript.end(), signer_key.begin(), signer_key.end());
  transcript.insert(transcript.end(), peer_key.begin(), peer_key.end());
  return transcript;
}

namespace {

std::vector<uint8_t> MakeFrame(std::span<const uint8_t> payload) {
  auto header = protocol::EncodeFrameHeader(static_cast<uint32_t>(payload.size()));
  std::vector<uint8_t> frame;
  frame.reserve(header.size() + payload.size());
  frame.insert(frame.end(), header.begin(), header.end());
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

}  // namespace

// ============================================================================
// HandshakeSession
// ============================================================================

std::shared_ptr<HandshakeSession> HandshakeSession::Create(RawSocket socket, Direction direction,
                                                           const crypto::KeyPair& local_keypair,
                                                           std::chrono::steady_clock::time_point deadline) {
  return std::shared_ptr<HandshakeSession>(
      new HandshakeSession(std::move(socket), direction, local_keypair, deadline));
}

HandshakeSession::HandshakeSession(RawSocket socket, Direction direction, const crypto::KeyPair& local_keypair,
                                   std::chrono::steady_clock::time_point deadline)
    : socket_(std::move(socket)),
      strand_(asio::make_strand(socket_.get_executor())),
      timer_(strand_),
      direction_(direction),
      local_keypair_(local_keypair),
      deadline_(deadline) {
  asio::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  if (!ec) {
    remote_address_ = NetworkAddress{CanonicalHost(endpoint.address()), endpoint.port()};
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }
}

void HandshakeSession::Start(CompletionHandler handler) {
  asio::dispatch(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
    self->handler_ = std::move(handler);
    self->state_ = ConnectionState::HANDSHAKING;

    if (self->deadline_ <= std::chrono::steady_clock::now()) {
      self->Fail(IsOutbound(self->direction_)
                     ? Status::Error(NetResult::DialTimedOut, "no time left for handshake")
                     : Status::Error(NetResult::HandshakeFailed, "handshake timed out"));
      return;
    }

    self->timer_.expires_at(self->deadline_);
    self->timer_.async_wait([self](const asio::error_code& ec) {
      if (ec == asio::error::operation_aborted || self->done_) {
        return;
      }
      LOG_NET_DEBUG("handshake with {} timed out", self->remote_address_.ToString());
      self->Fail(IsOutbound(self->direction_)
                     ? Status::Error(NetResult::DialTimedOut, "handshake timed out")
                     : Status::Error(NetResult::HandshakeFailed, "handshake timed out"));
    });

    if (RAND_bytes(self->local_nonce_.data(), static_cast<int>(self->local_nonce_.size())) != 1) {
      self->Fail(Status::Error(NetResult::HandshakeFailed, "failed to generate nonce"));
      return;
    }
    self->SendHello();
  });
}

void HandshakeSession::SendHello() {
  HelloMessage hello;
  hello.public_key = local_keypair_.public_key();
  hello.nonce = local_nonce_;
  write_buffer_ = MakeFrame(EncodeHello(hello));

  asio::async_write(socket_, asio::buffer(write_buffer_),
                    asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec, size_t) {
                      if (self->done_)
                        return;
                      if (ec) {
                        self->Fail(Status::Error(NetResult::Io, "hello write: " + ec.message()));
                        return;
                      }
                      self->ReadFrame(protocol::HELLO_SIZE, [self]() { self->OnHello(); });
                    }));
}

void HandshakeSession::ReadFrame(size_t expected_size, std::function<void()> on_payload) {
  asio::async_read(
      socket_, asio::buffer(header_buffer_),
      asio::bind_executor(strand_, [self = shared_from_this(), expected_size, on_payload = std::move(on_payload)](
                                       const asio::error_code& ec, size_t) mutable {
        if (self->done_)
          return;
        if (ec) {
          self->Fail(Status::Error(NetResult::Io, "handshake read: " + ec.message()));
          return;
        }
        uint32_t size = protocol::DecodeFrameHeader(self->header_buffer_);
        if (size != expected_size) {
          self->Fail(Status::Error(NetResult::HandshakeFailed,
                                   "unexpected handshake frame size " + std::to_string(size)));
          return;
        }
        self->payload_buffer_.resize(size);
        asio::async_read(self->socket_, asio::buffer(self->payload_buffer_),
                         asio::bind_executor(self->strand_, [self, on_payload = std::move(on_payload)](
                                                                const asio::error_code& ec, size_t) {
                           if (self->done_)
                             return;
                           if (ec) {
                             self->Fail(Status::Error(NetResult::Io, "handshake read: " + ec.message()));
                             return;
                           }
                           on_payload();
                         }));
      }));
}

void HandshakeSession::OnHello() {
  std::string error;
  remote_hello_ = DecodeHello(payload_buffer_, &error);
  if (!remote_hello_) {
    Fail(Status::Error(NetResult::HandshakeFailed, error));
    return;
  }

  remote_identity_ = PeerIdentity::FromPublicKey(remote_hello_->public_key);
  if (!remote_identity_) {
    Fail(Status::Error(NetResult::HandshakeFailed, "invalid remote public key"));
    return;
  }
  if (remote_hello_->public_key == local_keypair_.public_key()) {
    Fail(Status::Error(NetResult::HandshakeFailed, "connected to self"));
    return;
  }

  crypto::Signature proof;
  try {
    proof = local_keypair_.Sign(
        BuildProofTranscript(remote_hello_->nonce, local_keypair_.public_key(), remote_hello_->public_key));
  } catch (const std::exception& e) {
    Fail(Status::Error(NetResult::HandshakeFailed, std::string("signing failed: ") + e.what()));
    return;
  }
  write_buffer_ = MakeFrame(proof);

  asio::async_write(socket_, asio::buffer(write_buffer_),
                    asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec, size_t) {
                      if (self->done_)
                        return;
                      if (ec) {
                        self->Fail(Status::Error(NetResult::Io, "proof write: " + ec.message()));
                        return;
                      }
                      self->ReadFrame(protocol::PROOF_SIZE, [self]() { self->OnProof(); });
                    }));
}

void HandshakeSession::OnProof() {
  crypto::Signature signature;
  std::copy(payload_buffer_.begin(), payload_buffer_.end(), signature.begin());

  auto transcript = BuildProofTranscript(local_nonce_, remote_hello_->public_key, local_keypair_.public_key());
  if (!crypto::KeyPair::Verify(remote_hello_->public_key, transcript, signature)) {
    Fail(Status::Error(NetResult::HandshakeFailed, "bad identity proof"));
    return;
  }
  Succeed();
}

void HandshakeSession::Fail(Status status) {
  if (done_)
    return;
  done_ = true;
  state_ = ConnectionState::CLOSED;
  timer_.cancel();

  LOG_NET_DEBUG("{} handshake with {} failed: {}", DirectionAsString(direction_), remote_address_.ToString(),
                status.ToString());

  asio::error_code ec;
  socket_.close(ec);
  if (ec) {
    LOG_NET_TRACE("close after failed handshake: {}", ec.message());
  }

  auto handler = std::move(handler_);
  handler_ = nullptr;
  if (handler)
    handler(std::move(status), std::nullopt);
}

void HandshakeSession::Succeed() {
  done_ = true;
  timer_.cancel();

  LOG_NET_DEBUG("{} handshake with {} at {} complete", DirectionAsString(direction_), remote_identity_->ShortString(),
                remote_address_.ToString());

  auto handler = std::move(handler_);
  handler_ = nullptr;
  if (handler) {
    handler(Status::Ok(), HandshakeResult{std::move(socket_), *remote_identity_, remote_address_, direction_});
  }
}

}  // namespace network
}  // namespace peernet
