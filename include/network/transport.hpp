// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/net_error.hpp"

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

#include <asio.hpp>

namespace peernet {
namespace network {

// Closed set of supported transports. Each kind has its own outbound
// configuration shape (see OutConnectionConfig) and its own Transport
// implementation selected by CreateTransport().
enum class TransportKind {
  TCP,
};

std::string TransportKindAsString(TransportKind kind);

// Bind or dial address. host must be an IP literal for Bind(); AsyncConnect()
// also resolves host names. Port 0 on Bind() requests an ephemeral port.
struct NetworkAddress {
  std::string host;
  uint16_t port{0};

  std::string ToString() const;

  auto operator<=>(const NetworkAddress&) const = default;
  bool operator==(const NetworkAddress&) const = default;
};

// Form used whenever hosts are compared or counted: IPv4-mapped IPv6
// addresses (::ffff:a.b.c.d) collapse to their IPv4 text, so a peer reached
// over a dual-stack socket matches the same peer reached over IPv4.
std::string CanonicalHost(const asio::ip::address& address);

// As above for a host string. Strings that are not IP literals (host names,
// "unknown") are returned unchanged.
std::string CanonicalHost(const std::string& host);

// Per-dial TCP options
struct TcpConnectionConfig {
  bool no_delay{true};
  bool keep_alive{true};
};

// Outbound configuration; the alternative held selects the transport kind
using OutConnectionConfig = std::variant<TcpConnectionConfig>;

TransportKind TransportKindOf(const OutConnectionConfig& config);

// Stream socket produced by accept() and connect(). Ownership moves from the
// transport to the handshake and then to the registered Connection.
using RawSocket = asio::ip::tcp::socket;

using AcceptHandler = std::function<void(const asio::error_code& ec, RawSocket socket)>;
using ConnectHandler = std::function<void(Status status, RawSocket socket)>;

// Acceptor - bound listening socket, driven by exactly one Listener thread.
// All methods must be called from the thread running the acceptor's context.
class Acceptor {
public:
  virtual ~Acceptor() = default;

  // Accept one inbound socket. The socket is created on the transport's
  // shared io_context, not on the acceptor's own context, so it outlives
  // the listener.
  virtual void AsyncAccept(AcceptHandler handler) = 0;

  // Close the listening socket; a pending accept completes with operation_aborted.
  virtual void Close() = 0;

  virtual bool is_open() const = 0;

  // Actual bound address (resolves port 0)
  virtual NetworkAddress local_address() const = 0;
};

// Transport - capability set of one transport kind
class Transport {
public:
  virtual ~Transport() = default;

  virtual TransportKind kind() const = 0;

  // Bind a listening socket whose accept loop runs on acceptor_context.
  // Returns nullptr and sets status to BindFailed on failure.
  virtual std::unique_ptr<Acceptor> Bind(asio::io_context& acceptor_context, const NetworkAddress& address,
                                         Status& status) = 0;

  // Dial address. handler is invoked exactly once: with Success and an
  // established socket, DialFailed on refusal/unreachable/resolve error,
  // DialTimedOut if deadline passes first, WrongConfigType if out_config
  // belongs to another kind.
  virtual void AsyncConnect(const NetworkAddress& address, const OutConnectionConfig& out_config,
                            std::chrono::steady_clock::time_point deadline, ConnectHandler handler) = 0;
};

// Create the implementation for kind. Sockets it produces live on io_context.
std::unique_ptr<Transport> CreateTransport(TransportKind kind, asio::io_context& io_context);

}  // namespace network
}  // namespace peernet
