// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 TcpTransport - asio TCP implementation of Transport

 Bind():
 - Host must be an IP literal. "" and "::" bind dual-stack (v6 with
   v6_only=false), falling back to IPv4 any-address when v6 is unavailable.
 - reuse_address is set so a stopped listener's port can be rebound at once.

 AsyncConnect():
 - Resolves host, then async_connect over all results, all on one strand.
 - A steady_timer armed at the deadline cancels resolve/connect and reports
   DialTimedOut. Whichever of timer/connect completes first wins; the other
   completion is ignored.
*/

#include "network/transport.hpp"

#include <memory>

#include <asio.hpp>

namespace peernet {
namespace network {

class TcpAcceptor : public Acceptor {
public:
  TcpAcceptor(asio::io_context& acceptor_context, asio::io_context& socket_context);
  ~TcpAcceptor() override;

  // Open, bind and listen. Returns BindFailed status on any error.
  Status Open(const NetworkAddress& address);

  void AsyncAccept(AcceptHandler handler) override;
  void Close() override;
  bool is_open() const override;
  NetworkAddress local_address() const override;

private:
  asio::ip::tcp::acceptor acceptor_;
  asio::io_context& socket_context_;
};

class TcpTransport : public Transport {
public:
  explicit TcpTransport(asio::io_context& io_context);

  TransportKind kind() const override { return TransportKind::TCP; }

  std::unique_ptr<Acceptor> Bind(asio::io_context& acceptor_context, const NetworkAddress& address,
                                 Status& status) override;

  void AsyncConnect(const NetworkAddress& address, const OutConnectionConfig& out_config,
                    std::chrono::steady_clock::time_point deadline, ConnectHandler handler) override;

private:
  asio::io_context& io_context_;
};

// Apply socket options to an established socket (best-effort, logged)
void ApplySocketOptions(RawSocket& socket, const TcpConnectionConfig& config);

}  // namespace network
}  // namespace peernet
