// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/transport.hpp"

#include "network/tcp_transport.hpp"

#include <stdexcept>

namespace peernet {
namespace network {

std::string TransportKindAsString(TransportKind kind) {
  switch (kind) {
  case TransportKind::TCP:
    return "tcp";
  default:
    return "unknown";
  }
}

std::string NetworkAddress::ToString() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

std::string CanonicalHost(const asio::ip::address& address) {
  if (address.is_v6()) {
    const auto v6 = address.to_v6();
    if (v6.is_v4_mapped()) {
      return asio::ip::make_address_v4(asio::ip::v4_mapped, v6).to_string();
    }
  }
  return address.to_string();
}

std::string CanonicalHost(const std::string& host) {
  asio::error_code ec;
  auto address = asio::ip::make_address(host, ec);
  if (ec) {
    return host;
  }
  return CanonicalHost(address);
}

TransportKind TransportKindOf(const OutConnectionConfig& config) {
  struct Visitor {
    TransportKind operator()(const TcpConnectionConfig&) const { return TransportKind::TCP; }
  };
  return std::visit(Visitor{}, config);
}

std::unique_ptr<Transport> CreateTransport(TransportKind kind, asio::io_context& io_context) {
  switch (kind) {
  case TransportKind::TCP:
    return std::make_unique<TcpTransport>(io_context);
  }
  throw std::invalid_argument("unsupported transport kind");
}

}  // namespace network
}  // namespace peernet
