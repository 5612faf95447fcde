// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/tcp_transport.hpp"

#include "util/logging.hpp"

namespace peernet {
namespace network {

namespace {

bool IsWildcardHost(const std::string& host) {
  return host.empty() || host == "::";
}

// One outbound dial attempt. Lives until both the timer and the connect
// chain have completed; all handlers run on strand_.
class TcpDialer : public std::enable_shared_from_this<TcpDialer> {
public:
  TcpDialer(asio::io_context& io_context, NetworkAddress address, TcpConnectionConfig config,
            ConnectHandler handler)
      : io_context_(io_context),
        strand_(asio::make_strand(io_context)),
        socket_(io_context),
        resolver_(strand_),
        timer_(strand_),
        address_(std::move(address)),
        config_(config),
        handler_(std::move(handler)) {}

  void Start(std::chrono::steady_clock::time_point deadline) {
    asio::dispatch(strand_, [self = shared_from_this(), deadline]() { self->DoStart(deadline); });
  }

private:
  void DoStart(std::chrono::steady_clock::time_point deadline) {
    if (deadline <= std::chrono::steady_clock::now()) {
      Finish(Status::Error(NetResult::DialTimedOut, "deadline already passed"));
      return;
    }

    timer_.expires_at(deadline);
    timer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
      if (ec == asio::error::operation_aborted || self->done_) {
        return;
      }
      LOG_NET_DEBUG("connect timeout to {}", self->address_.ToString());
      self->resolver_.cancel();
      asio::error_code close_ec;
      self->socket_.close(close_ec);
      if (close_ec) {
        LOG_NET_TRACE("close after connect timeout failed: {}", close_ec.message());
      }
      self->Finish(Status::Error(NetResult::DialTimedOut, "connect to " + self->address_.ToString() + " timed out"));
    });

    resolver_.async_resolve(
        address_.host, std::to_string(address_.port),
        [self = shared_from_this()](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
          self->OnResolved(ec, std::move(results));
        });
  }

  void OnResolved(const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
    if (done_) {
      return;
    }
    if (ec) {
      LOG_NET_TRACE("failed to resolve {}: {}", address_.host, ec.message());
      Finish(Status::Error(NetResult::DialFailed, "resolve " + address_.host + ": " + ec.message()));
      return;
    }
    asio::async_connect(socket_, results,
                        asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec,
                                                                                 const asio::ip::tcp::endpoint&) {
                          self->OnConnected(ec);
                        }));
  }

  void OnConnected(const asio::error_code& ec) {
    if (done_) {
      return;
    }
    if (ec) {
      LOG_NET_TRACE("failed to connect to {}: {}", address_.ToString(), ec.message());
      Finish(Status::Error(NetResult::DialFailed, address_.ToString() + ": " + ec.message()));
      return;
    }
    ApplySocketOptions(socket_, config_);
    Finish(Status::Ok());
  }

  void Finish(Status status) {
    done_ = true;
    timer_.cancel();
    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (!handler) {
      return;
    }
    if (status.ok()) {
      handler(std::move(status), std::move(socket_));
    } else {
      asio::error_code close_ec;
      socket_.close(close_ec);
      handler(std::move(status), RawSocket(io_context_));
    }
  }

  asio::io_context& io_context_;
  asio::strand<asio::io_context::executor_type> strand_;
  RawSocket socket_;
  asio::ip::tcp::resolver resolver_;
  asio::steady_timer timer_;
  NetworkAddress address_;
  TcpConnectionConfig config_;
  ConnectHandler handler_;
  bool done_{false};
};

}  // namespace

void ApplySocketOptions(RawSocket& socket, const TcpConnectionConfig& config) {
  asio::error_code ec;
  socket.set_option(asio::ip::tcp::no_delay(config.no_delay), ec);
  if (ec) {
    LOG_NET_TRACE("failed to set TCP_NODELAY: {}", ec.message());
  }
  socket.set_option(asio::socket_base::keep_alive(config.keep_alive), ec);
  if (ec) {
    LOG_NET_TRACE("failed to set SO_KEEPALIVE: {}", ec.message());
  }
}

// ============================================================================
// TcpAcceptor
// ============================================================================

TcpAcceptor::TcpAcceptor(asio::io_context& acceptor_context, asio::io_context& socket_context)
    : acceptor_(acceptor_context), socket_context_(socket_context) {}

TcpAcceptor::~TcpAcceptor() {
  Close();
}

Status TcpAcceptor::Open(const NetworkAddress& address) {
  using tcp = asio::ip::tcp;
  asio::error_code ec;

  if (IsWildcardHost(address.host)) {
    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
    acceptor_.open(tcp::v6(), ec);
    if (!ec)
      acceptor_.set_option(asio::ip::v6_only(false), ec);
    if (!ec)
      acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec)
      acceptor_.bind(tcp::endpoint(tcp::v6(), address.port), ec);
    if (ec) {
      LOG_NET_DEBUG("dual-stack bind on port {} failed ({}), trying IPv4", address.port, ec.message());
      asio::error_code close_ec;
      acceptor_.close(close_ec);
      ec.clear();
      acceptor_.open(tcp::v4(), ec);
      if (!ec)
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
      if (!ec)
        acceptor_.bind(tcp::endpoint(tcp::v4(), address.port), ec);
    }
  } else {
    auto ip = asio::ip::make_address(address.host, ec);
    if (ec) {
      return Status::Error(NetResult::BindFailed, "invalid bind address '" + address.host + "'");
    }
    tcp::endpoint endpoint(ip, address.port);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec)
      acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec)
      acceptor_.bind(endpoint, ec);
  }

  if (!ec)
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);

  if (ec) {
    asio::error_code close_ec;
    acceptor_.close(close_ec);
    return Status::Error(NetResult::BindFailed, address.ToString() + ": " + ec.message());
  }
  return Status::Ok();
}

void TcpAcceptor::AsyncAccept(AcceptHandler handler) {
  auto socket = std::make_shared<RawSocket>(socket_context_);
  acceptor_.async_accept(*socket, [socket, handler = std::move(handler)](const asio::error_code& ec) {
    if (!ec) {
      ApplySocketOptions(*socket, TcpConnectionConfig{});
    }
    handler(ec, std::move(*socket));
  });
}

void TcpAcceptor::Close() {
  if (!acceptor_.is_open()) {
    return;
  }
  asio::error_code ec;
  acceptor_.close(ec);
  if (ec) {
    LOG_NET_WARN("error closing acceptor: {}", ec.message());
  }
}

bool TcpAcceptor::is_open() const {
  return acceptor_.is_open();
}

NetworkAddress TcpAcceptor::local_address() const {
  asio::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  if (ec) {
    return NetworkAddress{};
  }
  return NetworkAddress{endpoint.address().to_string(), endpoint.port()};
}

// ============================================================================
// TcpTransport
// ============================================================================

TcpTransport::TcpTransport(asio::io_context& io_context) : io_context_(io_context) {}

std::unique_ptr<Acceptor> TcpTransport::Bind(asio::io_context& acceptor_context, const NetworkAddress& address,
                                             Status& status) {
  auto acceptor = std::make_unique<TcpAcceptor>(acceptor_context, io_context_);
  status = acceptor->Open(address);
  if (!status.ok()) {
    LOG_NET_ERROR("failed to listen on {}: {}", address.ToString(), status.detail);
    return nullptr;
  }
  LOG_NET_INFO("listening on {}", acceptor->local_address().ToString());
  return acceptor;
}

void TcpTransport::AsyncConnect(const NetworkAddress& address, const OutConnectionConfig& out_config,
                                std::chrono::steady_clock::time_point deadline, ConnectHandler handler) {
  const auto* tcp_config = std::get_if<TcpConnectionConfig>(&out_config);
  if (tcp_config == nullptr) {
    asio::post(io_context_, [this, handler = std::move(handler)]() {
      handler(Status::Error(NetResult::WrongConfigType, "expected TCP connection config"), RawSocket(io_context_));
    });
    return;
  }
  auto dialer = std::make_shared<TcpDialer>(io_context_, address, *tcp_config, std::move(handler));
  dialer->Start(deadline);
}

}  // namespace network
}  // namespace peernet
