// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/connection.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

namespace peernet {
namespace network {

std::atomic<ConnectionId> Connection::next_id_{1};

ConnectionPtr Connection::Create(asio::io_context& io_context, HandshakeResult&& handshake, TransportKind kind,
                                 const Options& options, std::shared_ptr<TrafficCounters> totals,
                                 ClosedHandler on_closed) {
  return ConnectionPtr(
      new Connection(io_context, std::move(handshake), kind, options, std::move(totals), std::move(on_closed)));
}

Connection::Connection(asio::io_context& io_context, HandshakeResult&& handshake, TransportKind kind,
                       const Options& options, std::shared_ptr<TrafficCounters> totals, ClosedHandler on_closed)
    : io_context_(io_context),
      socket_(std::move(handshake.socket)),
      strand_(asio::make_strand(socket_.get_executor())),
      read_timer_(strand_),
      write_timer_(strand_),
      read_pause_timer_(strand_),
      write_pause_timer_(strand_),
      id_(next_id_.fetch_add(1, std::memory_order_relaxed)),
      kind_(kind),
      direction_(handshake.direction),
      remote_identity_(handshake.remote_identity),
      remote_address_(handshake.remote_address),
      options_(options),
      established_at_(util::GetSteadyTime()),
      totals_(std::move(totals)),
      on_closed_(std::move(on_closed)),
      read_limiter_(options.rate_limit, options.rate_time_window, options.rate_bucket_size),
      write_limiter_(options.rate_limit, options.rate_time_window, options.rate_bucket_size) {}

Connection::~Connection() = default;

ConnectionSummary Connection::summary() const {
  return ConnectionSummary{id_,
                           kind_,
                           direction_,
                           remote_identity_,
                           remote_address_,
                           state(),
                           bytes_sent(),
                           bytes_received(),
                           established_at_};
}

void Connection::Start(FrameHandler handler) {
  asio::dispatch(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
    if (self->started_ || !self->is_established())
      return;
    self->started_ = true;
    self->frame_handler_ = std::move(handler);
    self->read_header_impl();
  });
}

void Connection::read_header_impl() {
  asio::async_read(
      socket_, asio::buffer(header_buffer_),
      asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec, size_t) {
        if (!self->is_established())
          return;

        if (ec) {
          if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}: {}", self->remote_address_.ToString(), ec.message());
          }
          self->close_impl();
          return;
        }

        uint32_t size = protocol::DecodeFrameHeader(self->header_buffer_);
        if (size > self->options_.max_message_size) {
          LOG_NET_WARN_RL("frame of {} bytes from peer {} exceeds limit {}, disconnecting", size,
                          self->remote_identity_.ShortString(), self->options_.max_message_size);
          self->close_impl();
          return;
        }
        self->read_payload_impl(size);
      }));
}

void Connection::read_payload_impl(uint32_t size) {
  payload_buffer_.resize(size);
  arm_read_deadline_impl();
  asio::async_read(
      socket_, asio::buffer(payload_buffer_),
      asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec, size_t bytes) {
        ++self->read_generation_;
        self->read_timer_.cancel();
        if (!self->is_established())
          return;

        if (ec) {
          if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}: {}", self->remote_address_.ToString(), ec.message());
          }
          self->close_impl();
          return;
        }

        const uint64_t wire_bytes = protocol::FRAME_HEADER_SIZE + bytes;
        self->bytes_received_.fetch_add(wire_bytes, std::memory_order_relaxed);
        if (self->totals_)
          self->totals_->bytes_received.fetch_add(wire_bytes, std::memory_order_relaxed);

        // Copy: the handler may close the connection, which clears frame_handler_
        FrameHandler handler = self->frame_handler_;
        if (handler) {
          std::vector<uint8_t> payload;
          payload.swap(self->payload_buffer_);
          try {
            handler(self->id_, self->remote_identity_, std::move(payload));
          } catch (const std::exception& e) {
            LOG_NET_ERROR("exception in message handler for connection {}: {}", self->id_, e.what());
          }
        }

        // The handler may have closed the connection
        if (!self->is_established())
          return;
        self->read_next_impl(wire_bytes);
      }));
}

void Connection::read_next_impl(uint64_t wire_bytes) {
  const auto pause = read_limiter_.Consume(wire_bytes);
  if (pause.count() == 0) {
    read_header_impl();
    return;
  }
  LOG_NET_TRACE("connection {} over receive budget, pausing reads for {} ms", id_, pause.count());
  read_pause_timer_.expires_after(pause);
  read_pause_timer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
    if (ec || !self->is_established())
      return;
    self->read_header_impl();
  });
}

void Connection::arm_read_deadline_impl() {
  if (options_.read_timeout.count() <= 0)
    return;
  const uint64_t generation = read_generation_;
  read_timer_.expires_after(options_.read_timeout);
  read_timer_.async_wait([self = shared_from_this(), generation](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || generation != self->read_generation_ || !self->is_established())
      return;
    LOG_NET_WARN_RL("frame from peer {} not completed within {} ms, disconnecting", self->remote_identity_.ShortString(),
                    self->options_.read_timeout.count());
    self->close_impl();
  });
}

bool Connection::Send(std::vector<uint8_t> payload) {
  if (!is_established())
    return false;
  if (payload.size() > options_.max_message_size) {
    LOG_NET_DEBUG("refusing to send {} byte frame to {} (limit {})", payload.size(), remote_identity_.ShortString(),
                  options_.max_message_size);
    return false;
  }

  auto header = protocol::EncodeFrameHeader(static_cast<uint32_t>(payload.size()));
  auto frame = std::make_shared<std::vector<uint8_t>>();
  frame->reserve(header.size() + payload.size());
  frame->insert(frame->end(), header.begin(), header.end());
  frame->insert(frame->end(), payload.begin(), payload.end());

  asio::dispatch(strand_, [self = shared_from_this(), frame]() {
    if (!self->is_established())
      return;

    if (self->send_queue_bytes_ + frame->size() > self->options_.send_queue_limit) {
      LOG_NET_WARN_RL("send queue overflow (current: {} bytes, incoming: {} bytes, limit: {} bytes), disconnecting "
                      "slow-reading peer {}",
                      self->send_queue_bytes_, frame->size(), self->options_.send_queue_limit,
                      self->remote_identity_.ShortString());
      self->close_impl();
      return;
    }

    self->send_queue_.push(frame);
    self->send_queue_bytes_ += frame->size();

    if (!self->writing_) {
      self->writing_ = true;
      self->do_write_impl();
    }
  });
  return true;
}

void Connection::do_write_impl() {
  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto frame = send_queue_.front();
  arm_write_deadline_impl();
  asio::async_write(socket_, asio::buffer(*frame),
                    asio::bind_executor(strand_, [self = shared_from_this(), frame](const asio::error_code& ec, size_t) {
                      ++self->write_generation_;
                      self->write_timer_.cancel();
                      if (!self->is_established())
                        return;

                      if (ec) {
                        LOG_NET_TRACE("write error to {}: {}", self->remote_address_.ToString(), ec.message());
                        self->close_impl();
                        return;
                      }

                      self->bytes_sent_.fetch_add(frame->size(), std::memory_order_relaxed);
                      if (self->totals_)
                        self->totals_->bytes_sent.fetch_add(frame->size(), std::memory_order_relaxed);

                      self->send_queue_.pop();
                      self->send_queue_bytes_ -= frame->size();
                      self->write_next_impl(frame->size());
                    }));
}

void Connection::write_next_impl(uint64_t wire_bytes) {
  const auto pause = write_limiter_.Consume(wire_bytes);
  if (pause.count() == 0) {
    do_write_impl();
    return;
  }
  // writing_ stays set, so Send() only queues while the pause runs
  write_pause_timer_.expires_after(pause);
  write_pause_timer_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
    if (ec || !self->is_established())
      return;
    self->do_write_impl();
  });
}

void Connection::arm_write_deadline_impl() {
  if (options_.write_timeout.count() <= 0)
    return;
  const uint64_t generation = write_generation_;
  write_timer_.expires_after(options_.write_timeout);
  write_timer_.async_wait([self = shared_from_this(), generation](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || generation != self->write_generation_ || !self->is_established())
      return;
    LOG_NET_WARN_RL("write of {} queued bytes to peer {} stalled for {} ms, disconnecting", self->send_queue_bytes_,
                    self->remote_identity_.ShortString(), self->options_.write_timeout.count());
    self->close_impl();
  });
}

void Connection::Close() {
  asio::dispatch(strand_, [self = shared_from_this()]() { self->close_impl(); });
}

void Connection::CloseAndWait() {
  if (strand_.running_in_this_thread()) {
    close_impl();
    return;
  }
  if (io_context_.get_executor().running_in_this_thread()) {
    // Blocking here could starve the reactor; teardown completes shortly.
    Close();
    return;
  }

  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  asio::post(strand_, [self = shared_from_this(), done]() {
    self->close_impl();
    done->set_value();
  });

  if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
    LOG_NET_WARN("timed out waiting for connection {} to close (io_context not running?)", id_);
  }
}

void Connection::close_impl() {
  ConnectionState expected = ConnectionState::ESTABLISHED;
  if (!state_.compare_exchange_strong(expected, ConnectionState::CLOSING, std::memory_order_acq_rel)) {
    return;  // Already closing or closed
  }

  LOG_NET_DEBUG("closing {} connection {} to peer {} ({})", DirectionAsString(direction_), id_,
                remote_identity_.ShortString(), remote_address_.ToString());

  // Move the socket out so pending reads/writes complete with operation_aborted
  {
    RawSocket socket_to_close(std::move(socket_));
    asio::error_code ec;
    socket_to_close.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_to_close.close(ec);
    if (ec) {
      LOG_NET_TRACE("error closing socket of connection {}: {}", id_, ec.message());
    }
  }

  read_timer_.cancel();
  write_timer_.cancel();
  read_pause_timer_.cancel();
  write_pause_timer_.cancel();

  std::queue<std::shared_ptr<std::vector<uint8_t>>> queue_to_destroy;
  std::swap(send_queue_, queue_to_destroy);
  send_queue_bytes_ = 0;
  writing_ = false;
  frame_handler_ = nullptr;

  state_.store(ConnectionState::CLOSED, std::memory_order_release);

  auto on_closed = std::move(on_closed_);
  on_closed_ = nullptr;
  if (on_closed)
    on_closed(id_);
}

}  // namespace network
}  // namespace peernet
