// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/connection_registry.hpp"

#include "util/logging.hpp"

#include <stdexcept>

namespace peernet {
namespace network {

namespace {

size_t CountOf(const std::map<std::string, size_t>& counts, const std::string& key) {
  auto it = counts.find(key);
  return it == counts.end() ? 0 : it->second;
}

void Decrement(std::map<std::string, size_t>& counts, const std::string& key, const char* what) {
  auto it = counts.find(key);
  if (it == counts.end() || it->second == 0) {
    LOG_NET_ERROR("{} accounting underflow for '{}'", what, key);
    return;
  }
  if (--it->second == 0)
    counts.erase(it);
}

std::string CategoryLabel(const std::string& category) {
  return category.empty() ? "default" : category;
}

}  // namespace

// ============================================================================
// ReservationToken
// ============================================================================

ReservationToken::ReservationToken(std::shared_ptr<ConnectionRegistry> registry, Slot slot)
    : registry_(std::move(registry)), slot_(std::move(slot)) {}

ReservationToken::ReservationToken(ReservationToken&& other) noexcept
    : registry_(std::move(other.registry_)), slot_(std::move(other.slot_)) {}

ReservationToken& ReservationToken::operator=(ReservationToken&& other) noexcept {
  if (this != &other) {
    if (registry_)
      registry_->release_reservation(slot_);
    registry_ = std::move(other.registry_);
    slot_ = std::move(other.slot_);
  }
  return *this;
}

ReservationToken::~ReservationToken() {
  if (registry_)
    registry_->release_reservation(slot_);
}

std::shared_ptr<ConnectionRegistry> ReservationToken::release_ownership() {
  return std::move(registry_);
}

// ============================================================================
// ConnectionRegistry
// ============================================================================

std::shared_ptr<ConnectionRegistry> ConnectionRegistry::Create(size_t max_inbound, size_t max_outbound,
                                                               PeerCategoryTable categories) {
  return std::shared_ptr<ConnectionRegistry>(
      new ConnectionRegistry(max_inbound, max_outbound, std::move(categories)));
}

ConnectionRegistry::ConnectionRegistry(size_t max_inbound, size_t max_outbound, PeerCategoryTable categories)
    : max_inbound_(max_inbound), max_outbound_(max_outbound), categories_(std::move(categories)) {}

std::optional<ReservationToken> ConnectionRegistry::TryReserve(Direction direction, const std::string& host,
                                                               Status* refusal) {
  auto refuse = [refusal](Status status) -> std::optional<ReservationToken> {
    if (refusal)
      *refusal = std::move(status);
    return std::nullopt;
  };

  std::lock_guard<std::mutex> lock(mutex_);
  if (shutting_down_)
    return refuse(Status::Error(NetResult::ShuttingDown, "registry is shutting down"));

  Slot slot{direction, host, categories_.CategoryOf(host)};
  const PeerNetCategoryInfo& limits = categories_.LimitsOf(slot.category);

  if (IsOutbound(direction)) {
    if (current_outbound_ >= max_outbound_)
      return refuse(Status::LimitReached(direction));
    if (CountOf(outbound_per_category_, slot.category) >= limits.max_out_connections)
      return refuse(Status::LimitReached(direction, "outbound limit of category " + CategoryLabel(slot.category)));
  } else {
    if (current_inbound_ >= max_inbound_)
      return refuse(Status::LimitReached(direction));
    if (CountOf(inbound_per_category_, slot.category) >= limits.max_in_connections)
      return refuse(Status::LimitReached(direction, "inbound limit of category " + CategoryLabel(slot.category)));
    if (!host.empty() && CountOf(inbound_per_host_, host) >= limits.max_in_connections_per_ip)
      return refuse(Status::LimitReached(direction, "inbound limit per ip reached for " + host));
  }

  take_slot_locked(slot);
  return ReservationToken(shared_from_this(), std::move(slot));
}

ConnectionId ConnectionRegistry::Register(ReservationToken token, ConnectionPtr conn) {
  if (!token.valid() || token.registry_.get() != this) {
    throw std::invalid_argument("Register: token does not hold a slot of this registry");
  }
  if (!conn || conn->direction() != token.direction()) {
    throw std::invalid_argument("Register: connection direction does not match reservation");
  }

  // The slot already counted by the reservation now belongs to the entry
  auto keep_alive = token.release_ownership();
  std::lock_guard<std::mutex> lock(mutex_);
  const ConnectionId id = conn->id();
  connections_.emplace(id, Entry{std::move(conn), std::move(token.slot_)});
  return id;
}

RegisterOutcome ConnectionRegistry::RegisterUnique(ReservationToken token, ConnectionPtr conn,
                                                   const PeerIdentity& local_identity) {
  if (!token.valid() || token.registry_.get() != this) {
    throw std::invalid_argument("RegisterUnique: token does not hold a slot of this registry");
  }
  if (!conn || conn->direction() != token.direction()) {
    throw std::invalid_argument("RegisterUnique: connection direction does not match reservation");
  }

  RegisterOutcome outcome;
  // Declared before the lock so the registry reference drops after unlocking
  auto keep_alive = token.release_ownership();
  Slot slot = std::move(token.slot_);

  std::lock_guard<std::mutex> lock(mutex_);

  if (shutting_down_) {
    release_slot_locked(slot);
    outcome.status = Status::Error(NetResult::ShuttingDown, "registry is shutting down");
    return outcome;
  }

  for (const auto& [existing_id, existing] : connections_) {
    const ConnectionPtr& other = existing.conn;
    if (other->remote_identity() != conn->remote_identity() || !other->is_established())
      continue;

    bool keep_new = false;
    if (other->direction() != conn->direction()) {
      const Direction winner = local_identity < conn->remote_identity() ? Direction::OUTBOUND : Direction::INBOUND;
      keep_new = conn->direction() == winner;
    }

    if (!keep_new) {
      LOG_NET_DEBUG("refusing duplicate {} connection to peer {} (keeping {} connection {})",
                    DirectionAsString(conn->direction()), conn->remote_identity().ShortString(),
                    DirectionAsString(other->direction()), existing_id);
      release_slot_locked(slot);
      outcome.status = Status::Error(NetResult::DuplicateConnection,
                                     "already connected to " + conn->remote_identity().ShortString());
      return outcome;
    }

    // Existing entry keeps its slot until its close path calls Release()
    outcome.displaced = other;
    break;
  }

  outcome.id = conn->id();
  connections_.emplace(outcome.id, Entry{std::move(conn), std::move(slot)});
  outcome.status = Status::Ok();
  return outcome;
}

void ConnectionRegistry::Release(ConnectionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id);
  if (it == connections_.end())
    return;
  const Slot slot = std::move(it->second.slot);
  connections_.erase(it);
  release_slot_locked(slot);
}

void ConnectionRegistry::AbortReservation(ReservationToken token) {
  if (!token.valid() || token.registry_.get() != this) {
    throw std::invalid_argument("AbortReservation: token does not hold a slot of this registry");
  }
  auto keep_alive = token.release_ownership();
  std::lock_guard<std::mutex> lock(mutex_);
  release_slot_locked(token.slot_);
}

void ConnectionRegistry::release_reservation(const Slot& slot) {
  std::lock_guard<std::mutex> lock(mutex_);
  release_slot_locked(slot);
}

void ConnectionRegistry::take_slot_locked(const Slot& slot) {
  if (IsOutbound(slot.direction)) {
    ++current_outbound_;
    ++outbound_per_category_[slot.category];
    return;
  }
  ++current_inbound_;
  ++inbound_per_category_[slot.category];
  if (!slot.host.empty())
    ++inbound_per_host_[slot.host];
}

void ConnectionRegistry::release_slot_locked(const Slot& slot) {
  size_t& counter = IsOutbound(slot.direction) ? current_outbound_ : current_inbound_;
  if (counter == 0) {
    LOG_NET_ERROR("slot accounting underflow for {} direction", DirectionAsString(slot.direction));
    return;
  }
  --counter;

  if (IsOutbound(slot.direction)) {
    Decrement(outbound_per_category_, slot.category, "outbound category");
    return;
  }
  Decrement(inbound_per_category_, slot.category, "inbound category");
  if (!slot.host.empty())
    Decrement(inbound_per_host_, slot.host, "inbound host");
}

void ConnectionRegistry::Shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  shutting_down_ = true;
}

bool ConnectionRegistry::is_shutting_down() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutting_down_;
}

ConnectionPtr ConnectionRegistry::Get(ConnectionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id);
  return it == connections_.end() ? nullptr : it->second.conn;
}

std::vector<ConnectionPtr> ConnectionRegistry::GetAll() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConnectionPtr> result;
  result.reserve(connections_.size());
  for (const auto& [id, entry] : connections_)
    result.push_back(entry.conn);
  return result;
}

std::vector<ConnectionSummary> ConnectionRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConnectionSummary> result;
  result.reserve(connections_.size());
  for (const auto& [id, entry] : connections_)
    result.push_back(entry.conn->summary());
  return result;
}

bool ConnectionRegistry::HasInboundFromHost(const std::string& host) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, entry] : connections_) {
    if (!IsOutbound(entry.slot.direction) && entry.slot.host == host)
      return true;
  }
  return false;
}

size_t ConnectionRegistry::inbound_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_inbound_;
}

size_t ConnectionRegistry::outbound_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_outbound_;
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

size_t ConnectionRegistry::inbound_count_from_host(const std::string& host) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CountOf(inbound_per_host_, host);
}

size_t ConnectionRegistry::inbound_count_in_category(const std::string& category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CountOf(inbound_per_category_, category);
}

size_t ConnectionRegistry::outbound_count_in_category(const std::string& category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CountOf(outbound_per_category_, category);
}

}  // namespace network
}  // namespace peernet
