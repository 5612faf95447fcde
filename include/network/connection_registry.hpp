// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ConnectionRegistry - authoritative set of established connections and
 slot accounting.

 Slots:
 - A slot is taken by TryReserve() and held by the returned ReservationToken
   while the attempt is in flight (dial, accept, handshake).
 - The token is consumed by Register()/RegisterUnique() or given back by
   AbortReservation(). A token destroyed unconsumed aborts itself, so a slot
   cannot leak on any failure path.
 - A registered connection holds its slot until Release(id).
 - inbound_count()/outbound_count() = outstanding reservations + registered
   connections of that direction, and never exceed the configured maxima.

 Each slot is also charged to the remote host's category (PeerCategoryTable)
 and, for inbound slots, to the host itself. TryReserve() refuses a slot
 that would exceed the global, category or per-host limit.

 Concurrency: one mutex guards the map and every counter; each check and
 update is atomic with respect to all other registry operations.
 Connections displaced by RegisterUnique() are returned to the caller and
 closed outside the lock.
*/

#include "network/connection.hpp"
#include "network/connection_types.hpp"
#include "network/net_error.hpp"
#include "network/peer_category.hpp"
#include "network/peer_identity.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peernet {
namespace network {

class ConnectionRegistry;

// What one reservation or registered connection is counted against
struct Slot {
  Direction direction{Direction::INBOUND};
  std::string host;      // Canonical remote host; empty if not known
  std::string category;  // "" for the default category
};

// ReservationToken - move-only proof of a reserved slot
class ReservationToken {
public:
  ReservationToken(ReservationToken&& other) noexcept;
  ReservationToken& operator=(ReservationToken&& other) noexcept;
  ReservationToken(const ReservationToken&) = delete;
  ReservationToken& operator=(const ReservationToken&) = delete;

  // Aborts the reservation if it was neither consumed nor aborted
  ~ReservationToken();

  Direction direction() const { return slot_.direction; }
  const std::string& host() const { return slot_.host; }
  const std::string& category() const { return slot_.category; }

  // False once consumed, aborted or moved from
  bool valid() const { return registry_ != nullptr; }

private:
  friend class ConnectionRegistry;

  ReservationToken(std::shared_ptr<ConnectionRegistry> registry, Slot slot);

  std::shared_ptr<ConnectionRegistry> release_ownership();

  std::shared_ptr<ConnectionRegistry> registry_;
  Slot slot_;
};

// Result of RegisterUnique. On success, displaced (if set) is an existing
// connection to the same peer that lost the tie-break; the caller closes it.
struct RegisterOutcome {
  Status status;
  ConnectionId id{0};
  ConnectionPtr displaced;

  bool ok() const { return status.ok(); }
};

class ConnectionRegistry : public std::enable_shared_from_this<ConnectionRegistry> {
public:
  static std::shared_ptr<ConnectionRegistry> Create(size_t max_inbound, size_t max_outbound,
                                                    PeerCategoryTable categories = {});

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  // Take a slot for direction toward/from host (canonical form, may be
  // empty) if the global, category and per-host limits allow it and the
  // registry is not shut down. On refusal returns nullopt and, if refusal
  // is given, stores LimitReached or ShuttingDown with the reason.
  std::optional<ReservationToken> TryReserve(Direction direction, const std::string& host = {},
                                             Status* refusal = nullptr);

  // Insert conn, consuming token. Always succeeds for a valid token whose
  // direction matches conn. Throws std::invalid_argument otherwise.
  ConnectionId Register(ReservationToken token, ConnectionPtr conn);

  // Register with at-most-one-connection-per-peer semantics:
  // - an existing connection to the same peer in the same direction wins;
  //   the new one is refused with DuplicateConnection
  // - for opposite directions both ends keep the connection initiated by
  //   the smaller identity: OUTBOUND if local < remote, else INBOUND
  // - after Shutdown() every registration is refused with ShuttingDown
  // The token is consumed in every case; a refused registration frees its slot.
  RegisterOutcome RegisterUnique(ReservationToken token, ConnectionPtr conn, const PeerIdentity& local_identity);

  // Remove id and free its slot. Unknown ids are a no-op (idempotent).
  void Release(ConnectionId id);

  // Return token's slot without registering anything
  void AbortReservation(ReservationToken token);

  // Refuse future reservations and registrations
  void Shutdown();
  bool is_shutting_down() const;

  ConnectionPtr Get(ConnectionId id) const;
  std::vector<ConnectionPtr> GetAll() const;
  std::vector<ConnectionSummary> Snapshot() const;

  // True if a registered inbound connection came from this canonical host.
  // Outbound connections and pending handshakes are not considered.
  bool HasInboundFromHost(const std::string& host) const;

  size_t inbound_count() const;
  size_t outbound_count() const;
  size_t size() const;

  // Inbound reservations + connections charged to a host or a category
  size_t inbound_count_from_host(const std::string& host) const;
  size_t inbound_count_in_category(const std::string& category) const;
  size_t outbound_count_in_category(const std::string& category) const;

  size_t max_inbound() const { return max_inbound_; }
  size_t max_outbound() const { return max_outbound_; }
  const PeerCategoryTable& categories() const { return categories_; }

private:
  friend class ReservationToken;

  struct Entry {
    ConnectionPtr conn;
    Slot slot;
  };

  ConnectionRegistry(size_t max_inbound, size_t max_outbound, PeerCategoryTable categories);

  void take_slot_locked(const Slot& slot);
  void release_slot_locked(const Slot& slot);
  void release_reservation(const Slot& slot);

  const size_t max_inbound_;
  const size_t max_outbound_;
  const PeerCategoryTable categories_;

  mutable std::mutex mutex_;
  std::map<ConnectionId, Entry> connections_;
  size_t current_inbound_{0};
  size_t current_outbound_{0};
  std::map<std::string, size_t> inbound_per_host_;
  std::map<std::string, size_t> inbound_per_category_;
  std::map<std::string, size_t> outbound_per_category_;
  bool shutting_down_{false};
};

}  // namespace network
}  // namespace peernet
