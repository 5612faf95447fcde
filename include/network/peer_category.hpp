// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace peernet {
namespace network {

inline constexpr size_t UNLIMITED_CONNECTIONS = std::numeric_limits<size_t>::max();

// Connection limits applied to one group of remote hosts. Inbound counts
// include connections still in their handshake.
struct PeerNetCategoryInfo {
  size_t max_in_connections{UNLIMITED_CONNECTIONS};         // Inbound from all hosts of the group
  size_t max_in_connections_per_ip{UNLIMITED_CONNECTIONS};  // Inbound from any single host
  size_t max_out_connections{UNLIMITED_CONNECTIONS};        // Outbound to hosts of the group
};

// A named group: its hosts (IP literals or names as dialed) and limits
struct PeerNetCategory {
  std::vector<std::string> hosts;
  PeerNetCategoryInfo limits;
};

using PeerNetCategories = std::map<std::string, PeerNetCategory>;

// PeerCategoryTable - host -> category lookup used by the registry
//
// Hosts are stored in canonical form (see CanonicalHost). A host listed in
// no category belongs to the default category, named by the empty string,
// whose limits are the configured default_category_info.
class PeerCategoryTable {
public:
  // Every host in the default category, no limits
  PeerCategoryTable() = default;

  // Throws std::invalid_argument if a host appears in two categories or a
  // category is named by the empty string.
  PeerCategoryTable(const PeerNetCategories& categories, const PeerNetCategoryInfo& default_limits);

  // Category name of a canonical host; "" for the default category
  const std::string& CategoryOf(const std::string& host) const;

  const PeerNetCategoryInfo& LimitsOf(const std::string& category) const;

  size_t category_count() const { return limits_.size(); }

private:
  std::unordered_map<std::string, std::string> host_category_;
  std::map<std::string, PeerNetCategoryInfo> limits_;
  PeerNetCategoryInfo default_limits_;
};

}  // namespace network
}  // namespace peernet
