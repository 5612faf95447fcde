// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_category.hpp"

#include "network/transport.hpp"

#include <stdexcept>

namespace peernet {
namespace network {

namespace {
const std::string DEFAULT_CATEGORY;
}  // namespace

PeerCategoryTable::PeerCategoryTable(const PeerNetCategories& categories, const PeerNetCategoryInfo& default_limits)
    : default_limits_(default_limits) {
  for (const auto& [name, category] : categories) {
    if (name.empty()) {
      throw std::invalid_argument("peer category name must not be empty");
    }
    limits_.emplace(name, category.limits);
    for (const auto& host : category.hosts) {
      auto [it, inserted] = host_category_.emplace(CanonicalHost(host), name);
      if (!inserted && it->second != name) {
        throw std::invalid_argument("host " + host + " is listed in categories " + it->second + " and " + name);
      }
    }
  }
}

const std::string& PeerCategoryTable::CategoryOf(const std::string& host) const {
  auto it = host_category_.find(host);
  return it == host_category_.end() ? DEFAULT_CATEGORY : it->second;
}

const PeerNetCategoryInfo& PeerCategoryTable::LimitsOf(const std::string& category) const {
  auto it = limits_.find(category);
  return it == limits_.end() ? default_limits_ : it->second;
}

}  // namespace network
}  // namespace peernet
