// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace peernet {
namespace util {

/**
 * LogManager - process-wide spdlog loggers for peernet
 *
 * peernet logs through three named loggers that share one sink set
 * (stderr, plus an optional file):
 *
 *   "network"  listener accept loop, connector, handshake, connection
 *              framing/timeouts, registry limits, NetworkManager lifecycle
 *   "crypto"   key generation, key loading, signature and point checks
 *   "default"  anything else, and the fallback for unknown component names
 *
 * Every line carries the component name, so `[network]` and `[crypto]`
 * can be grepped apart in a shared log file.
 *
 * Level guidance used across the tree:
 *
 *   trace  per-socket noise (accepted socket died before its endpoint
 *          was read, close() failing on an already dead socket)
 *   debug  per-connection outcomes: handshake complete or failed, inbound
 *          refused by a limit, duplicate peer dropped
 *   info   node-level events an operator wants by default: manager
 *          started/stopped, listening on a port, connection established
 *   warn   a peer stalled or overran us (oversized frame, read/write
 *          deadline, send queue overflow, transient accept error).
 *          Peer-driven warnings use LOG_NET_WARN_RL.
 *   error  our own side is broken: acceptor failed and the listener went
 *          to FAILED, OpenSSL returned an internal error, slot accounting
 *          went negative
 *
 * Usage:
 *
 *   LogManager::Initialize("debug", true, "/var/log/peernet.log");
 *   LOG_NET_INFO("listener {} bound on {}", id, endpoint);
 *   LOG_NET_WARN_RL("dropping {}: frame of {} bytes exceeds {}", peer, size, max);
 *   LogManager::SetComponentLevel("crypto", "trace");
 *   ...
 *   LogManager::Shutdown();
 *
 * Logging before Initialize() is allowed: the first GetLogger() creates
 * console-only loggers at level "off", so library code and unit tests never
 * have to set logging up.
 *
 * Thread-safety: every method may be called from any thread, including
 * io_context threads inside completion handlers. Initialize() runs its body
 * exactly once (std::call_once); the logger map is guarded by one mutex and
 * the returned spdlog loggers are the _mt variants.
 */
class LogManager {
public:
  // Configure sinks and the global level. Only the first call in the process
  // has any effect. If the log file cannot be opened, logging continues on
  // stderr and the failure is reported through the default logger.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "peernet.log");

  // Flush and drop every logger and sink. Call after NetworkManager::Stop()
  // so the final close/unbind lines reach the file. A later GetLogger()
  // rebuilds console-only loggers; Initialize() will not run again.
  static void Shutdown();

  // Logger for "network", "crypto" or "default". Unknown names get "default".
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Level for all components ("trace" ... "critical", "off").
  static void SetLogLevel(const std::string& level);

  // Level for one component; ignored if the component does not exist yet.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace peernet

#define LOG_TRACE(...) peernet::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) peernet::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) peernet::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) peernet::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) peernet::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Network: listener, connector, handshake, connection, registry, manager
#define LOG_NET_TRACE(...) peernet::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) peernet::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) peernet::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) peernet::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) peernet::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

// Crypto: KeyPair and signature checks. Never log private key material.
#define LOG_CRYPTO_DEBUG(...) peernet::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_INFO(...) peernet::util::LogManager::GetLogger("crypto")->info(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...) peernet::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// A remote host controls how often the network warnings fire: it can send
// 2 MiB frame headers in a loop, or stall reads until the deadline closes
// the connection and then reconnect. Each of those sites logs through
// LOG_NET_WARN_RL so one host cannot turn into a disk-filling stream of
// identical lines.
//
// Budget: 200 lines per hour per callsite (file:line), token bucket, shared
// by all peers hitting that callsite. Once the bucket is empty the message
// is dropped, not queued. Lines that carry node-level state (listener
// FAILED, manager start/stop) use the plain macros and are never dropped.

#include "util/rate_limiter.hpp"

#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (peernet::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      peernet::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)
