// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for component loggers and logging macros

#include "util/logging.hpp"

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <spdlog/sinks/ostream_sink.h>

using namespace peernet::util;

namespace {

// Attaches an ostream sink to one component logger and mutes its other sinks
class CapturedLog {
public:
    explicit CapturedLog(const std::string& component) : logger_(LogManager::GetLogger(component)) {
        old_level_ = logger_->level();
        for (auto& sink : logger_->sinks()) {
            old_sink_levels_.push_back(sink->level());
            sink->set_level(spdlog::level::off);
        }
        sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        sink_->set_pattern("%n|%l|%v");
        sink_->set_level(spdlog::level::trace);
        logger_->sinks().push_back(sink_);
        logger_->set_level(spdlog::level::trace);
    }

    ~CapturedLog() {
        auto& sinks = logger_->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        for (size_t i = 0; i < sinks.size() && i < old_sink_levels_.size(); ++i) {
            sinks[i]->set_level(old_sink_levels_[i]);
        }
        logger_->set_level(old_level_);
    }

    spdlog::logger& logger() { return *logger_; }

    std::string text() {
        logger_->flush();
        return stream_.str();
    }

    size_t lines() {
        auto s = text();
        return static_cast<size_t>(std::count(s.begin(), s.end(), '\n'));
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::ostringstream stream_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    spdlog::level::level_enum old_level_;
    std::vector<spdlog::level::level_enum> old_sink_levels_;
};

}  // namespace

TEST_CASE("LogManager: component loggers", "[logging]") {
    LogManager::Initialize("off");

    auto def = LogManager::GetLogger();
    auto net = LogManager::GetLogger("network");
    auto crypto = LogManager::GetLogger("crypto");

    REQUIRE(def != nullptr);
    REQUIRE(net != nullptr);
    REQUIRE(crypto != nullptr);
    CHECK(def->name() == "default");
    CHECK(net->name() == "network");
    CHECK(crypto->name() == "crypto");

    SECTION("Same component returns the same logger") {
        CHECK(LogManager::GetLogger("network") == net);
    }

    SECTION("Unknown components fall back to default") {
        CHECK(LogManager::GetLogger("chain") == def);
        CHECK(LogManager::GetLogger("") == def);
    }

    SECTION("Initialize is idempotent") {
        LogManager::Initialize("trace");
        CHECK(LogManager::GetLogger("network") == net);
    }
}

TEST_CASE("LogManager: macros route to their component", "[logging]") {
    CapturedLog net("network");
    CapturedLog crypto("crypto");

    LOG_NET_INFO("connection {} established with peer {}", 7, "ab12cd34");
    LOG_NET_DEBUG("dialing {}", "127.0.0.1:9590");
    LOG_CRYPTO_ERROR("signing failed: {}", "provider error");

    auto net_text = net.text();
    CHECK(net_text.find("network|info|connection 7 established with peer ab12cd34") != std::string::npos);
    CHECK(net_text.find("network|debug|dialing 127.0.0.1:9590") != std::string::npos);
    CHECK(net_text.find("signing failed") == std::string::npos);

    CHECK(crypto.text() == "crypto|error|signing failed: provider error\n");
}

TEST_CASE("LogManager: runtime level changes", "[logging]") {
    CapturedLog net("network");
    CapturedLog crypto("crypto");

    SECTION("Component level filters only that component") {
        LogManager::SetComponentLevel("network", "warn");

        LOG_NET_INFO("filtered");
        LOG_NET_WARN("kept");
        LOG_CRYPTO_INFO("crypto info");

        CHECK(net.lines() == 1);
        CHECK(net.text().find("kept") != std::string::npos);
        CHECK(crypto.lines() == 1);
    }

    SECTION("Global level applies to every component") {
        LogManager::SetLogLevel("error");

        LOG_NET_WARN("network warning");
        LOG_CRYPTO_INFO("crypto info");
        LOG_NET_ERROR("network error");

        CHECK(net.lines() == 1);
        CHECK(crypto.lines() == 0);
    }

    SECTION("Unknown component is ignored") {
        LogManager::SetComponentLevel("nonexistent", "trace");
        CHECK(net.logger().level() == spdlog::level::trace);
    }
}

TEST_CASE("LogManager: rate-limited macros cap peer-triggered output", "[logging][rate_limiter]") {
    CapturedLog net("network");

    // One callsite hit by a remote flood: the bucket allows 200 per hour
    for (int i = 0; i < 250; ++i) {
        LOG_NET_WARN_RL("garbage handshake #{} from 10.0.0.1", i);
    }

    CHECK(net.lines() == 200);
    CHECK(net.text().find("garbage handshake #0 ") != std::string::npos);
    CHECK(net.text().find("garbage handshake #200 ") == std::string::npos);
}

TEST_CASE("LogManager: concurrent logging", "[logging][threading]") {
    CapturedLog net("network");

    const int num_threads = 4;
    const int lines_per_thread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < lines_per_thread; ++i) {
                LOG_NET_DEBUG("io thread {} frame {}", t, i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(net.lines() == static_cast<size_t>(num_threads * lines_per_thread));
}

TEST_CASE("LogManager: shutdown and re-acquire", "[logging]") {
    LogManager::Shutdown();

    // Logging after shutdown recreates loggers instead of crashing
    auto net = LogManager::GetLogger("network");
    REQUIRE(net != nullptr);
    CHECK(net->name() == "network");
    LOG_NET_INFO("after shutdown");
    CHECK(LogManager::GetLogger("network") == net);
}
