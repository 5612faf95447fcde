// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the token bucket behind the *_RL logging macros

#include "util/rate_limiter.hpp"
#include "util/time.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace peernet::util;

TEST_CASE("RateLimiter: Burst capacity", "[rate_limiter]") {
    RateLimiter limiter;

    SECTION("Full bucket on first use, then limited") {
        for (int i = 0; i < 200; ++i) {
            REQUIRE(limiter.should_log("listener.cpp:130", 200, 3600));
        }
        REQUIRE_FALSE(limiter.should_log("listener.cpp:130", 200, 3600));
    }

    SECTION("Callsites do not share buckets") {
        for (int i = 0; i < 200; ++i) {
            limiter.should_log("listener.cpp:130", 200, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("listener.cpp:130", 200, 3600));

        // Oversized-frame warnings still get through while accept errors are muted
        REQUIRE(limiter.should_log("connection.cpp:77", 200, 3600));
    }

    SECTION("Single-token bucket") {
        REQUIRE(limiter.should_log("once", 1, 3600));
        REQUIRE_FALSE(limiter.should_log("once", 1, 3600));
        REQUIRE_FALSE(limiter.should_log("once", 1, 3600));
    }
}

TEST_CASE("RateLimiter: Refill follows the mock clock", "[rate_limiter]") {
    MockTimeScope mock_time(1000000);
    RateLimiter limiter;

    SECTION("One token back per refill interval") {
        // 10 tokens per 100 s: one token every 10 s
        for (int i = 0; i < 10; ++i) {
            limiter.should_log("refill", 10, 100);
        }
        REQUIRE_FALSE(limiter.should_log("refill", 10, 100));

        SetMockTime(1000005);
        REQUIRE_FALSE(limiter.should_log("refill", 10, 100));

        SetMockTime(1000011);
        REQUIRE(limiter.should_log("refill", 10, 100));
        REQUIRE_FALSE(limiter.should_log("refill", 10, 100));
    }

    SECTION("Refill never exceeds the burst size") {
        for (int i = 0; i < 5; ++i) {
            limiter.should_log("cap", 5, 1);
        }

        SetMockTime(1000100);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(limiter.should_log("cap", 5, 1));
        }
        REQUIRE_FALSE(limiter.should_log("cap", 5, 1));
    }

    SECTION("A long idle period restores the whole bucket") {
        for (int i = 0; i < 200; ++i) {
            limiter.should_log("handshake", 200, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("handshake", 200, 3600));

        SetMockTime(1000000 + 2 * 3600);
        int logged = 0;
        for (int i = 0; i < 300; ++i) {
            if (limiter.should_log("handshake", 200, 3600)) {
                ++logged;
            }
        }
        REQUIRE(logged == 200);
    }
}

TEST_CASE("RateLimiter: Garbage handshake flood", "[rate_limiter][security]") {
    RateLimiter limiter;

    // A remote host opening 1000 connections that each fail the handshake
    // produces at most one bucket's worth of log lines per callsite
    int logged = 0;
    for (int i = 0; i < 1000; ++i) {
        if (limiter.should_log("handshake.cpp:191", 200, 3600)) {
            ++logged;
        }
    }
    REQUIRE(logged == 200);
}

TEST_CASE("RateLimiter: Shared instance under concurrency", "[rate_limiter][threading]") {
    RateLimiter& limiter = RateLimiter::instance();
    const std::string key = "rate_limiter_tests:concurrent";

    const int num_threads = 8;
    const int attempts_per_thread = 100;
    std::atomic<int> logged{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < attempts_per_thread; ++i) {
                if (limiter.should_log(key, 200, 3600)) {
                    logged++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // 800 attempts against a 200 token bucket; an hour cannot pass here
    REQUIRE(logged == 200);
    REQUIRE(&limiter == &RateLimiter::instance());
}
