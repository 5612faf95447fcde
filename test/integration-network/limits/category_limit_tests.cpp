// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-IP and per-category connection limits over loopback

#include "infra/node_helpers.hpp"
#include "infra/test_helpers.hpp"
#include "network/network_manager.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace peernet;
using namespace peernet::network;
using peernet::test::ListeningNode;
using peernet::test::Loopback;
using peernet::test::MakeConfig;
using peernet::test::TestIoContext;
using peernet::test::WaitFor;
using namespace std::chrono_literals;

TEST_CASE("Per-IP limit - second inbound connection from one host is refused", "[network][limits][category]") {
    auto config = MakeConfig(10, 0);
    config.default_category_info = PeerNetCategoryInfo{UNLIMITED_CONNECTIONS, 1, UNLIMITED_CONNECTIONS};
    ListeningNode server(std::move(config));

    auto first = std::make_unique<NetworkManager>(MakeConfig(0, 1));
    NetworkManager second(MakeConfig(0, 1));

    REQUIRE(first->try_connect(server.address, 2000ms).ok());
    REQUIRE(WaitFor([&] { return server.manager->connections_snapshot().size() == 1; }));

    CHECK_FALSE(second.try_connect(server.address, 2000ms).ok());
    CHECK(second.outbound_count() == 0);
    CHECK(WaitFor([&] { return server.manager->listeners()[0].rejected == 1; }));
    CHECK(server.manager->inbound_count() == 1);

    SECTION("The host may connect again once its connection is gone") {
        first.reset();
        REQUIRE(WaitFor([&] { return server.manager->inbound_count() == 0; }));
        CHECK(second.try_connect(server.address, 2000ms).ok());
        CHECK(WaitFor([&] { return server.manager->connections_snapshot().size() == 1; }));
    }
}

TEST_CASE("Per-IP limit - a pending handshake holds the host's slot", "[network][limits][category]") {
    auto config = MakeConfig(10, 0);
    config.handshake_timeout = 500ms;
    config.default_category_info = PeerNetCategoryInfo{UNLIMITED_CONNECTIONS, 1, UNLIMITED_CONNECTIONS};
    ListeningNode server(std::move(config));

    // Connects at TCP level and never says HELLO
    TestIoContext io;
    RawSocket silent(io.get());
    silent.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server.address.port));
    REQUIRE(WaitFor([&] { return server.manager->inbound_count() == 1; }));

    NetworkManager client(MakeConfig(0, 1));
    CHECK_FALSE(client.try_connect(server.address, 2000ms).ok());

    // Handshake deadline frees the slot
    REQUIRE(WaitFor([&] { return server.manager->inbound_count() == 0; }, 3000ms));
    CHECK(client.try_connect(server.address, 2000ms).ok());
}

TEST_CASE("Category limits - named category and default category", "[network][limits][category]") {
    auto config = MakeConfig(10, 10);
    config.peers_categories["bootstrap"] = PeerNetCategory{{"127.0.0.1"}, PeerNetCategoryInfo{1, 1, 1}};
    // Hosts outside any category may not connect at all
    config.default_category_info = PeerNetCategoryInfo{0, 0, 0};
    ListeningNode server(std::move(config));

    SECTION("Inbound: one connection from the category") {
        NetworkManager first(MakeConfig(0, 1));
        NetworkManager second(MakeConfig(0, 1));
        REQUIRE(first.try_connect(server.address, 2000ms).ok());
        REQUIRE(WaitFor([&] { return server.manager->connections_snapshot().size() == 1; }));

        CHECK_FALSE(second.try_connect(server.address, 2000ms).ok());
        CHECK(server.manager->inbound_count() == 1);
    }

    SECTION("Outbound: one connection into the category") {
        ListeningNode peer_a(MakeConfig(4, 0));
        ListeningNode peer_b(MakeConfig(4, 0));

        REQUIRE(server.manager->try_connect(peer_a.address, 2000ms).ok());
        auto refused = server.manager->try_connect(peer_b.address, 2000ms);
        CHECK(refused.status.code == NetResult::LimitReached);
        CHECK(refused.status.direction == Direction::OUTBOUND);
        CHECK(refused.status.detail.find("bootstrap") != std::string::npos);
        CHECK(server.manager->outbound_count() == 1);
    }

    SECTION("Outbound: hosts outside every category use the default limits") {
        ListeningNode peer(MakeConfig(4, 0));
        // "localhost" is not listed, so it falls in the default category
        auto refused = server.manager->try_connect(NetworkAddress{"localhost", peer.address.port}, 2000ms);
        CHECK(refused.status.code == NetResult::LimitReached);
        CHECK(server.manager->outbound_count() == 0);
        CHECK(peer.manager->inbound_count() == 0);
    }
}
