// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// End-to-end tests for NetworkManager over loopback TCP

#include "crypto/keypair.hpp"
#include "infra/node_helpers.hpp"
#include "infra/test_helpers.hpp"
#include "network/network_manager.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace peernet;
using namespace peernet::network;
using peernet::test::Bytes;
using peernet::test::Inbox;
using peernet::test::ListeningNode;
using peernet::test::Loopback;
using peernet::test::MakeConfig;
using peernet::test::SilentPeer;
using peernet::test::UnusedPort;
using peernet::test::WaitFor;
using namespace std::chrono_literals;

namespace {

// Two key pairs ordered by identity (smaller first)
std::pair<crypto::KeyPair, crypto::KeyPair> OrderedKeyPairs() {
    auto first = crypto::KeyPair::Generate();
    auto second = crypto::KeyPair::Generate();
    if (PeerIdentity::FromKeyPair(second) < PeerIdentity::FromKeyPair(first)) {
        std::swap(first, second);
    }
    return {std::move(first), std::move(second)};
}

}  // namespace

TEST_CASE("NetworkManager - configuration validation", "[network][manager]") {
    SECTION("io_threads must be positive") {
        auto config = MakeConfig(1, 1);
        config.io_threads = 0;
        CHECK_THROWS_AS(NetworkManager(config), std::invalid_argument);
    }

    SECTION("max_message_size must be positive") {
        auto config = MakeConfig(1, 1);
        config.max_message_size = 0;
        CHECK_THROWS_AS(NetworkManager(config), std::invalid_argument);
    }

    SECTION("rate_time_window must be positive when rate_limit is set") {
        auto config = MakeConfig(1, 1);
        config.rate_limit = 1024;
        config.rate_time_window = 0ms;
        CHECK_THROWS_AS(NetworkManager(config), std::invalid_argument);
    }

    SECTION("A host may belong to one category only") {
        auto config = MakeConfig(1, 1);
        config.peers_categories["seeds"] = PeerNetCategory{{"10.0.0.1"}, PeerNetCategoryInfo{}};
        config.peers_categories["friends"] = PeerNetCategory{{"10.0.0.1"}, PeerNetCategoryInfo{}};
        CHECK_THROWS_AS(NetworkManager(config), std::invalid_argument);
    }

    SECTION("Identity comes from the configured key pair") {
        auto kp = crypto::KeyPair::Generate();
        NetworkManager manager(MakeConfig(1, 1, kp));
        CHECK(manager.local_identity() == PeerIdentity::FromKeyPair(kp));
        CHECK(manager.inbound_count() == 0);
        CHECK(manager.outbound_count() == 0);
        CHECK(manager.connections_snapshot().empty());
    }
}

TEST_CASE("NetworkManager - listener lifecycle", "[network][manager][listener]") {
    ListeningNode server(MakeConfig(4, 0));
    NetworkManager client(MakeConfig(0, 4));

    SECTION("Second start on the same address is AlreadyListening and leaves connections alone") {
        auto connected = client.try_connect(server.address, 2000ms);
        REQUIRE(connected.ok());
        REQUIRE(WaitFor([&] { return server.manager->connections_snapshot().size() == 1; }));

        auto status = server.manager->start_listener(TransportKind::TCP, Loopback(0));
        CHECK(status.code == NetResult::AlreadyListening);
        CHECK(server.manager->connections_snapshot().size() == 1);
        CHECK(server.manager->listeners().size() == 1);
        CHECK(server.manager->listeners()[0].state == ListenerState::RUNNING);
    }

    SECTION("Stopping an unknown listener is ListenerNotFound") {
        auto status = server.manager->stop_listener(TransportKind::TCP, Loopback(1));
        CHECK(status.code == NetResult::ListenerNotFound);
    }

    SECTION("Stop then start on the same port succeeds immediately") {
        uint16_t port = server.address.port;
        REQUIRE(server.manager->stop_listener(TransportKind::TCP, Loopback(0)).ok());
        CHECK(server.manager->listeners().empty());

        auto status = server.manager->start_listener(TransportKind::TCP, Loopback(port));
        REQUIRE(status.ok());
        CHECK(server.manager->listening_port(TransportKind::TCP, Loopback(port)) == port);

        // And the rebound listener accepts
        CHECK(client.try_connect(Loopback(port), 2000ms).ok());
    }

    SECTION("Stopping a listener keeps established connections") {
        REQUIRE(client.try_connect(server.address, 2000ms).ok());
        REQUIRE(WaitFor([&] { return server.manager->inbound_count() == 1; }));

        REQUIRE(server.manager->stop_listener(TransportKind::TCP, Loopback(0)).ok());
        CHECK(server.manager->connections_snapshot().size() == 1);
        CHECK(client.connections_snapshot().size() == 1);

        // New dials are refused
        CHECK(client.try_connect(server.address, 500ms).status.code == NetResult::DialFailed);
    }

    SECTION("Port held by another listener is BindFailed") {
        NetworkManager other(MakeConfig(1, 0));
        auto status = other.start_listener(TransportKind::TCP, server.address);
        CHECK(status.code == NetResult::BindFailed);
        CHECK(other.listeners().empty());
    }
}

TEST_CASE("NetworkManager - connect and exchange frames", "[network][manager]") {
    Inbox server_inbox;
    auto server_config = MakeConfig(4, 0);
    server_config.message_handler = server_inbox.handler();
    ListeningNode server(std::move(server_config));

    Inbox client_inbox;
    auto client_config = MakeConfig(0, 4);
    client_config.message_handler = client_inbox.handler();
    NetworkManager client(std::move(client_config));

    auto result = client.try_connect(server.address, 2000ms);
    REQUIRE(result.ok());
    CHECK(result.connection_id != 0);
    CHECK(client.outbound_count() == 1);

    auto snapshot = client.connections_snapshot();
    REQUIRE(snapshot.size() == 1);
    CHECK(snapshot[0].id == result.connection_id);
    CHECK(snapshot[0].direction == Direction::OUTBOUND);
    CHECK(snapshot[0].state == ConnectionState::ESTABLISHED);
    CHECK(snapshot[0].remote_identity == server.manager->local_identity());

    REQUIRE(WaitFor([&] { return server.manager->inbound_count() == 1; }));
    auto server_side = server.manager->connections_snapshot();
    REQUIRE(server_side.size() == 1);
    CHECK(server_side[0].direction == Direction::INBOUND);
    CHECK(server_side[0].remote_identity == client.local_identity());

    SECTION("Frames reach the remote handler with the sender's identity") {
        REQUIRE(client.send_to(result.connection_id, Bytes("hello")).ok());
        REQUIRE(client.send_to(result.connection_id, Bytes("")).ok());
        REQUIRE(WaitFor([&] { return server_inbox.size() == 2; }));
        {
            std::lock_guard<std::mutex> lock(server_inbox.mutex);
            CHECK(server_inbox.messages[0].first == client.local_identity());
            CHECK(server_inbox.messages[0].second == "hello");
            CHECK(server_inbox.messages[1].second.empty());
        }

        REQUIRE(server.manager->send_to(server_side[0].id, Bytes("welcome")).ok());
        REQUIRE(WaitFor([&] { return client_inbox.size() == 1; }));

        // 4-byte header + 5 payload bytes, then an empty frame
        CHECK(WaitFor([&] { return client.total_bytes_sent() == 4 + 5 + 4; }));
        CHECK(WaitFor([&] { return server.manager->total_bytes_received() == 4 + 5 + 4; }));
    }

    SECTION("Oversized send is refused locally") {
        std::vector<uint8_t> big(client.config().max_message_size + 1, 0xAB);
        CHECK_FALSE(client.send_to(result.connection_id, std::move(big)).ok());
        CHECK(client.connections_snapshot().size() == 1);
    }

    SECTION("Unknown id cannot be sent to") {
        CHECK(client.send_to(result.connection_id + 12345, Bytes("x")).code == NetResult::Io);
    }

    SECTION("close_connection is idempotent and the peer notices") {
        CHECK(client.close_connection(result.connection_id).ok());
        CHECK(client.outbound_count() == 0);
        CHECK(client.connections_snapshot().empty());

        CHECK(client.close_connection(result.connection_id).ok());
        CHECK(client.outbound_count() == 0);

        CHECK(WaitFor([&] { return server.manager->inbound_count() == 0; }));
        CHECK(server.manager->connections_snapshot().empty());
    }

    SECTION("Duplicate dial to the same peer is refused") {
        auto second = client.try_connect(server.address, 2000ms);
        CHECK(second.status.code == NetResult::DuplicateConnection);
        CHECK(client.outbound_count() == 1);
        CHECK(WaitFor([&] { return server.manager->inbound_count() == 1; }));
    }

    SECTION("Peer info export") {
        auto info = client.get_peer_info();
        REQUIRE(info.is_array());
        REQUIRE(info.size() == 1);
        CHECK(info[0]["id"].get<uint64_t>() == result.connection_id);
        CHECK(info[0]["inbound"].get<bool>() == false);
        CHECK(info[0]["peer_id"].get<std::string>() == server.manager->local_identity().ToString());
        CHECK(info[0]["state"].get<std::string>() == "established");
    }
}

TEST_CASE("NetworkManager - dial failures", "[network][manager]") {
    NetworkManager client(MakeConfig(0, 2));

    SECTION("No listener: DialFailed well before the timeout") {
        auto start = std::chrono::steady_clock::now();
        auto result = client.try_connect(Loopback(UnusedPort()), 500ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(result.status.code == NetResult::DialFailed);
        CHECK(elapsed < 400ms);
        CHECK(client.outbound_count() == 0);
    }

    SECTION("Silent peer: deadline ends the attempt and the slot comes back") {
        SilentPeer silent;
        auto start = std::chrono::steady_clock::now();
        auto result = client.try_connect(Loopback(silent.port()), 300ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK((result.status.code == NetResult::DialTimedOut || result.status.code == NetResult::HandshakeFailed));
        CHECK(elapsed >= 250ms);
        CHECK(elapsed < 2000ms);
        CHECK(client.outbound_count() == 0);
        CHECK(client.connections_snapshot().empty());
    }

    SECTION("Zero timeout") {
        auto result = client.try_connect(Loopback(UnusedPort()), 0ms);
        CHECK(result.status.code == NetResult::DialTimedOut);
        CHECK(client.outbound_count() == 0);
    }

    SECTION("Self connection is refused") {
        auto config = MakeConfig(2, 2);
        ListeningNode self(std::move(config));
        auto result = self.manager->try_connect(self.address, 2000ms);
        CHECK(result.status.code == NetResult::HandshakeFailed);
        CHECK(self.manager->outbound_count() == 0);
        CHECK(WaitFor([&] { return self.manager->inbound_count() == 0; }));
    }
}

TEST_CASE("NetworkManager - outbound limit", "[network][manager][limits]") {
    ListeningNode a(MakeConfig(4, 0));
    ListeningNode b(MakeConfig(4, 0));
    NetworkManager client(MakeConfig(0, 1));

    REQUIRE(client.try_connect(a.address, 2000ms).ok());

    auto start = std::chrono::steady_clock::now();
    auto second = client.try_connect(b.address, 2000ms);
    CHECK(second.status.code == NetResult::LimitReached);
    REQUIRE(second.status.direction.has_value());
    CHECK(*second.status.direction == Direction::OUTBOUND);
    CHECK(std::chrono::steady_clock::now() - start < 200ms);
    CHECK(client.outbound_count() == 1);

    // Nothing was dialed
    CHECK(b.manager->listeners()[0].accepted == 0);
}

TEST_CASE("NetworkManager - max_in_connections = 0 rejects without handshake", "[network][manager][limits]") {
    ListeningNode server(MakeConfig(0, 0));
    NetworkManager client(MakeConfig(0, 4));

    for (int i = 0; i < 3; ++i) {
        auto result = client.try_connect(server.address, 2000ms);
        CHECK_FALSE(result.ok());
        CHECK((result.status.code == NetResult::Io || result.status.code == NetResult::HandshakeFailed));
        CHECK(client.outbound_count() == 0);
    }

    REQUIRE(WaitFor([&] { return server.manager->listeners()[0].rejected == 3; }));
    auto info = server.manager->listeners()[0];
    CHECK(info.accepted == 3);
    CHECK(info.state == ListenerState::RUNNING);
    CHECK(server.manager->inbound_count() == 0);
}

TEST_CASE("NetworkManager - silent inbound client releases its slot", "[network][manager][limits]") {
    auto config = MakeConfig(1, 0);
    config.handshake_timeout = 500ms;
    ListeningNode server(std::move(config));

    peernet::test::TestIoContext io;
    RawSocket socket(io.get());
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server.address.port));

    // Slot is held while the handshake is pending, then returned
    CHECK(WaitFor([&] { return server.manager->inbound_count() == 1; }, 1000ms));
    CHECK(WaitFor([&] { return server.manager->inbound_count() == 0; }, 2000ms));
    CHECK(server.manager->connections_snapshot().empty());
}

TEST_CASE("NetworkManager - reject_same_ip_addr", "[network][manager]") {
    auto config = MakeConfig(4, 0);
    config.features.reject_same_ip_addr = true;
    ListeningNode server(std::move(config));

    NetworkManager first(MakeConfig(0, 1));
    NetworkManager second(MakeConfig(0, 1));

    REQUIRE(first.try_connect(server.address, 2000ms).ok());
    REQUIRE(WaitFor([&] { return server.manager->connections_snapshot().size() == 1; }));

    auto result = second.try_connect(server.address, 2000ms);
    CHECK_FALSE(result.ok());
    CHECK(second.outbound_count() == 0);
    CHECK(WaitFor([&] { return server.manager->listeners()[0].rejected == 1; }));
    CHECK(server.manager->inbound_count() == 1);
}

TEST_CASE("NetworkManager - reject_same_ip_addr ignores our own outbound connections", "[network][manager]") {
    auto config = MakeConfig(4, 1);
    config.features.reject_same_ip_addr = true;
    ListeningNode server(std::move(config));
    ListeningNode dialed(MakeConfig(4, 0));

    // Server dials 127.0.0.1 itself
    REQUIRE(server.manager->try_connect(dialed.address, 2000ms).ok());
    REQUIRE(server.manager->outbound_count() == 1);

    // An inbound connection from that host is still accepted
    NetworkManager client(MakeConfig(0, 1));
    auto result = client.try_connect(server.address, 2000ms);
    CHECK(result.ok());
    CHECK(WaitFor([&] { return server.manager->connections_snapshot().size() == 2; }));
    CHECK(server.manager->listeners()[0].rejected == 0);
}

TEST_CASE("NetworkManager - IPv4-mapped peers are the same host", "[network][manager]") {
    // Dual-stack wildcard listener sees 127.0.0.1 as ::ffff:127.0.0.1
    const NetworkAddress dual_stack{"::", 0};

    SECTION("Remote address is reported in IPv4 form") {
        ListeningNode server(MakeConfig(4, 0), dual_stack);
        NetworkManager client(MakeConfig(0, 1));
        REQUIRE(client.try_connect(server.address, 2000ms).ok());
        REQUIRE(WaitFor([&] { return server.manager->connections_snapshot().size() == 1; }));
        CHECK(server.manager->connections_snapshot()[0].remote_address.host == "127.0.0.1");
    }

    SECTION("reject_same_ip_addr matches across IPv4 and dual-stack listeners") {
        auto config = MakeConfig(4, 0);
        config.features.reject_same_ip_addr = true;
        ListeningNode server(std::move(config));
        REQUIRE(server.manager->start_listener(TransportKind::TCP, dual_stack).ok());
        auto dual_port = server.manager->listening_port(TransportKind::TCP, dual_stack);
        REQUIRE(dual_port.has_value());

        NetworkManager first(MakeConfig(0, 1));
        NetworkManager second(MakeConfig(0, 1));
        REQUIRE(first.try_connect(server.address, 2000ms).ok());
        REQUIRE(WaitFor([&] { return server.manager->connections_snapshot().size() == 1; }));

        CHECK_FALSE(second.try_connect(Loopback(*dual_port), 2000ms).ok());
        CHECK(server.manager->inbound_count() == 1);
    }
}

TEST_CASE("NetworkManager - simultaneous dial keeps exactly one connection", "[network][manager]") {
    auto keys = OrderedKeyPairs();
    ListeningNode a(MakeConfig(4, 4, keys.first));
    ListeningNode b(MakeConfig(4, 4, keys.second));
    REQUIRE(a.manager->local_identity() < b.manager->local_identity());

    ConnectResult a_result;
    ConnectResult b_result;
    std::thread ta([&] { a_result = a.manager->try_connect(b.address, 3000ms); });
    std::thread tb([&] { b_result = b.manager->try_connect(a.address, 3000ms); });
    ta.join();
    tb.join();

    // At least one attempt got through
    CHECK((a_result.ok() || b_result.ok()));

    REQUIRE(WaitFor([&] {
        return a.manager->connections_snapshot().size() == 1 && b.manager->connections_snapshot().size() == 1;
    }));

    // Both keep the connection initiated by the smaller identity (A)
    auto on_a = a.manager->connections_snapshot();
    auto on_b = b.manager->connections_snapshot();
    CHECK(on_a[0].direction == Direction::OUTBOUND);
    CHECK(on_b[0].direction == Direction::INBOUND);
    CHECK(on_a[0].remote_identity == b.manager->local_identity());
    CHECK(on_b[0].remote_identity == a.manager->local_identity());

    CHECK(WaitFor([&] {
        return a.manager->outbound_count() + a.manager->inbound_count() == 1 &&
               b.manager->outbound_count() + b.manager->inbound_count() == 1;
    }));
}

TEST_CASE("NetworkManager - initial peers", "[network][manager]") {
    ListeningNode server(MakeConfig(4, 0));

    auto config = MakeConfig(0, 4);
    config.initial_peer_list.push_back(InitialPeer{server.address, TransportKind::TCP});
    config.initial_peer_list.push_back(InitialPeer{Loopback(UnusedPort()), TransportKind::TCP});
    NetworkManager client(std::move(config));

    auto results = client.connect_initial_peers(1000ms);
    REQUIRE(results.size() == 2);
    CHECK(results[0].ok());
    CHECK(results[1].status.code == NetResult::DialFailed);
    CHECK(client.outbound_count() == 1);
}

TEST_CASE("NetworkManager - destruction closes everything", "[network][manager]") {
    ListeningNode server(MakeConfig(8, 0));

    {
        auto client = std::make_unique<NetworkManager>(MakeConfig(4, 4));
        REQUIRE(client->start_listener(TransportKind::TCP, Loopback(0)).ok());
        REQUIRE(client->try_connect(server.address, 2000ms).ok());
        REQUIRE(WaitFor([&] { return server.manager->inbound_count() == 1; }));
        client.reset();
    }

    // The remote side sees the connection go away and frees the slot
    CHECK(WaitFor([&] { return server.manager->inbound_count() == 0; }));
    CHECK(server.manager->connections_snapshot().empty());
}
