// Unit tests for frame headers and the handshake message codec
#include "crypto/keypair.hpp"
#include "network/handshake.hpp"
#include "network/protocol.hpp"

#include <cstring>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace peernet;
using namespace peernet::network;

TEST_CASE("Frame header - big-endian length", "[network][protocol]") {
    SECTION("Known encoding") {
        auto header = protocol::EncodeFrameHeader(0x01020304);
        CHECK(header[0] == 0x01);
        CHECK(header[1] == 0x02);
        CHECK(header[2] == 0x03);
        CHECK(header[3] == 0x04);
    }

    SECTION("Boundary values decode back") {
        CHECK(protocol::DecodeFrameHeader(protocol::EncodeFrameHeader(0)) == 0);
        CHECK(protocol::DecodeFrameHeader(protocol::EncodeFrameHeader(protocol::DEFAULT_MAX_MESSAGE_SIZE)) ==
              protocol::DEFAULT_MAX_MESSAGE_SIZE);
        CHECK(protocol::DecodeFrameHeader(protocol::EncodeFrameHeader(0xFFFFFFFFu)) == 0xFFFFFFFFu);
    }
}

TEST_CASE("HELLO - layout", "[network][protocol][handshake]") {
    HelloMessage hello;
    hello.public_key.fill(0xAA);
    hello.nonce.fill(0x55);

    auto payload = EncodeHello(hello);
    REQUIRE(payload.size() == protocol::HELLO_SIZE);
    CHECK(std::memcmp(payload.data(), "PNET", 4) == 0);
    CHECK(payload[4] == protocol::HANDSHAKE_VERSION);
    CHECK(payload[5] == 0xAA);
    CHECK(payload[5 + 32] == 0x55);

    auto decoded = DecodeHello(payload);
    REQUIRE(decoded.has_value());
    CHECK(decoded->public_key == hello.public_key);
    CHECK(decoded->nonce == hello.nonce);
}

TEST_CASE("HELLO - malformed payloads are rejected", "[network][protocol][handshake]") {
    HelloMessage hello;
    hello.public_key.fill(1);
    hello.nonce.fill(2);
    auto good = EncodeHello(hello);
    std::string error;

    SECTION("Truncated") {
        std::vector<uint8_t> bad(good.begin(), good.end() - 1);
        CHECK_FALSE(DecodeHello(bad, &error).has_value());
        CHECK(error == "hello has wrong size");
    }

    SECTION("Oversized") {
        auto bad = good;
        bad.push_back(0);
        CHECK_FALSE(DecodeHello(bad, &error).has_value());
    }

    SECTION("Wrong magic") {
        auto bad = good;
        bad[0] = 'X';
        CHECK_FALSE(DecodeHello(bad, &error).has_value());
        CHECK(error == "bad magic");
    }

    SECTION("Unknown version") {
        auto bad = good;
        bad[4] = protocol::HANDSHAKE_VERSION + 1;
        CHECK_FALSE(DecodeHello(bad, &error).has_value());
        CHECK(error == "unsupported handshake version");
    }

    SECTION("Empty") {
        CHECK_FALSE(DecodeHello(std::span<const uint8_t>{}).has_value());
    }
}

TEST_CASE("PROOF transcript binds nonce and both keys", "[network][protocol][handshake]") {
    auto a = crypto::KeyPair::Generate();
    auto b = crypto::KeyPair::Generate();
    HandshakeNonce nonce_from_b;
    nonce_from_b.fill(0x42);

    // a signs b's nonce
    auto transcript = BuildProofTranscript(nonce_from_b, a.public_key(), b.public_key());
    const size_t context_len = sizeof(protocol::HANDSHAKE_CONTEXT) - 1;
    REQUIRE(transcript.size() == context_len + 32 + 32 + 32);
    CHECK(std::memcmp(transcript.data(), protocol::HANDSHAKE_CONTEXT, context_len) == 0);

    auto sig = a.Sign(transcript);

    // b verifies with the same nonce and roles
    CHECK(crypto::KeyPair::Verify(a.public_key(),
                                  BuildProofTranscript(nonce_from_b, a.public_key(), b.public_key()), sig));

    SECTION("Different nonce fails") {
        HandshakeNonce other = nonce_from_b;
        other[0] ^= 1;
        CHECK_FALSE(crypto::KeyPair::Verify(a.public_key(),
                                            BuildProofTranscript(other, a.public_key(), b.public_key()), sig));
    }

    SECTION("Swapped keys fail") {
        CHECK_FALSE(crypto::KeyPair::Verify(a.public_key(),
                                            BuildProofTranscript(nonce_from_b, b.public_key(), a.public_key()), sig));
    }
}
