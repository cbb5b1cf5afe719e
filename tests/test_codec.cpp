// Remote-read wire format tests

#include <catch2/catch_test_macros.hpp>

#include <omni/codec.hpp>

#include "mocks.hpp"

using namespace omni;
using namespace omni_test;

TEST_CASE("Price response words", "[codec]") {
    SECTION("Layout is two big-endian words") {
        auto bytes = codec::encode_price_response(I128(0x0102), 0x0A0B);
        REQUIRE(bytes.size() == codec::PRICE_RESPONSE_SIZE);
        REQUIRE(bytes[30] == 0x01);
        REQUIRE(bytes[31] == 0x02);
        REQUIRE(bytes[62] == 0x0A);
        REQUIRE(bytes[63] == 0x0B);
        for (size_t i = 0; i < 30; ++i) REQUIRE(bytes[i] == 0);
    }

    SECTION("Negative prices are sign-extended") {
        auto bytes = codec::encode_price_response(I128(-1), 1);
        for (size_t i = 0; i < 32; ++i) REQUIRE(bytes[i] == 0xFF);

        auto decoded = codec::decode_price_response(bytes);
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->price_x18 == -1);
    }

    SECTION("Decodes what the serving side produces") {
        auto decoded = codec::decode_price_response(
            codec::encode_price_response(usd(2), 1700000000));
        REQUIRE(decoded->price_x18 == usd(2));
        REQUIRE(decoded->timestamp == 1700000000);
    }

    SECTION("Short payload") {
        std::vector<uint8_t> shortp(63, 0);
        REQUIRE_FALSE(codec::decode_price_response(shortp).has_value());
    }

    SECTION("Price outside 128 bits") {
        auto bytes = codec::encode_price_response(usd(2), 1);
        bytes[0] = 0x01;
        REQUIRE_FALSE(codec::decode_price_response(bytes).has_value());
    }

    SECTION("Timestamp outside 64 bits") {
        auto bytes = codec::encode_price_response(usd(2), 1);
        bytes[32 + 23] = 0x01;
        REQUIRE_FALSE(codec::decode_price_response(bytes).has_value());
    }
}

TEST_CASE("Read request framing", "[codec]") {
    ReadRequest request{};
    request.correlation_id = 42;
    request.target_chain = 96369;
    request.target = addr(0xBE);
    request.call_selector = SELECTOR_LATEST_PRICE;
    request.timestamp_hint = 1700000000;
    request.confirmations = 20;

    std::vector<uint8_t> options{0x00, 0x03};
    auto bytes = codec::encode_read_request(request, options);
    REQUIRE(bytes.size() == codec::READ_REQUEST_SIZE + options.size());

    // Selector sits after id, chain and target
    REQUIRE(bytes[32] == 0x8e);
    REQUIRE(bytes[33] == 0x15);
    REQUIRE(bytes[34] == 0xf4);
    REQUIRE(bytes[35] == 0x73);

    auto decoded = codec::decode_read_request(bytes);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->correlation_id == 42);
    REQUIRE(decoded->target_chain == 96369);
    REQUIRE(decoded->target == addr(0xBE));
    REQUIRE(decoded->call_selector == SELECTOR_LATEST_PRICE);
    REQUIRE(decoded->timestamp_hint == 1700000000);
    REQUIRE(decoded->confirmations == 20);

    bytes.resize(codec::READ_REQUEST_SIZE - 1);
    REQUIRE_FALSE(codec::decode_read_request(bytes).has_value());
}
