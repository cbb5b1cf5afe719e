// =============================================================================
// codec.cpp - ABI words and remote-read request/response framing
// =============================================================================

#include "omni/codec.hpp"

namespace omni {
namespace codec {

namespace {

template <typename T>
void put_be(std::vector<uint8_t>& out, T v, size_t bytes) {
    for (size_t i = 0; i < bytes; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * (bytes - 1 - i))));
    }
}

template <typename T>
T get_be(const uint8_t* p, size_t bytes) {
    T v = 0;
    for (size_t i = 0; i < bytes; ++i) {
        v = static_cast<T>((v << 8) | p[i]);
    }
    return v;
}

} // namespace

Word encode_uint256(U128 v) {
    Word w{};
    for (size_t i = 0; i < 16; ++i) {
        w[31 - i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return w;
}

Word encode_int256(I128 v) {
    Word w = encode_uint256(static_cast<U128>(v));
    if (v < 0) {
        // Sign-extend into the upper 16 bytes
        for (size_t i = 0; i < 16; ++i) w[i] = 0xFF;
    }
    return w;
}

std::optional<U128> decode_uint256(const uint8_t* word) {
    for (size_t i = 0; i < 16; ++i) {
        if (word[i] != 0) return std::nullopt;
    }
    return get_be<U128>(word + 16, 16);
}

std::optional<I128> decode_int256(const uint8_t* word) {
    // Upper half must be a sign extension of bit 127
    bool negative = (word[16] & 0x80) != 0;
    uint8_t fill = negative ? 0xFF : 0x00;
    for (size_t i = 0; i < 16; ++i) {
        if (word[i] != fill) return std::nullopt;
    }
    return static_cast<I128>(get_be<U128>(word + 16, 16));
}

std::vector<uint8_t> encode_price_response(I128 price_x18, uint64_t timestamp) {
    Word price = encode_int256(price_x18);
    Word ts = encode_uint256(timestamp);

    std::vector<uint8_t> out;
    out.reserve(PRICE_RESPONSE_SIZE);
    out.insert(out.end(), price.begin(), price.end());
    out.insert(out.end(), ts.begin(), ts.end());
    return out;
}

std::optional<PriceResponse> decode_price_response(const std::vector<uint8_t>& payload) {
    if (payload.size() < PRICE_RESPONSE_SIZE) return std::nullopt;

    auto price = decode_int256(payload.data());
    auto ts = decode_uint256(payload.data() + WORD_SIZE);
    if (!price || !ts) return std::nullopt;
    if (*ts > UINT64_MAX) return std::nullopt;

    return PriceResponse{*price, static_cast<uint64_t>(*ts)};
}

std::vector<uint8_t> encode_read_request(const ReadRequest& request,
                                         const std::vector<uint8_t>& options) {
    std::vector<uint8_t> out;
    out.reserve(READ_REQUEST_SIZE + options.size());

    put_be(out, request.correlation_id, 8);
    put_be(out, request.target_chain, 4);
    out.insert(out.end(), request.target.begin(), request.target.end());
    put_be(out, request.call_selector, 4);
    put_be(out, request.timestamp_hint, 8);
    put_be(out, request.confirmations, 2);
    out.insert(out.end(), options.begin(), options.end());
    return out;
}

std::optional<ReadRequest> decode_read_request(const std::vector<uint8_t>& payload) {
    if (payload.size() < READ_REQUEST_SIZE) return std::nullopt;

    const uint8_t* p = payload.data();
    ReadRequest r{};
    r.correlation_id = get_be<uint64_t>(p, 8);
    p += 8;
    r.target_chain = get_be<uint32_t>(p, 4);
    p += 4;
    for (size_t i = 0; i < r.target.size(); ++i) r.target[i] = p[i];
    p += r.target.size();
    r.call_selector = get_be<uint32_t>(p, 4);
    p += 4;
    r.timestamp_hint = get_be<uint64_t>(p, 8);
    p += 8;
    r.confirmations = get_be<uint16_t>(p, 2);
    return r;
}

} // namespace codec
} // namespace omni
