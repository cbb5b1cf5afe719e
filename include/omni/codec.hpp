#ifndef OMNI_CODEC_HPP
#define OMNI_CODEC_HPP

#include <array>
#include <optional>
#include <vector>

#include "types.hpp"

namespace omni {

// =============================================================================
// Remote-Read Messages
// =============================================================================

// keccak256("getLatestPrice()")[0:4]
constexpr uint32_t SELECTOR_LATEST_PRICE = 0x8e15f473;

struct ReadRequest {
    uint64_t correlation_id;
    ChainId target_chain;
    Address target;             // Remote oracle reference
    uint32_t call_selector;
    uint64_t timestamp_hint;    // Read state as of this time
    uint16_t confirmations;
};

struct PriceResponse {
    I128 price_x18;
    uint64_t timestamp;
};

namespace codec {

using Word = std::array<uint8_t, 32>;

constexpr size_t WORD_SIZE = 32;
constexpr size_t PRICE_RESPONSE_SIZE = 2 * WORD_SIZE;
constexpr size_t READ_REQUEST_SIZE = 8 + 4 + 20 + 4 + 8 + 2;

// ABI words: big-endian, two's complement for signed values
Word encode_int256(I128 v);
Word encode_uint256(U128 v);

// nullopt when the word does not fit the 128-bit target
std::optional<I128> decode_int256(const uint8_t* word);
std::optional<U128> decode_uint256(const uint8_t* word);

// (int256 price, uint256 timestamp)
std::vector<uint8_t> encode_price_response(I128 price_x18, uint64_t timestamp);
std::optional<PriceResponse> decode_price_response(const std::vector<uint8_t>& payload);

// Fixed 42-byte header followed by executor options
std::vector<uint8_t> encode_read_request(const ReadRequest& request,
                                         const std::vector<uint8_t>& options = {});
std::optional<ReadRequest> decode_read_request(const std::vector<uint8_t>& payload);

} // namespace codec

} // namespace omni

#endif // OMNI_CODEC_HPP
