/*
===============================================================================
 codec — Unit Tests
 malformed input
===============================================================================

Covered Contracts
-----------------
1. Malformed JSON text fails with DecodeFailure and a diagnostic
2. Malformed CBOR fails with DecodeFailure and a diagnostic
3. Empty input is rejected in both formats
4. Trailing bytes after a complete CBOR item are rejected
5. Nesting beyond the depth limit is rejected, within it accepted, in
   both formats and without exhausting the stack
6. Arbitrary bytes never escape as exceptions

===============================================================================
*/

#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "wirelink/core/codec/codec.hpp"
#include "wirelink/core/config/defaults.hpp"
#include "lcr/log/logger.hpp"
#include "common/test_check.hpp"

using namespace wirelink::core;
using namespace wirelink::core::codec;


namespace {

Bytes text_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

void expect_decode_failure(const Bytes& in, Format format) {
    Value out = "untouched";
    Error err = decode(in, format, out);
    TEST_CHECK(err.code == ErrorCode::DecodeFailure);
    TEST_CHECK(!err.message.empty());
    TEST_CHECK(out == "untouched");
}

std::string nested_arrays(std::size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
}

} // namespace


// -----------------------------------------------------------------------------
// 1. Malformed JSON
// -----------------------------------------------------------------------------
void test_malformed_json() {
    std::cout << "[TEST] Malformed JSON\n";

    const std::vector<std::string> inputs = {
        "{",
        "[1,2",
        "{\"a\":}",
        "{\"a\" 1}",
        "{a:1}",
        "nul",
        "tru",
        "\"unterminated",
        "[1,]",
        "01",
        "\"\xFF\"",           // invalid UTF-8
        "\"bad \\q escape\"",
    };
    for (const auto& s : inputs) {
        expect_decode_failure(text_bytes(s), Format::Json);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// 2. Malformed CBOR
// -----------------------------------------------------------------------------
void test_malformed_cbor() {
    std::cout << "[TEST] Malformed CBOR\n";

    const std::vector<Bytes> inputs = {
        {0xFF},                    // break outside an indefinite item
        {0x62, 'a'},               // text string of 2 bytes, 1 present
        {0x9F, 0x01},              // indefinite array never terminated
        {0xA1, 0x01},              // map entry without a value
        {0x1C},                    // reserved additional information
        {0x19, 0x01},              // truncated 16-bit integer
        {0x82, 0x01},              // array of 2 items, 1 present
    };
    for (const auto& in : inputs) {
        expect_decode_failure(in, Format::Cbor);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// 3. Empty input
// -----------------------------------------------------------------------------
void test_empty_input() {
    std::cout << "[TEST] Empty input\n";

    expect_decode_failure(Bytes{}, Format::Json);
    expect_decode_failure(Bytes{}, Format::Cbor);
    expect_decode_failure(text_bytes("   "), Format::Json);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// 4. Trailing bytes
// -----------------------------------------------------------------------------
void test_cbor_trailing_bytes() {
    std::cout << "[TEST] CBOR trailing bytes\n";

    Bytes valid;
    TEST_CHECK(encode(Value::array({1, 2}), Format::Cbor, valid).ok());

    Bytes extended = valid;
    extended.push_back(0x01);
    expect_decode_failure(extended, Format::Cbor);

    Value ok_value;
    TEST_CHECK(decode(valid, Format::Cbor, ok_value).ok());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// 5. Depth limit
// -----------------------------------------------------------------------------
void test_json_depth_limit() {
    std::cout << "[TEST] JSON depth limit\n";

    Value shallow;
    TEST_CHECK(decode(text_bytes(nested_arrays(64)), Format::Json, shallow).ok());
    TEST_CHECK(shallow.is_array());

    expect_decode_failure(text_bytes(nested_arrays(config::MAX_JSON_DEPTH * 2)), Format::Json);

    std::cout << "[TEST] OK\n";
}

void test_cbor_depth_limit() {
    std::cout << "[TEST] CBOR depth limit\n";

    // 0x81 = array of one item: N bytes nest N arrays and never terminate
    for (std::size_t n : {std::size_t{20000}, std::size_t{100000}, std::size_t{1000000}}) {
        expect_decode_failure(Bytes(n, 0x81), Format::Cbor);
    }

    // Same shape, properly terminated, one level past the limit
    Bytes too_deep(config::MAX_JSON_DEPTH + 1, 0x81);
    too_deep.push_back(0x01);
    expect_decode_failure(too_deep, Format::Cbor);

    // Maps count towards the same limit: {"": {"": ...}}
    Bytes deep_maps;
    for (std::size_t i = 0; i <= config::MAX_JSON_DEPTH; ++i) {
        deep_maps.push_back(0xA1);
        deep_maps.push_back(0x60);
    }
    deep_maps.push_back(0x00);
    expect_decode_failure(deep_maps, Format::Cbor);

    // At the limit the document decodes
    Bytes at_limit(config::MAX_JSON_DEPTH, 0x81);
    at_limit.push_back(0x01);
    Value v;
    TEST_CHECK(decode(at_limit, Format::Cbor, v).ok());
    TEST_CHECK(v.is_array());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// 6. Random input
// -----------------------------------------------------------------------------
void test_random_bytes_never_throw() {
    std::cout << "[TEST] Random short inputs\n";

    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> length(1, 16);

    for (int i = 0; i < 2000; ++i) {
        Bytes in(static_cast<std::size_t>(length(rng)));
        for (auto& b : in) {
            b = static_cast<std::uint8_t>(byte(rng));
        }
        for (Format format : {Format::Json, Format::Cbor}) {
            Value out;
            Error err = decode(in, format, out);
            TEST_CHECK(err.ok() || err.code == ErrorCode::DecodeFailure);
            TEST_CHECK(err.ok() || !err.message.empty());
        }
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_malformed_json();
    test_malformed_cbor();
    test_empty_input();
    test_cbor_trailing_bytes();
    test_json_depth_limit();
    test_cbor_depth_limit();
    test_random_bytes_never_throw();

    std::cout << "\n[TEST] ALL MALFORMED INPUT TESTS PASSED!\n";
    return 0;
}
