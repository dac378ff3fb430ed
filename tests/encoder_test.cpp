//! # Encoder Tests
//!
//! Canonical output for every kind, round trips through the decoder, and
//! the encode-side errors.

#include "tnet/decoder.hpp"
#include "tnet/encoder.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstring>
#include <limits>

using namespace tnet;

namespace {

auto encode_ok(const Value& value) -> std::string {
    auto result = encode(value);
    EXPECT_TRUE(is_ok(result)) << "failed to encode " << value << ": " << unwrap_err(result);
    return is_ok(result) ? unwrap(result) : std::string();
}

auto round_trip(const Value& value) -> Value {
    auto decoded = decode(encode_ok(value));
    EXPECT_TRUE(is_ok(decoded)) << unwrap_err(decoded);
    return is_ok(decoded) ? std::move(unwrap(decoded)) : Value();
}

auto nested_value(size_t depth) -> Value {
    Value value{List{}};
    for (size_t i = 1; i < depth; ++i) {
        List wrapper;
        wrapper.push_back(std::move(value));
        value = Value(std::move(wrapper));
    }
    return value;
}

} // namespace

// ============================================================================
// Scalars
// ============================================================================

TEST(EncoderTest, Scalars) {
    EXPECT_EQ(encode_ok(Value()), "0:~");
    EXPECT_EQ(encode_ok(Value(true)), "4:true!");
    EXPECT_EQ(encode_ok(Value(false)), "5:false!");
    EXPECT_EQ(encode_ok(Value(123)), "3:123#");
    EXPECT_EQ(encode_ok(Value(-5)), "2:-5#");
    EXPECT_EQ(encode_ok(Value(0)), "1:0#");
    EXPECT_EQ(encode_ok(Value(1.5)), "3:1.5^");
    EXPECT_EQ(encode_ok(Value("hello")), "5:hello,");
    EXPECT_EQ(encode_ok(Value("")), "0:,");
}

TEST(EncoderTest, IntegerExtremes) {
    EXPECT_EQ(encode_ok(Value(std::numeric_limits<int64_t>::min())),
              "20:-9223372036854775808#");
    EXPECT_EQ(encode_ok(Value(std::numeric_limits<uint64_t>::max())),
              "20:18446744073709551615#");
}

TEST(EncoderTest, BinaryString) {
    std::string bytes("a\0b", 3);
    EXPECT_EQ(encode_ok(Value(bytes)), std::string("3:a\0b,", 6));
}

// ============================================================================
// Aggregates
// ============================================================================

TEST(EncoderTest, List) {
    List items;
    items.emplace_back("hello");
    items.emplace_back("world");
    EXPECT_EQ(encode_ok(Value(std::move(items))), "18:5:hello,5:world,]");
}

TEST(EncoderTest, EmptyAggregates) {
    EXPECT_EQ(encode_ok(Value(List{})), "0:]");
    EXPECT_EQ(encode_ok(Value(Dict{})), "0:}");
}

TEST(EncoderTest, DictionaryKeepsOrderAndDuplicates) {
    Dict entries;
    entries.emplace_back("b", Value(1));
    entries.emplace_back("a", Value(2));
    entries.emplace_back("b", Value(3));
    EXPECT_EQ(encode_ok(Value(std::move(entries))), "24:1:b,1:1#1:a,1:2#1:b,1:3#}");
}

TEST(EncoderTest, Nested) {
    List tags;
    tags.emplace_back("a");
    tags.emplace_back("b");
    Dict inner;
    inner.emplace_back("x", Value(1));
    Dict outer;
    outer.emplace_back("tags", Value(std::move(tags)));
    outer.emplace_back("n", Value(std::move(inner)));

    EXPECT_EQ(encode_ok(Value(std::move(outer))), "33:4:tags,8:1:a,1:b,]1:n,8:1:x,1:1#}}");
}

// ============================================================================
// Round Trips
// ============================================================================

TEST(EncoderTest, RoundTripMixedTree) {
    List items;
    items.emplace_back();
    items.emplace_back(true);
    items.emplace_back(std::numeric_limits<int64_t>::min());
    items.emplace_back(std::numeric_limits<uint64_t>::max());
    items.emplace_back(0.1);
    items.emplace_back(std::string("\x00\xff", 2));
    Dict entries;
    entries.emplace_back("items", Value(std::move(items)));
    entries.emplace_back("", Value(Dict{}));
    Value original(std::move(entries));

    EXPECT_EQ(round_trip(original), original);
}

TEST(EncoderTest, RoundTripPreservesFloatBits) {
    const double samples[] = {-0.0, 0.0, 1.0 / 3.0, 5e-324, 1.7976931348623157e308, -123.456};
    for (double sample : samples) {
        Value back = round_trip(Value(sample));
        ASSERT_TRUE(back.is_float());
        double decoded = back.as_float();
        EXPECT_EQ(std::memcmp(&decoded, &sample, sizeof(double)), 0) << sample;
    }
}

TEST(EncoderTest, NegativeZeroKeepsSign) {
    EXPECT_EQ(encode_ok(Value(-0.0)), "2:-0^");
    EXPECT_TRUE(std::signbit(round_trip(Value(-0.0)).as_float()));
}

TEST(EncoderTest, ReencodingIsCanonical) {
    // Non-canonical but valid float text decodes, then re-encodes canonically
    auto decoded = decode("16:5:1.500^5:1.0e2^]");
    ASSERT_TRUE(is_ok(decoded)) << unwrap_err(decoded);

    std::string once = encode_ok(unwrap(decoded));
    EXPECT_EQ(once, "12:3:1.5^3:100^]");

    auto again = decode(once);
    ASSERT_TRUE(is_ok(again));
    EXPECT_EQ(encode_ok(unwrap(again)), once);
}

// ============================================================================
// Errors
// ============================================================================

TEST(EncoderTest, NaNIsRejected) {
    auto result = encode(Value(std::numeric_limits<double>::quiet_NaN()));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Type);
}

TEST(EncoderTest, InfinityInsideListIsRejected) {
    List items;
    items.emplace_back(1);
    items.emplace_back(std::numeric_limits<double>::infinity());
    auto result = encode(Value(std::move(items)));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Type);
}

TEST(EncoderTest, DepthLimit) {
    EncoderConfig config;
    config.max_depth = 4;

    EXPECT_TRUE(is_ok(encode(nested_value(4), config)));

    auto result = encode(nested_value(5), config);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::DepthExceeded);
}

TEST(EncoderTest, DefaultDepthMatchesDecoder) {
    auto at_limit = encode(nested_value(EncoderConfig::DEFAULT_MAX_DEPTH));
    ASSERT_TRUE(is_ok(at_limit));
    EXPECT_TRUE(is_ok(decode(unwrap(at_limit))));

    EXPECT_TRUE(is_err(encode(nested_value(EncoderConfig::DEFAULT_MAX_DEPTH + 1))));
}

// ============================================================================
// encode_to
// ============================================================================

TEST(EncoderTest, EncodeToAppends) {
    std::string out = "prefix";
    auto written = encode_to(Value("abc"), out);
    ASSERT_TRUE(is_ok(written)) << unwrap_err(written);
    EXPECT_EQ(unwrap(written), 6u);
    EXPECT_EQ(out, "prefix3:abc,");
}

TEST(EncoderTest, EncodeToLeavesOutputOnFailure) {
    List items;
    items.emplace_back("ok");
    items.emplace_back(std::numeric_limits<double>::quiet_NaN());

    std::string out = "keep";
    auto written = encode_to(Value(std::move(items)), out);
    EXPECT_TRUE(is_err(written));
    EXPECT_EQ(out, "keep");
}

TEST(EncoderTest, BackToBackFramesDecodeWithPrefix) {
    std::string stream;
    ASSERT_TRUE(is_ok(encode_to(Value(1), stream)));
    ASSERT_TRUE(is_ok(encode_to(Value("two"), stream)));

    auto first = decode_prefix(stream);
    ASSERT_TRUE(is_ok(first));
    EXPECT_EQ(unwrap(first).value.as_i64(), 1);

    auto second = decode_prefix(std::string_view(stream).substr(unwrap(first).consumed));
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(second).value.as_string(), "two");
}
