//! # Framer Tests
//!
//! Covers frame extraction at arbitrary offsets, every framing error, and
//! frame writing.

#include "tnet/framer.hpp"

#include <gtest/gtest.h>

using namespace tnet;

namespace {

/// Parses a frame that must fail and returns the error.
auto frame_error(std::string_view input, size_t offset = 0) -> Error {
    auto result = parse_frame(input, offset);
    EXPECT_TRUE(is_err(result)) << "expected framing error for: " << input;
    if (is_err(result)) {
        return unwrap_err(result);
    }
    return Error{};
}

} // namespace

// ============================================================================
// Successful Framing
// ============================================================================

TEST(FramerTest, StringFrame) {
    auto result = parse_frame("5:hello,", 0);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);

    const Frame& frame = unwrap(result);
    EXPECT_EQ(frame.start, 0u);
    EXPECT_EQ(frame.length, 5u);
    EXPECT_EQ(frame.tag, Tag::String);
    EXPECT_EQ(frame.payload_start, 2u);
    EXPECT_EQ(frame.payload_end, 7u);
    EXPECT_EQ(frame.next_offset, 8u);
    EXPECT_EQ(frame.payload("5:hello,"), "hello");
}

TEST(FramerTest, EmptyPayload) {
    auto result = parse_frame("0:~", 0);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).length, 0u);
    EXPECT_EQ(unwrap(result).tag, Tag::Null);
    EXPECT_EQ(unwrap(result).next_offset, 3u);
}

TEST(FramerTest, FrameAtOffset) {
    std::string_view input = "3:abc,5:hello,";
    auto result = parse_frame(input, 6);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);

    const Frame& frame = unwrap(result);
    EXPECT_EQ(frame.start, 6u);
    EXPECT_EQ(frame.payload(input), "hello");
    EXPECT_EQ(frame.next_offset, input.size());
}

TEST(FramerTest, AllTags) {
    EXPECT_EQ(unwrap(parse_frame("0:,", 0)).tag, Tag::String);
    EXPECT_EQ(unwrap(parse_frame("1:1#", 0)).tag, Tag::Integer);
    EXPECT_EQ(unwrap(parse_frame("3:1.5^", 0)).tag, Tag::Float);
    EXPECT_EQ(unwrap(parse_frame("4:true!", 0)).tag, Tag::Boolean);
    EXPECT_EQ(unwrap(parse_frame("0:~", 0)).tag, Tag::Null);
    EXPECT_EQ(unwrap(parse_frame("0:]", 0)).tag, Tag::List);
    EXPECT_EQ(unwrap(parse_frame("0:}", 0)).tag, Tag::Dict);
}

TEST(FramerTest, PayloadIsNotInspected) {
    // The framer only counts bytes; nested colons and tags are payload
    std::string_view input = std::string_view("6:1:a,\0:,", 9);
    auto result = parse_frame(input, 0);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).payload(input), std::string_view("1:a,\0:", 6));
}

TEST(FramerTest, MultiDigitLength) {
    std::string input = "12:hello world!,";
    auto result = parse_frame(input, 0);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).length, 12u);
}

// ============================================================================
// Framing Errors
// ============================================================================

TEST(FramerTest, EmptyInput) {
    auto error = frame_error("");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.offset, 0u);
    EXPECT_NE(error.message.find("missing length"), std::string::npos);
}

TEST(FramerTest, OffsetAtEnd) {
    auto error = frame_error("0:~", 3);
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.offset, 3u);
}

TEST(FramerTest, MissingLengthDigits) {
    auto error = frame_error(":~");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.message, "missing length before ':'");
}

TEST(FramerTest, NonDigitInsteadOfLength) {
    auto error = frame_error("abc");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.message, "missing length: found 'a'");
}

TEST(FramerTest, LeadingZero) {
    auto error = frame_error("05:hello,");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.message, "leading zero in length prefix");
}

TEST(FramerTest, InvalidLengthCharacter) {
    auto error = frame_error("3x:abc,");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.offset, 1u);
    EXPECT_NE(error.message.find("'x'"), std::string::npos);
}

TEST(FramerTest, SignIsNotALengthDigit) {
    EXPECT_EQ(frame_error("-1:a,").kind, ErrorKind::Framing);
    EXPECT_EQ(frame_error("+1:a,").kind, ErrorKind::Framing);
    EXPECT_EQ(frame_error(" 1:a,").kind, ErrorKind::Framing);
}

TEST(FramerTest, MissingColon) {
    auto error = frame_error("123");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.message, "missing ':' after length");
    EXPECT_EQ(error.offset, 3u);
}

TEST(FramerTest, LengthOverflow) {
    auto error = frame_error("99999999999999999999999999:x,");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.message, "length overflow");
}

TEST(FramerTest, TruncatedPayload) {
    auto error = frame_error("5:abc,");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.offset, 2u);
    EXPECT_EQ(error.message, "truncated payload: declared 5 bytes, 4 available");
}

TEST(FramerTest, MissingTag) {
    auto error = frame_error("3:abc");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.offset, 5u);
    EXPECT_EQ(error.message, "truncated frame: missing tag byte");

    // The declared length swallows what was meant to be the tag
    EXPECT_EQ(frame_error("2:5#").kind, ErrorKind::Framing);
}

TEST(FramerTest, UnknownTag) {
    auto error = frame_error("3:abcx");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_EQ(error.offset, 5u);
    EXPECT_EQ(error.message, "unknown tag 'x'");
}

TEST(FramerTest, UnknownNonPrintableTag) {
    auto error = frame_error(std::string_view("0:\x01", 3));
    EXPECT_EQ(error.message, "unknown tag 0x01");
}

TEST(FramerTest, LargeDeclaredLengthOnShortInput) {
    auto error = frame_error("4294967296:x,");
    EXPECT_EQ(error.kind, ErrorKind::Framing);
    EXPECT_NE(error.message.find("truncated payload"), std::string::npos);
}

// ============================================================================
// Child Frames
// ============================================================================

TEST(FramerTest, ChildInsideParent) {
    std::string_view input = "8:5:hello,]";
    auto result = parse_child_frame(input, 2, 10);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).payload(input), "hello");
    EXPECT_EQ(unwrap(result).next_offset, 10u);
}

TEST(FramerTest, ChildPayloadPastParentIsStructural) {
    auto result = parse_child_frame("6:9:abc,]", 2, 8);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Structural);
    EXPECT_EQ(unwrap_err(result).offset, 2u);
}

TEST(FramerTest, ChildTagOnParentEndIsStructural) {
    // "1:a" fills the parent payload, leaving the parent's ']' as its tag
    auto result = parse_child_frame("3:1:a],", 2, 5);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Structural);
    EXPECT_EQ(unwrap_err(result).offset, 2u);
}

TEST(FramerTest, ChildIgnoresBytesAfterParent) {
    // The whole buffer would satisfy the declared length
    auto result = parse_child_frame("6:9:abc,]0123456789", 2, 8);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Structural);
    EXPECT_EQ(unwrap_err(result).message,
              "child frame declares 9 payload bytes but its parent's payload ends at offset 8");
}

TEST(FramerTest, ChildHeaderErrorsStayFraming) {
    auto result = parse_child_frame("2:12]", 2, 4);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Framing);
    EXPECT_EQ(unwrap_err(result).offset, 4u);

    EXPECT_EQ(unwrap_err(parse_child_frame("3:abc]", 2, 5)).kind, ErrorKind::Framing);
}

// ============================================================================
// Tags and Writing
// ============================================================================

TEST(FramerTest, TagFromByte) {
    ASSERT_TRUE(tag_from_byte(',').has_value());
    EXPECT_EQ(*tag_from_byte(','), Tag::String);
    EXPECT_EQ(*tag_from_byte('}'), Tag::Dict);
    EXPECT_FALSE(tag_from_byte('x').has_value());
    EXPECT_FALSE(tag_from_byte(':').has_value());
}

TEST(FramerTest, TagKindMapping) {
    for (auto kind : {ValueKind::Null, ValueKind::Boolean, ValueKind::Integer, ValueKind::Float,
                      ValueKind::String, ValueKind::List, ValueKind::Dict}) {
        EXPECT_EQ(tag_kind(tag_for(kind)), kind);
    }
    EXPECT_TRUE(is_aggregate(Tag::List));
    EXPECT_TRUE(is_aggregate(Tag::Dict));
    EXPECT_FALSE(is_aggregate(Tag::String));
}

TEST(FramerTest, WriteFrame) {
    std::string out;
    write_frame(out, "hello", Tag::String);
    EXPECT_EQ(out, "5:hello,");

    write_frame(out, "", Tag::Null);
    EXPECT_EQ(out, "5:hello,0:~");

    write_frame(out, "1:7#", Tag::List);
    EXPECT_EQ(out, "5:hello,0:~4:1:7#]");
}

TEST(FramerTest, WrittenFrameParsesBack) {
    std::string payload(300, 'z');
    std::string out;
    write_frame(out, payload, Tag::String);

    auto result = parse_frame(out, 0);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).length, 300u);
    EXPECT_EQ(unwrap(result).next_offset, out.size());
}
