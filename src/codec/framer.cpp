//! # Framer Implementation
//!
//! Every check compares against the scan bound before indexing, so truncated
//! or hostile input can only produce an error. A child frame is scanned with
//! its parent's payload end as the bound and never reads past it.

#include "tnet/framer.hpp"

#include <charconv>
#include <iomanip>
#include <limits>
#include <sstream>

namespace tnet {

namespace {

auto framing_error(std::string msg, size_t offset) -> Error {
    return Error::make(ErrorKind::Framing, std::move(msg), offset);
}

/// Describes a byte for an error message: `'x'` when printable, `0xNN` otherwise.
auto describe_byte(char byte) -> std::string {
    auto b = static_cast<unsigned char>(byte);
    if (b >= 0x20 && b < 0x7f) {
        return std::string("'") + byte + "'";
    }
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
    return oss.str();
}

} // namespace

auto tag_from_byte(char byte) -> std::optional<Tag> {
    switch (byte) {
    case ',':
        return Tag::String;
    case '#':
        return Tag::Integer;
    case '^':
        return Tag::Float;
    case '!':
        return Tag::Boolean;
    case '~':
        return Tag::Null;
    case ']':
        return Tag::List;
    case '}':
        return Tag::Dict;
    default:
        return std::nullopt;
    }
}

auto tag_for(ValueKind kind) -> Tag {
    switch (kind) {
    case ValueKind::Null:
        return Tag::Null;
    case ValueKind::Boolean:
        return Tag::Boolean;
    case ValueKind::Integer:
        return Tag::Integer;
    case ValueKind::Float:
        return Tag::Float;
    case ValueKind::String:
        return Tag::String;
    case ValueKind::List:
        return Tag::List;
    case ValueKind::Dict:
        return Tag::Dict;
    }
    return Tag::Null;
}

auto tag_kind(Tag tag) -> ValueKind {
    switch (tag) {
    case Tag::String:
        return ValueKind::String;
    case Tag::Integer:
        return ValueKind::Integer;
    case Tag::Float:
        return ValueKind::Float;
    case Tag::Boolean:
        return ValueKind::Boolean;
    case Tag::Null:
        return ValueKind::Null;
    case Tag::List:
        return ValueKind::List;
    case Tag::Dict:
        return ValueKind::Dict;
    }
    return ValueKind::Null;
}

namespace {

/// Scans one frame inside `buffer[offset, end)`. When `parent_end` is set the
/// frame is a child, and a payload or tag running past it is Structural.
auto scan_frame(std::string_view buffer, size_t offset, size_t end,
                std::optional<size_t> parent_end) -> Result<Frame, Error> {
    if (offset >= end) {
        return framing_error("missing length: unexpected end of input", offset);
    }

    // Length prefix
    size_t pos = offset;
    while (pos < end && buffer[pos] >= '0' && buffer[pos] <= '9') {
        ++pos;
    }
    size_t digits = pos - offset;

    if (pos == end) {
        if (digits == 0) {
            return framing_error("missing length", offset);
        }
        return framing_error("missing ':' after length", pos);
    }
    if (buffer[pos] != ':') {
        if (digits == 0) {
            return framing_error("missing length: found " + describe_byte(buffer[pos]), pos);
        }
        return framing_error("invalid character " + describe_byte(buffer[pos]) +
                                 " in length prefix",
                             pos);
    }
    if (digits == 0) {
        return framing_error("missing length before ':'", offset);
    }
    if (digits > 1 && buffer[offset] == '0') {
        return framing_error("leading zero in length prefix", offset);
    }

    size_t length = 0;
    auto [ptr, ec] = std::from_chars(buffer.data() + offset, buffer.data() + pos, length);
    if (ec != std::errc{} || ptr != buffer.data() + pos) {
        return framing_error("length overflow", offset);
    }

    // Payload
    size_t payload_start = pos + 1;
    size_t remaining = end - payload_start;
    if (parent_end && length >= remaining) {
        return Error::make(ErrorKind::Structural,
                           "child frame declares " + std::to_string(length) +
                               " payload bytes but its parent's payload ends at offset " +
                               std::to_string(*parent_end),
                           offset);
    }
    if (length > remaining) {
        return framing_error("truncated payload: declared " + std::to_string(length) +
                                 " bytes, " + std::to_string(remaining) + " available",
                             payload_start);
    }
    size_t payload_end = payload_start + length;

    // Tag
    if (payload_end == end) {
        return framing_error("truncated frame: missing tag byte", payload_end);
    }
    auto tag = tag_from_byte(buffer[payload_end]);
    if (!tag) {
        return framing_error("unknown tag " + describe_byte(buffer[payload_end]), payload_end);
    }

    Frame frame;
    frame.start = offset;
    frame.length = length;
    frame.tag = *tag;
    frame.payload_start = payload_start;
    frame.payload_end = payload_end;
    frame.next_offset = payload_end + 1;
    return frame;
}

} // namespace

auto parse_frame(std::string_view buffer, size_t offset) -> Result<Frame, Error> {
    return scan_frame(buffer, offset, buffer.size(), std::nullopt);
}

auto parse_child_frame(std::string_view buffer, size_t offset, size_t limit)
    -> Result<Frame, Error> {
    if (limit > buffer.size()) {
        limit = buffer.size();
    }
    return scan_frame(buffer, offset, limit, limit);
}

void write_frame(std::string& out, std::string_view payload, Tag tag) {
    out += std::to_string(payload.size());
    out += ':';
    out += payload;
    out += tag_byte(tag);
}

} // namespace tnet
