//! # Framer
//!
//! Extracts a single `length ":" payload tag` frame from a byte buffer. The
//! framer does not look inside payloads and never recurses; the decoder calls
//! it once per frame at every nesting level.
//!
//! ## Wire Grammar
//!
//! ```text
//! frame   := length ":" payload tag
//! length  := "0" | [1-9] [0-9]*
//! tag     := "," | "#" | "^" | "!" | "~" | "]" | "}"
//! payload := exactly `length` raw bytes
//! ```
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_frame("5:hello,", 0);
//! const Frame& frame = unwrap(result);
//! // frame.tag == Tag::String, frame.length == 5, frame.next_offset == 8
//! ```

#pragma once

#include "tnet/common.hpp"
#include "tnet/error.hpp"
#include "tnet/value.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace tnet {

/// The type tag byte that terminates every frame.
enum class Tag : char {
    String = ',',
    Integer = '#',
    Float = '^',
    Boolean = '!',
    Null = '~',
    List = ']',
    Dict = '}'
};

/// Maps a byte to its tag, or `std::nullopt` for any other byte.
[[nodiscard]] auto tag_from_byte(char byte) -> std::optional<Tag>;

/// The tag a value of the given kind is written with.
[[nodiscard]] auto tag_for(ValueKind kind) -> Tag;

/// The value kind a tag decodes to.
[[nodiscard]] auto tag_kind(Tag tag) -> ValueKind;

[[nodiscard]] inline auto tag_byte(Tag tag) -> char {
    return static_cast<char>(tag);
}

[[nodiscard]] inline auto is_aggregate(Tag tag) -> bool {
    return tag == Tag::List || tag == Tag::Dict;
}

/// One framed record located inside a buffer.
///
/// All positions are byte offsets into the buffer passed to `parse_frame`.
/// The payload occupies `[payload_start, payload_end)`; the tag byte sits at
/// `payload_end`.
struct Frame {
    size_t start = 0;         ///< Offset of the first length digit
    size_t length = 0;        ///< Declared payload length
    Tag tag = Tag::Null;      ///< Type tag
    size_t payload_start = 0; ///< Offset just past the ':'
    size_t payload_end = 0;   ///< `payload_start + length`
    size_t next_offset = 0;   ///< Offset just past the tag byte

    /// Returns the payload bytes as a view into `buffer`.
    [[nodiscard]] auto payload(std::string_view buffer) const -> std::string_view {
        return buffer.substr(payload_start, length);
    }
};

/// Parses the frame that starts at `offset`.
///
/// # Arguments
///
/// * `buffer` - The complete input; nothing outside it is read
/// * `offset` - Where the frame's length prefix begins
///
/// # Returns
///
/// The frame, or a `Framing` error for a missing, malformed, zero-padded or
/// overflowing length, a missing `:`, a truncated payload, or a missing or
/// unknown tag byte.
[[nodiscard]] auto parse_frame(std::string_view buffer, size_t offset) -> Result<Frame, Error>;

/// Parses a child frame that must end before `limit`, its parent's payload end.
///
/// The length prefix and tag are read only from `buffer[offset, limit)`. A
/// declared payload that leaves no room for the tag before `limit` is a
/// `Structural` error at `offset`; other malformations are `Framing` errors
/// as in `parse_frame`.
[[nodiscard]] auto parse_child_frame(std::string_view buffer, size_t offset, size_t limit)
    -> Result<Frame, Error>;

/// Writes `length ":" payload tag` onto the end of `out`.
void write_frame(std::string& out, std::string_view payload, Tag tag);

} // namespace tnet
