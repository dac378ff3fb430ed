//! # Encoder
//!
//! Serializes a `Value` tree to typed-netstring bytes.
//!
//! Encoding is a post-order walk: a list or dictionary's children are written
//! completely before the aggregate's own length prefix, because the prefix is
//! the byte length of everything inside it.
//!
//! ## Output Rules
//!
//! | Kind | Payload |
//! |------|---------|
//! | Null | empty |
//! | Boolean | `true` / `false` |
//! | Integer | canonical decimal |
//! | Float | shortest round-trip decimal |
//! | String | raw bytes |
//! | List | concatenated child frames |
//! | Dict | key frame then value frame, for each pair in order |
//!
//! ## Example
//!
//! ```cpp
//! List items;
//! items.emplace_back("hello");
//! items.emplace_back("world");
//!
//! auto bytes = encode(Value(std::move(items)));
//! // unwrap(bytes) == "18:5:hello,5:world,]"
//! ```

#pragma once

#include "tnet/common.hpp"
#include "tnet/error.hpp"
#include "tnet/value.hpp"

#include <cstddef>
#include <string>

namespace tnet {

/// Bounds applied while encoding an application-built tree.
struct EncoderConfig {
    static constexpr size_t DEFAULT_MAX_DEPTH = 512;

    /// Deepest aggregate nesting that will be written.
    size_t max_depth = DEFAULT_MAX_DEPTH;
};

/// Encodes a value to a new byte string.
///
/// # Returns
///
/// The encoded bytes, a `Type` error for a NaN or infinite float anywhere in
/// the tree, or `DepthExceeded` when nesting passes `config.max_depth`.
[[nodiscard]] auto encode(const Value& value, const EncoderConfig& config = {})
    -> Result<std::string, Error>;

/// Encodes a value onto the end of `out`.
///
/// `out` is left untouched when encoding fails.
///
/// # Returns
///
/// The number of bytes appended.
[[nodiscard]] auto encode_to(const Value& value, std::string& out,
                             const EncoderConfig& config = {}) -> Result<size_t, Error>;

} // namespace tnet
