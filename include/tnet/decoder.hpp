//! # Decoder
//!
//! This module provides the recursive decoder that turns a complete byte
//! buffer into a `Value` tree.
//!
//! ## Features
//!
//! - **Zero-copy framing**: Frames are located with offsets into a `std::string_view`
//! - **Strict payload validation**: Integer, float, boolean and null payloads
//!   must match their grammar exactly
//! - **Depth limiting**: Nesting beyond `max_depth` fails before recursing
//! - **Size limiting**: Optional cap on cumulative scalar payload bytes
//! - **First-error reporting**: Outer frames are checked before inner ones,
//!   siblings left to right
//!
//! ## Example
//!
//! ```cpp
//! #include "tnet/decoder.hpp"
//! using namespace tnet;
//!
//! auto result = decode("18:5:hello,5:world,]");
//! if (is_ok(result)) {
//!     const Value& list = unwrap(result);
//!     std::cout << list[1].as_string() << std::endl; // world
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "tnet/common.hpp"
#include "tnet/error.hpp"
#include "tnet/framer.hpp"
#include "tnet/value.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace tnet {

/// Resource bounds applied while decoding untrusted input.
struct DecoderConfig {
    static constexpr size_t DEFAULT_MAX_DEPTH = 512;

    /// Deepest allowed aggregate nesting. A top-level list is depth 1.
    size_t max_depth = DEFAULT_MAX_DEPTH;

    /// Cap on the sum of scalar payload lengths. Aggregate payloads consist of
    /// their children's frames, so each input byte is counted at most once and
    /// a cap equal to the input length always admits the input. Unset means
    /// unbounded.
    std::optional<size_t> max_total_size;
};

/// The result of decoding one leading frame of a buffer.
struct DecodedPrefix {
    Value value;
    size_t consumed = 0; ///< Bytes used by the frame, tag included
};

/// Recursive typed-netstring decoder over one input buffer.
///
/// A `Decoder` holds only per-call state (depth and size counters), so
/// separate instances can run concurrently on different threads.
class Decoder {
public:
    explicit Decoder(std::string_view input, DecoderConfig config = {});

    /// Decodes the whole buffer as exactly one frame.
    ///
    /// # Returns
    ///
    /// The value, or the first error found. Bytes after the top-level frame
    /// are a `TrailingData` error.
    [[nodiscard]] auto decode() -> Result<Value, Error>;

    /// Decodes the frame at the start of the buffer and reports its length,
    /// leaving any following bytes for the caller.
    [[nodiscard]] auto decode_prefix() -> Result<DecodedPrefix, Error>;

    /// Sum of scalar payload lengths framed by the last call.
    [[nodiscard]] auto total_payload_bytes() const -> size_t {
        return total_size_;
    }

private:
    std::string_view input_;
    DecoderConfig config_;
    size_t depth_ = 0;
    size_t total_size_ = 0;

    /// Frames the record at `offset`, inside `parent_end` for a child, and
    /// charges a scalar payload against the size limit.
    auto next_frame(size_t offset, std::optional<size_t> parent_end) -> Result<Frame, Error>;

    auto decode_frame(const Frame& frame) -> Result<Value, Error>;

    auto decode_list(const Frame& frame) -> Result<Value, Error>;

    auto decode_dict(const Frame& frame) -> Result<Value, Error>;

    auto decode_bool(const Frame& frame) const -> Result<Value, Error>;

    auto decode_null(const Frame& frame) const -> Result<Value, Error>;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Decodes a complete buffer holding exactly one frame.
[[nodiscard]] auto decode(std::string_view input, const DecoderConfig& config = {})
    -> Result<Value, Error>;

/// Decodes the first frame of `input`; the rest of the buffer is not examined.
[[nodiscard]] auto decode_prefix(std::string_view input, const DecoderConfig& config = {})
    -> Result<DecodedPrefix, Error>;

} // namespace tnet
