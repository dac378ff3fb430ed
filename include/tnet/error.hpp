//! # Error Types
//!
//! This module provides the error type returned by every fallible tnet
//! operation. Errors carry a kind from a fixed taxonomy, a human-readable
//! message and the byte offset in the input where the problem was detected.
//!
//! ## Error Kinds
//!
//! | Kind | Raised when |
//! |------|-------------|
//! | `Framing` | Length digits, `:`, payload bytes or tag byte are missing or malformed |
//! | `Type` | Payload content does not match its tag (bad integer/float/boolean/null text) |
//! | `Structural` | Child overruns its parent, odd dictionary pair count, non-string key |
//! | `DepthExceeded` | Nesting exceeds the configured maximum |
//! | `SizeExceeded` | Cumulative payload bytes exceed the configured maximum |
//! | `TrailingData` | Bytes remain after the top-level frame |
//! | `Conversion` | A value cannot be converted to the requested C++ type |
//!
//! ## Example
//!
//! ```cpp
//! auto error = Error::make(ErrorKind::Framing, "truncated payload", 2);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "framing error at offset 2: truncated payload"
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace tnet {

/// Classification of a decode, encode or conversion failure.
enum class ErrorKind : uint8_t {
    Framing,       ///< Malformed or truncated frame envelope
    Type,          ///< Payload inconsistent with its tag
    Structural,    ///< Aggregate payload does not tile into child frames
    DepthExceeded, ///< Nesting deeper than the configured bound
    SizeExceeded,  ///< Cumulative payload size above the configured bound
    TrailingData,  ///< Unconsumed bytes after the top-level frame
    Conversion     ///< Value kind or range does not fit the requested type
};

/// Returns the lowercase name of an error kind (e.g., "framing").
inline auto kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::Framing:
        return "framing";
    case ErrorKind::Type:
        return "type";
    case ErrorKind::Structural:
        return "structural";
    case ErrorKind::DepthExceeded:
        return "depth exceeded";
    case ErrorKind::SizeExceeded:
        return "size exceeded";
    case ErrorKind::TrailingData:
        return "trailing data";
    case ErrorKind::Conversion:
        return "conversion";
    }
    return "unknown";
}

/// An error encountered while decoding, encoding or converting a value.
///
/// # Fields
///
/// - `kind`: Which class of failure occurred
/// - `message`: Description of what went wrong
/// - `offset`: Byte offset into the input where the problem was detected
///   (0 for errors that are not tied to input bytes)
struct Error {
    /// Failure classification.
    ErrorKind kind = ErrorKind::Framing;

    /// Human-readable error description.
    std::string message;

    /// Byte offset in the input where the error was detected.
    size_t offset = 0;

    /// Creates an error that is not tied to a position in the input.
    static auto make(ErrorKind kind, std::string msg) -> Error {
        return Error{kind, std::move(msg), 0};
    }

    /// Creates an error with the input offset where it was detected.
    ///
    /// # Arguments
    ///
    /// * `kind` - The error classification
    /// * `msg` - The error message
    /// * `offset` - Byte offset into the decoded buffer
    static auto make(ErrorKind kind, std::string msg, size_t offset) -> Error {
        return Error{kind, std::move(msg), offset};
    }

    /// Formats the error as `"<kind> error at offset N: message"`.
    ///
    /// Conversion errors have no meaningful offset and render as
    /// `"conversion error: message"`.
    [[nodiscard]] auto to_string() const -> std::string {
        std::string out = kind_name(kind);
        out += " error";
        if (kind != ErrorKind::Conversion) {
            out += " at offset " + std::to_string(offset);
        }
        out += ": ";
        out += message;
        return out;
    }

    [[nodiscard]] auto operator==(const Error& other) const -> bool = default;
};

inline auto operator<<(std::ostream& os, ErrorKind kind) -> std::ostream& {
    return os << kind_name(kind);
}

inline auto operator<<(std::ostream& os, const Error& error) -> std::ostream& {
    return os << error.to_string();
}

} // namespace tnet
