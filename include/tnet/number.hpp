//! # Numeric Text
//!
//! Conversions between the ASCII numeric payloads of `#` and `^` frames and
//! native `Integer` / `double` values.
//!
//! ## Accepted Grammar
//!
//! | Tag | Grammar |
//! |-----|---------|
//! | `#` | `-? [1-9][0-9]* \| 0` |
//! | `^` | `-? digits ( . digits )? ( [eE] [+-]? digits )?` |
//!
//! Anything else is a `Type` error carrying the payload's byte offset.
//!
//! ## Output
//!
//! Integers are written in canonical decimal. Floats are written with the
//! shortest text that parses back to the identical double, so `encode` then
//! `decode` preserves every finite bit pattern, `-0.0` included.

#pragma once

#include "tnet/common.hpp"
#include "tnet/error.hpp"
#include "tnet/value.hpp"

#include <string>
#include <string_view>

namespace tnet {

/// Parses an integer payload.
///
/// # Arguments
///
/// * `text` - The payload bytes
/// * `offset` - Byte offset of the payload in the decoded buffer, for errors
///
/// # Returns
///
/// The integer, or a `Type` error for bad syntax or a value outside
/// `[-2^63, 2^64 - 1]`.
[[nodiscard]] auto parse_integer(std::string_view text, size_t offset = 0)
    -> Result<Integer, Error>;

/// Parses a float payload.
///
/// Magnitudes that overflow `double` are a `Type` error; values that
/// underflow round to the nearest subnormal or zero.
[[nodiscard]] auto parse_float(std::string_view text, size_t offset = 0) -> Result<double, Error>;

/// Formats an integer in canonical decimal.
[[nodiscard]] auto format_integer(const Integer& value) -> std::string;

/// Formats a finite double as shortest round-trip text.
///
/// # Returns
///
/// The text, or a `Type` error for NaN and infinities, which the float
/// grammar cannot express.
[[nodiscard]] auto format_float(double value) -> Result<std::string, Error>;

/// Formats any double for display; non-finite values become `nan`, `inf`
/// or `-inf`.
[[nodiscard]] auto format_float_text(double value) -> std::string;

} // namespace tnet
