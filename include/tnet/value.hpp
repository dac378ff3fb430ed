//! # Value Types
//!
//! This module provides the value model shared by the decoder and encoder:
//! `Integer` for exact integer storage and `Value` as the tagged union of
//! every kind a typed netstring can carry.
//!
//! ## Kinds
//!
//! | Kind | Wire tag | C++ Storage |
//! |------|----------|-------------|
//! | Null | `~` | `std::monostate` |
//! | Boolean | `!` | `bool` |
//! | Integer | `#` | `Integer` |
//! | Float | `^` | `double` |
//! | String | `,` | `std::string` (raw bytes) |
//! | List | `]` | `Box<List>` |
//! | Dict | `}` | `Box<Dict>` |
//!
//! ## Integer Range
//!
//! Integers cover `[-2^63, 2^64 - 1]`. Values that fit `int64_t` are always
//! stored signed; only values above `INT64_MAX` use the unsigned field, so
//! each number has exactly one representation.
//!
//! ## Immutability
//!
//! `Value` exposes read-only accessors. A tree is built once, by the decoder,
//! the `ValueBuilder` or direct construction, and then only read.
//!
//! ## Example
//!
//! ```cpp
//! Dict fields;
//! fields.emplace_back("name", Value("Alice"));
//! fields.emplace_back("age", Value(30));
//! Value user(std::move(fields));
//!
//! if (const Value* name = user.get("name")) {
//!     std::cout << name->as_string() << std::endl;
//! }
//! ```

#pragma once

#include "tnet/common.hpp"

#include <cstdint>
#include <iosfwd>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tnet {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

class Value;

/// An ordered sequence of values.
using List = std::vector<Value>;

/// One dictionary entry: a byte-string key and its value.
using DictEntry = std::pair<std::string, Value>;

/// An ordered sequence of key/value pairs. Duplicate keys are allowed and kept
/// in their original positions.
using Dict = std::vector<DictEntry>;

/// The kind of a `Value`, in variant index order.
enum class ValueKind : uint8_t { Null, Boolean, Integer, Float, String, List, Dict };

/// Returns a lowercase name for a value kind (e.g., "integer").
auto value_kind_name(ValueKind kind) -> const char*;

// ============================================================================
// Integer
// ============================================================================

/// Exact integer storage covering `[-2^63, 2^64 - 1]`.
///
/// Construction normalizes: an unsigned value that fits `int64_t` is stored
/// as `Signed`, so two equal numbers always share a kind.
struct Integer {
    enum class Kind : uint8_t {
        Signed,  ///< `i64` is active
        Unsigned ///< `u64` is active, value > INT64_MAX
    };

    Kind kind;

    union {
        int64_t i64;
        uint64_t u64;
    };

    Integer() : kind(Kind::Signed), i64(0) {}

    explicit Integer(int value) : kind(Kind::Signed), i64(value) {}

    explicit Integer(int64_t value) : kind(Kind::Signed), i64(value) {}

    /// Stored signed when `value <= INT64_MAX`.
    explicit Integer(uint64_t value) : kind(Kind::Signed), i64(0) {
        if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            i64 = static_cast<int64_t>(value);
        } else {
            kind = Kind::Unsigned;
            u64 = value;
        }
    }

    [[nodiscard]] auto is_negative() const -> bool {
        return kind == Kind::Signed && i64 < 0;
    }

    /// Returns the value as `int64_t`, or `std::nullopt` above `INT64_MAX`.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (kind == Kind::Signed) {
            return i64;
        }
        return std::nullopt;
    }

    /// Returns the value as `uint64_t`, or `std::nullopt` if negative.
    [[nodiscard]] auto try_as_u64() const -> std::optional<uint64_t> {
        if (kind == Kind::Unsigned) {
            return u64;
        }
        if (i64 >= 0) {
            return static_cast<uint64_t>(i64);
        }
        return std::nullopt;
    }

    [[nodiscard]] auto try_as_i32() const -> std::optional<int32_t> {
        auto val = try_as_i64();
        if (val && *val >= std::numeric_limits<int32_t>::min() &&
            *val <= std::numeric_limits<int32_t>::max()) {
            return static_cast<int32_t>(*val);
        }
        return std::nullopt;
    }

    [[nodiscard]] auto try_as_u32() const -> std::optional<uint32_t> {
        auto val = try_as_u64();
        if (val && *val <= std::numeric_limits<uint32_t>::max()) {
            return static_cast<uint32_t>(*val);
        }
        return std::nullopt;
    }

    /// Converts to `double`; large magnitudes may lose precision.
    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Signed ? static_cast<double>(i64) : static_cast<double>(u64);
    }

    [[nodiscard]] auto operator==(const Integer& other) const -> bool {
        if (kind != other.kind) {
            return false;
        }
        return kind == Kind::Signed ? i64 == other.i64 : u64 == other.u64;
    }

    [[nodiscard]] auto operator!=(const Integer& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Value
// ============================================================================

/// A decoded or application-built typed netstring value.
///
/// `Value` is move-only because lists and dictionaries own their children
/// through `Box`. Use `clone()` for a deep copy.
///
/// # Example
///
/// ```cpp
/// Value items(List{});
/// Value count(42);
/// Value ratio(0.5);
/// Value raw(std::string("\x00\x01", 2));
///
/// if (count.is_integer()) {
///     int64_t n = count.as_i64();
/// }
/// ```
class Value {
public:
    /// The null type (empty state).
    using Null = std::monostate;

    /// The variant type holding all possible values, in `ValueKind` order.
    using ValueVariant = std::variant<Null,        // ~
                                      bool,        // !
                                      Integer,     // #
                                      double,      // ^
                                      std::string, // ,
                                      Box<List>,   // ]
                                      Box<Dict>>;  // }

    // ========================================================================
    // Constructors
    // ========================================================================

    Value() : data(Null{}) {}

    explicit Value(std::nullptr_t) : data(Null{}) {}

    explicit Value(bool value) : data(value) {}

    explicit Value(Integer value) : data(value) {}

    explicit Value(int value) : data(Integer(value)) {}

    explicit Value(int64_t value) : data(Integer(value)) {}

    explicit Value(uint64_t value) : data(Integer(value)) {}

    explicit Value(double value) : data(value) {}

    explicit Value(const char* value) : data(std::string(value)) {}

    explicit Value(std::string value) : data(std::move(value)) {}

    explicit Value(std::string_view value) : data(std::string(value)) {}

    explicit Value(List value) : data(make_box<List>(std::move(value))) {}

    explicit Value(Dict value) : data(make_box<Dict>(std::move(value))) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto kind() const -> ValueKind {
        return static_cast<ValueKind>(data.index());
    }

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<Integer>(data);
    }

    [[nodiscard]] auto is_float() const -> bool {
        return std::holds_alternative<double>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_list() const -> bool {
        return std::holds_alternative<Box<List>>(data);
    }

    [[nodiscard]] auto is_dict() const -> bool {
        return std::holds_alternative<Box<Dict>>(data);
    }

    // ========================================================================
    // Type Accessors
    // ========================================================================
    //
    // Each accessor throws `std::bad_variant_access` when the value holds a
    // different kind.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_integer() const -> const Integer& {
        return std::get<Integer>(data);
    }

    [[nodiscard]] auto as_float() const -> double {
        return std::get<double>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_list() const -> const List& {
        return *std::get<Box<List>>(data);
    }

    [[nodiscard]] auto as_dict() const -> const Dict& {
        return *std::get<Box<Dict>>(data);
    }

    // ========================================================================
    // Integer Convenience Accessors
    // ========================================================================

    [[nodiscard]] auto as_i64() const -> int64_t {
        auto opt = as_integer().try_as_i64();
        if (!opt) {
            throw std::runtime_error("integer value cannot be converted to int64_t");
        }
        return *opt;
    }

    [[nodiscard]] auto as_u64() const -> uint64_t {
        auto opt = as_integer().try_as_u64();
        if (!opt) {
            throw std::runtime_error("integer value cannot be converted to uint64_t");
        }
        return *opt;
    }

    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (auto* num = std::get_if<Integer>(&data)) {
            return num->try_as_i64();
        }
        return std::nullopt;
    }

    [[nodiscard]] auto try_as_u64() const -> std::optional<uint64_t> {
        if (auto* num = std::get_if<Integer>(&data)) {
            return num->try_as_u64();
        }
        return std::nullopt;
    }

    // ========================================================================
    // Dictionary Access
    // ========================================================================

    /// Returns the value of the first pair whose key equals `key`, or
    /// `nullptr` if there is none or this is not a dictionary.
    [[nodiscard]] auto get(std::string_view key) const -> const Value*;

    /// Returns every value stored under `key`, in order.
    [[nodiscard]] auto get_all(std::string_view key) const -> std::vector<const Value*>;

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return get(key) != nullptr;
    }

    // ========================================================================
    // List Access
    // ========================================================================

    /// Returns the list element at `index`; throws `std::out_of_range`.
    [[nodiscard]] auto operator[](size_t index) const -> const Value& {
        return as_list().at(index);
    }

    /// Number of list elements or dictionary pairs; 0 for scalars.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* list = std::get_if<Box<List>>(&data)) {
            return (*list)->size();
        }
        if (auto* dict = std::get_if<Box<Dict>>(&data)) {
            return (*dict)->size();
        }
        return 0;
    }

    // ========================================================================
    // Display
    // ========================================================================

    /// Renders a human-readable form such as `{"id": 7, "tags": ["a"]}`.
    ///
    /// This is not the wire format; use `encode()` for that.
    [[nodiscard]] auto to_display_string() const -> std::string;

    auto write_to(std::ostream& os) const -> std::ostream&;

    // ========================================================================
    // Cloning and Comparison
    // ========================================================================

    /// Deep copy of the whole tree.
    [[nodiscard]] auto clone() const -> Value;

    /// Structural equality. Dictionaries compare pair by pair in order and
    /// floats compare with IEEE `==`.
    [[nodiscard]] auto operator==(const Value& other) const -> bool;

    [[nodiscard]] auto operator!=(const Value& other) const -> bool {
        return !(*this == other);
    }

    /// Read-only view of the underlying storage, for `std::visit`.
    [[nodiscard]] auto variant() const -> const ValueVariant& {
        return data;
    }

private:
    ValueVariant data;
};

auto operator<<(std::ostream& os, const Value& value) -> std::ostream&;

// ============================================================================
// Factory Functions
// ============================================================================

inline auto tnet_null() -> Value {
    return Value();
}

inline auto tnet_bool(bool value) -> Value {
    return Value(value);
}

inline auto tnet_int(int64_t value) -> Value {
    return Value(value);
}

inline auto tnet_uint(uint64_t value) -> Value {
    return Value(value);
}

inline auto tnet_float(double value) -> Value {
    return Value(value);
}

inline auto tnet_string(std::string value) -> Value {
    return Value(std::move(value));
}

inline auto tnet_list(List items = {}) -> Value {
    return Value(std::move(items));
}

inline auto tnet_dict(Dict entries = {}) -> Value {
    return Value(std::move(entries));
}

} // namespace tnet
