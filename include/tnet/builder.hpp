//! # Value Builder
//!
//! This module provides a fluent API for constructing `Value` trees
//! programmatically. The builder keeps a stack of open lists and
//! dictionaries, so the call chain mirrors the shape of the tree.
//!
//! ## Usage Pattern
//!
//! 1. Start with `list()` or `dict()` (or a single `item()` for a scalar)
//! 2. Inside a list, call `item()` for each element
//! 3. Inside a dictionary, call `key()` before every value
//! 4. Call `end()` to close each list or dictionary
//! 5. Call `build()` to take the finished `Value`
//!
//! ## Example
//!
//! ```cpp
//! #include "tnet/builder.hpp"
//! using namespace tnet;
//!
//! Value user = ValueBuilder()
//!     .dict()
//!         .key("name").item("Alice")
//!         .key("age").item(30)
//!         .key("tags").list()
//!             .item("admin")
//!             .item("ops")
//!         .end()
//!     .end()
//!     .build();
//!
//! // encode(user) == "51:4:name,5:Alice,3:age,2:30#4:tags,14:5:admin,3:ops,]}"
//! ```
//!
//! Calling a method where it does not fit (a value in a dictionary with no
//! pending key, `end()` with nothing open, `build()` with an unclosed
//! aggregate) throws `std::logic_error`.

#pragma once

#include "tnet/value.hpp"

#include <cstdint>
#include <optional>
#include <stack>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tnet {

/// Fluent builder for `Value` trees.
///
/// # Thread Safety
///
/// The builder is not thread-safe. Each thread should use its own builder instance.
class ValueBuilder {
public:
    ValueBuilder() = default;

    // ========================================================================
    // Structure Methods
    // ========================================================================

    /// Opens a list. Inside a dictionary it becomes the value of the pending key.
    auto list() -> ValueBuilder&;

    /// Opens a dictionary. Inside a dictionary it becomes the value of the
    /// pending key.
    auto dict() -> ValueBuilder&;

    /// Closes the innermost open list or dictionary.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if nothing is open or a dictionary key is
    /// still waiting for its value.
    auto end() -> ValueBuilder&;

    /// Sets the key for the next value added to the current dictionary.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` outside a dictionary or when the previous key
    /// has not received a value yet.
    auto key(std::string_view key) -> ValueBuilder&;

    // ========================================================================
    // Value Methods
    // ========================================================================

    /// Adds a value to the current list, to the current dictionary under the
    /// pending key, or as the whole result when nothing is open.
    auto item(Value value) -> ValueBuilder&;

    auto item(const char* value) -> ValueBuilder&;

    auto item(const std::string& value) -> ValueBuilder&;

    auto item(std::string_view value) -> ValueBuilder&;

    auto item(bool value) -> ValueBuilder&;

    auto item(int value) -> ValueBuilder&;

    auto item(int64_t value) -> ValueBuilder&;

    auto item(uint64_t value) -> ValueBuilder&;

    auto item(Integer value) -> ValueBuilder&;

    auto item(double value) -> ValueBuilder&;

    auto item(std::nullptr_t) -> ValueBuilder&;

    auto item_null() -> ValueBuilder&;

    // ========================================================================
    // Finalization
    // ========================================================================

    /// Takes the finished value and resets the builder.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` if an aggregate is still open or nothing has
    /// been added.
    [[nodiscard]] auto build() -> Value;

    /// Returns `true` when a value is ready and nothing is left open.
    [[nodiscard]] auto is_complete() const -> bool;

    /// Number of lists and dictionaries currently open.
    [[nodiscard]] auto depth() const -> size_t {
        return stack_.size();
    }

private:
    /// One open aggregate.
    struct Context {
        enum class Kind { List, Dict };
        Kind kind;
        List items;
        Dict entries;
        std::optional<std::string> pending_key; ///< Dict only: key waiting for a value
    };

    std::stack<Context> stack_;
    Value result_;
    bool has_result_ = false;

    void open(Context::Kind kind);

    /// Places a finished value into the current context or the result slot.
    void place(Value value);
};

} // namespace tnet
