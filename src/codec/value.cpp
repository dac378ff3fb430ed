//! # Value Implementation
//!
//! This module implements equality, dictionary lookup and deep cloning for
//! `Value`. Display is in `display.cpp`; wire encoding is in `encoder.cpp`.
//!
//! ## Equality Semantics
//!
//! | Kind | Comparison Rule |
//! |------|-----------------|
//! | Null | All nulls are equal |
//! | Boolean | Standard boolean comparison |
//! | Integer | Exact comparison (see `Integer::operator==`) |
//! | Float | IEEE `==` (so `NaN != NaN` and `-0.0 == 0.0`) |
//! | String | Byte-by-byte comparison |
//! | List | Element-by-element in order |
//! | Dict | Pair-by-pair in order, keys and values both |
//!
//! Values of different kinds are never equal: `1#` and `1^` differ.

#include "tnet/value.hpp"

namespace tnet {

auto value_kind_name(ValueKind kind) -> const char* {
    switch (kind) {
    case ValueKind::Null:
        return "null";
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Integer:
        return "integer";
    case ValueKind::Float:
        return "float";
    case ValueKind::String:
        return "string";
    case ValueKind::List:
        return "list";
    case ValueKind::Dict:
        return "dict";
    }
    return "unknown";
}

auto Value::get(std::string_view key) const -> const Value* {
    if (auto* dict = std::get_if<Box<Dict>>(&data)) {
        for (const auto& [k, v] : **dict) {
            if (k == key) {
                return &v;
            }
        }
    }
    return nullptr;
}

auto Value::get_all(std::string_view key) const -> std::vector<const Value*> {
    std::vector<const Value*> found;
    if (auto* dict = std::get_if<Box<Dict>>(&data)) {
        for (const auto& [k, v] : **dict) {
            if (k == key) {
                found.push_back(&v);
            }
        }
    }
    return found;
}

auto Value::clone() const -> Value {
    switch (kind()) {
    case ValueKind::Null:
        return Value();
    case ValueKind::Boolean:
        return Value(as_bool());
    case ValueKind::Integer:
        return Value(as_integer());
    case ValueKind::Float:
        return Value(as_float());
    case ValueKind::String:
        return Value(as_string());
    case ValueKind::List: {
        List items;
        items.reserve(as_list().size());
        for (const auto& item : as_list()) {
            items.push_back(item.clone());
        }
        return Value(std::move(items));
    }
    case ValueKind::Dict: {
        Dict entries;
        entries.reserve(as_dict().size());
        for (const auto& [key, val] : as_dict()) {
            entries.emplace_back(key, val.clone());
        }
        return Value(std::move(entries));
    }
    }
    return Value();
}

/// Compares two `Value` trees for structural equality.
///
/// # Returns
///
/// `true` if both values have the same kind and equal content. Dictionary
/// entries must appear in the same order.
auto Value::operator==(const Value& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }

    switch (kind()) {
    case ValueKind::Null:
        return true;
    case ValueKind::Boolean:
        return as_bool() == other.as_bool();
    case ValueKind::Integer:
        return as_integer() == other.as_integer();
    case ValueKind::Float:
        return as_float() == other.as_float();
    case ValueKind::String:
        return as_string() == other.as_string();
    case ValueKind::List: {
        const auto& lhs = as_list();
        const auto& rhs = other.as_list();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }
    case ValueKind::Dict: {
        const auto& lhs = as_dict();
        const auto& rhs = other.as_dict();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i].first != rhs[i].first || lhs[i].second != rhs[i].second) {
                return false;
            }
        }
        return true;
    }
    }
    return false;
}

} // namespace tnet
