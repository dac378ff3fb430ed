//! # Typed Conversion
//!
//! Maps between native C++ types and `Value`, and wraps the codec so a
//! native value can be written to or read from bytes in one call.
//!
//! ## Supported Types
//!
//! | C++ Type | Value Kind | Notes |
//! |----------|------------|-------|
//! | `bool` | Boolean | |
//! | built-in integers | Integer | range-checked when reading |
//! | `float`, `double` | Float | `float` reads fail if the double does not fit |
//! | `std::string` | String | |
//! | `char` | String | exactly one byte |
//! | `std::nullptr_t` | Null | |
//! | `std::optional<T>` | Null or T | |
//! | `std::vector<T>` | List | |
//! | `std::map<std::string, T>` | Dict | last duplicate key wins |
//! | `std::pair<A, B>`, `std::tuple<Ts...>` | List | element count checked when reading |
//! | `std::variant<Ts...>` | String or Dict | needs `VariantNames` |
//! | enumerations | String | needs `EnumNames` and `EnumConverter` |
//! | `Value` | any | deep copy |
//!
//! Other types can opt in by specializing `Converter<T>` with static
//! `to_value` and `from_value` members.
//!
//! ## Variants
//!
//! A `std::variant` is written as a tagged union. A `std::monostate`
//! alternative is a unit variant and travels as its name alone; any other
//! alternative travels as a one-entry dictionary from its name to its data:
//!
//! ```cpp
//! using Shape = std::variant<std::monostate, uint32_t, std::tuple<uint32_t, uint32_t>>;
//!
//! namespace tnet {
//! template <> struct VariantNames<Shape> {
//!     static constexpr std::array<std::string_view, 3> names{"Unit", "Newtype", "Tuple"};
//! };
//! }
//!
//! serialize(Shape{});                                     // "4:Unit,"
//! serialize(Shape(std::in_place_index<1>, 1u));           // "14:7:Newtype,1:1#}"
//! serialize(Shape(std::in_place_index<2>, 1u, 2u));       // "19:5:Tuple,8:1:1#1:2#]}"
//! ```
//!
//! Plain enumerations are unit variants only. Specialize `EnumNames<E>` with
//! an `entries` table and derive `Converter<E>` from `EnumConverter<E>`.
//!
//! ## Example
//!
//! ```cpp
//! std::map<std::string, std::vector<int>> scores{{"alice", {9, 7}}};
//!
//! auto bytes = serialize(scores);
//! // unwrap(bytes) == "19:5:alice,8:1:9#1:7#]}"
//!
//! auto back = deserialize<std::map<std::string, std::vector<int>>>(unwrap(bytes));
//! ```

#pragma once

#include "tnet/common.hpp"
#include "tnet/decoder.hpp"
#include "tnet/encoder.hpp"
#include "tnet/error.hpp"
#include "tnet/number.hpp"
#include "tnet/value.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tnet {

/// Conversion between `T` and `Value`.
///
/// Specializations provide:
///
/// ```cpp
/// static auto to_value(const T& value) -> Value;
/// static auto from_value(const Value& value) -> Result<T, Error>;
/// ```
template <typename T> struct Converter;

namespace detail {

inline auto kind_mismatch(ValueKind expected, const Value& found) -> Error {
    return Error::make(ErrorKind::Conversion, std::string("expected ") +
                                                  value_kind_name(expected) + ", found " +
                                                  value_kind_name(found.kind()));
}

/// Prefixes a nested conversion error with where it happened.
inline auto nested_error(Error error, const std::string& where) -> Error {
    error.message = where + ": " + error.message;
    return error;
}

} // namespace detail

// ============================================================================
// Conversion Entry Points
// ============================================================================

/// Converts a native value to a `Value` tree.
template <typename T> [[nodiscard]] auto to_value(const T& value) -> Value {
    return Converter<T>::to_value(value);
}

/// Converts a C string to a String value.
[[nodiscard]] inline auto to_value(const char* value) -> Value {
    return Value(value);
}

/// Converts a `Value` tree to a native value.
///
/// # Returns
///
/// The converted value, or a `Conversion` error naming the expected and
/// actual kinds or the out-of-range number.
template <typename T> [[nodiscard]] auto from_value(const Value& value) -> Result<T, Error> {
    return Converter<T>::from_value(value);
}

// ============================================================================
// Scalars
// ============================================================================

template <> struct Converter<bool> {
    static auto to_value(bool value) -> Value {
        return Value(value);
    }

    static auto from_value(const Value& value) -> Result<bool, Error> {
        if (!value.is_bool()) {
            return detail::kind_mismatch(ValueKind::Boolean, value);
        }
        return value.as_bool();
    }
};

/// Shared conversion for every built-in integer type.
template <typename T> struct IntegerConverter {
    static auto to_value(T value) -> Value {
        if constexpr (std::numeric_limits<T>::is_signed) {
            return Value(static_cast<int64_t>(value));
        } else {
            return Value(static_cast<uint64_t>(value));
        }
    }

    static auto from_value(const Value& value) -> Result<T, Error> {
        if (!value.is_integer()) {
            return detail::kind_mismatch(ValueKind::Integer, value);
        }

        const Integer& number = value.as_integer();
        if constexpr (std::numeric_limits<T>::is_signed) {
            auto wide = number.try_as_i64();
            if (wide && *wide >= std::numeric_limits<T>::min() &&
                *wide <= std::numeric_limits<T>::max()) {
                return static_cast<T>(*wide);
            }
        } else {
            auto wide = number.try_as_u64();
            if (wide && *wide <= std::numeric_limits<T>::max()) {
                return static_cast<T>(*wide);
            }
        }
        return Error::make(ErrorKind::Conversion,
                           "integer " + format_integer(number) + " out of range for target type");
    }
};

template <> struct Converter<signed char> : IntegerConverter<signed char> {};
template <> struct Converter<short> : IntegerConverter<short> {};
template <> struct Converter<int> : IntegerConverter<int> {};
template <> struct Converter<long> : IntegerConverter<long> {};
template <> struct Converter<long long> : IntegerConverter<long long> {};
template <> struct Converter<unsigned char> : IntegerConverter<unsigned char> {};
template <> struct Converter<unsigned short> : IntegerConverter<unsigned short> {};
template <> struct Converter<unsigned int> : IntegerConverter<unsigned int> {};
template <> struct Converter<unsigned long> : IntegerConverter<unsigned long> {};
template <> struct Converter<unsigned long long> : IntegerConverter<unsigned long long> {};

template <> struct Converter<double> {
    static auto to_value(double value) -> Value {
        return Value(value);
    }

    static auto from_value(const Value& value) -> Result<double, Error> {
        if (!value.is_float()) {
            return detail::kind_mismatch(ValueKind::Float, value);
        }
        return value.as_float();
    }
};

template <> struct Converter<float> {
    static auto to_value(float value) -> Value {
        return Value(static_cast<double>(value));
    }

    static auto from_value(const Value& value) -> Result<float, Error> {
        if (!value.is_float()) {
            return detail::kind_mismatch(ValueKind::Float, value);
        }
        double wide = value.as_float();
        if (std::isfinite(wide) && std::fabs(wide) > std::numeric_limits<float>::max()) {
            return Error::make(ErrorKind::Conversion,
                               "float " + format_float_text(wide) + " out of range for float");
        }
        return static_cast<float>(wide);
    }
};

template <> struct Converter<std::string> {
    static auto to_value(const std::string& value) -> Value {
        return Value(value);
    }

    static auto from_value(const Value& value) -> Result<std::string, Error> {
        if (!value.is_string()) {
            return detail::kind_mismatch(ValueKind::String, value);
        }
        return value.as_string();
    }
};

/// A `char` travels as a one-byte string.
template <> struct Converter<char> {
    static auto to_value(char value) -> Value {
        return Value(std::string(1, value));
    }

    static auto from_value(const Value& value) -> Result<char, Error> {
        if (!value.is_string()) {
            return detail::kind_mismatch(ValueKind::String, value);
        }
        const auto& text = value.as_string();
        if (text.size() != 1) {
            return Error::make(ErrorKind::Conversion, "expected a one-byte string, found " +
                                                          std::to_string(text.size()) +
                                                          " bytes");
        }
        return text[0];
    }
};

template <> struct Converter<std::nullptr_t> {
    static auto to_value(std::nullptr_t) -> Value {
        return Value();
    }

    static auto from_value(const Value& value) -> Result<std::nullptr_t, Error> {
        if (!value.is_null()) {
            return detail::kind_mismatch(ValueKind::Null, value);
        }
        return nullptr;
    }
};

template <> struct Converter<Value> {
    static auto to_value(const Value& value) -> Value {
        return value.clone();
    }

    static auto from_value(const Value& value) -> Result<Value, Error> {
        return value.clone();
    }
};

// ============================================================================
// Containers
// ============================================================================

/// Null maps to `std::nullopt`; anything else converts as `T`.
template <typename T> struct Converter<std::optional<T>> {
    static auto to_value(const std::optional<T>& value) -> Value {
        if (!value) {
            return Value();
        }
        return Converter<T>::to_value(*value);
    }

    static auto from_value(const Value& value) -> Result<std::optional<T>, Error> {
        if (value.is_null()) {
            return std::optional<T>{};
        }
        auto inner = Converter<T>::from_value(value);
        if (is_err(inner)) {
            return unwrap_err(inner);
        }
        return std::optional<T>(std::move(unwrap(inner)));
    }
};

template <typename T> struct Converter<std::vector<T>> {
    static auto to_value(const std::vector<T>& values) -> Value {
        List items;
        items.reserve(values.size());
        for (const auto& item : values) {
            items.push_back(Converter<T>::to_value(item));
        }
        return Value(std::move(items));
    }

    static auto from_value(const Value& value) -> Result<std::vector<T>, Error> {
        if (!value.is_list()) {
            return detail::kind_mismatch(ValueKind::List, value);
        }

        std::vector<T> result;
        const auto& items = value.as_list();
        result.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            auto item = Converter<T>::from_value(items[i]);
            if (is_err(item)) {
                return detail::nested_error(std::move(unwrap_err(item)),
                                            "at index " + std::to_string(i));
            }
            result.push_back(std::move(unwrap(item)));
        }
        return result;
    }
};

/// Dictionaries convert to `std::map`; a repeated key keeps its last value.
template <typename T> struct Converter<std::map<std::string, T>> {
    static auto to_value(const std::map<std::string, T>& values) -> Value {
        Dict entries;
        entries.reserve(values.size());
        for (const auto& [key, item] : values) {
            entries.emplace_back(key, Converter<T>::to_value(item));
        }
        return Value(std::move(entries));
    }

    static auto from_value(const Value& value) -> Result<std::map<std::string, T>, Error> {
        if (!value.is_dict()) {
            return detail::kind_mismatch(ValueKind::Dict, value);
        }

        std::map<std::string, T> result;
        for (const auto& [key, item] : value.as_dict()) {
            auto converted = Converter<T>::from_value(item);
            if (is_err(converted)) {
                return detail::nested_error(std::move(unwrap_err(converted)),
                                            "at key '" + key + "'");
            }
            result.insert_or_assign(key, std::move(unwrap(converted)));
        }
        return result;
    }
};

// ============================================================================
// Tuples
// ============================================================================

namespace detail {

inline auto arity_mismatch(size_t expected, const Value& found) -> Error {
    return Error::make(ErrorKind::Conversion, "expected a list of " + std::to_string(expected) +
                                                  " elements, found " +
                                                  std::to_string(found.size()));
}

} // namespace detail

/// A tuple travels as a list with one element per member.
template <typename... Ts> struct Converter<std::tuple<Ts...>> {
    static auto to_value(const std::tuple<Ts...>& value) -> Value {
        List items;
        items.reserve(sizeof...(Ts));
        std::apply(
            [&items](const auto&... elements) {
                (items.push_back(Converter<std::decay_t<decltype(elements)>>::to_value(elements)),
                 ...);
            },
            value);
        return Value(std::move(items));
    }

    static auto from_value(const Value& value) -> Result<std::tuple<Ts...>, Error> {
        if (!value.is_list()) {
            return detail::kind_mismatch(ValueKind::List, value);
        }
        if (value.size() != sizeof...(Ts)) {
            return detail::arity_mismatch(sizeof...(Ts), value);
        }
        return read_elements(value.as_list(), std::index_sequence_for<Ts...>{});
    }

private:
    template <size_t... Is>
    static auto read_elements([[maybe_unused]] const List& items, std::index_sequence<Is...>)
        -> Result<std::tuple<Ts...>, Error> {
        std::tuple<Result<Ts, Error>...> converted{Converter<Ts>::from_value(items[Is])...};

        // Report the first failing element
        std::optional<Error> error;
        [[maybe_unused]] auto check = [&error](auto& element, size_t index) {
            if (!error && is_err(element)) {
                error = detail::nested_error(std::move(unwrap_err(element)),
                                             "at index " + std::to_string(index));
            }
        };
        (check(std::get<Is>(converted), Is), ...);
        if (error) {
            return std::move(*error);
        }
        return std::tuple<Ts...>(std::move(unwrap(std::get<Is>(converted)))...);
    }
};

template <typename A, typename B> struct Converter<std::pair<A, B>> {
    static auto to_value(const std::pair<A, B>& value) -> Value {
        List items;
        items.reserve(2);
        items.push_back(Converter<A>::to_value(value.first));
        items.push_back(Converter<B>::to_value(value.second));
        return Value(std::move(items));
    }

    static auto from_value(const Value& value) -> Result<std::pair<A, B>, Error> {
        auto elements = Converter<std::tuple<A, B>>::from_value(value);
        if (is_err(elements)) {
            return std::move(unwrap_err(elements));
        }
        auto& [first, second] = unwrap(elements);
        return std::pair<A, B>(std::move(first), std::move(second));
    }
};

// ============================================================================
// Variants and Enumerations
// ============================================================================

/// Names the alternatives of a `std::variant`, in alternative order.
///
/// Specializations provide
/// `static constexpr std::array<std::string_view, N> names`.
template <typename V> struct VariantNames;

/// Tagged-union conversion for `std::variant`.
///
/// A `std::monostate` alternative is written as its name; any other
/// alternative as a one-entry dictionary `{name: data}`.
template <typename... Ts> struct Converter<std::variant<Ts...>> {
    using Variant = std::variant<Ts...>;

    static_assert(VariantNames<Variant>::names.size() == sizeof...(Ts),
                  "VariantNames must name every alternative");

    static auto to_value(const Variant& value) -> Value {
        std::string_view name = VariantNames<Variant>::names[value.index()];
        return std::visit(
            [name](const auto& alternative) -> Value {
                using Alt = std::decay_t<decltype(alternative)>;
                if constexpr (std::is_same_v<Alt, std::monostate>) {
                    return Value(name);
                } else {
                    Dict entries;
                    entries.emplace_back(std::string(name), Converter<Alt>::to_value(alternative));
                    return Value(std::move(entries));
                }
            },
            value);
    }

    static auto from_value(const Value& value) -> Result<Variant, Error> {
        std::string_view name;
        const Value* data = nullptr;
        if (value.is_string()) {
            name = value.as_string();
        } else if (value.is_dict() && value.size() == 1) {
            name = value.as_dict()[0].first;
            data = &value.as_dict()[0].second;
        } else {
            return Error::make(ErrorKind::Conversion,
                               std::string("expected a variant name or a one-entry dict, found ") +
                                   value_kind_name(value.kind()));
        }

        const auto& names = VariantNames<Variant>::names;
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name) {
                return read_alternative(i, name, data);
            }
        }
        return Error::make(ErrorKind::Conversion, "unknown variant '" + std::string(name) + "'");
    }

private:
    template <size_t I = 0>
    static auto read_alternative(size_t index, std::string_view name, const Value* data)
        -> Result<Variant, Error> {
        if constexpr (I == sizeof...(Ts)) {
            return Error::make(ErrorKind::Conversion, "unknown variant '" + std::string(name) + "'");
        } else {
            if (index != I) {
                return read_alternative<I + 1>(index, name, data);
            }

            using Alt = std::variant_alternative_t<I, Variant>;
            if constexpr (std::is_same_v<Alt, std::monostate>) {
                if (data) {
                    return Error::make(ErrorKind::Conversion,
                                       "variant '" + std::string(name) + "' carries no data");
                }
                return Variant(std::in_place_index<I>);
            } else {
                if (!data) {
                    return Error::make(ErrorKind::Conversion,
                                       "variant '" + std::string(name) + "' requires data");
                }
                auto inner = Converter<Alt>::from_value(*data);
                if (is_err(inner)) {
                    return detail::nested_error(std::move(unwrap_err(inner)),
                                                "in variant '" + std::string(name) + "'");
                }
                return Variant(std::in_place_index<I>, std::move(unwrap(inner)));
            }
        }
    }
};

/// Names the enumerators of `E`.
///
/// Specializations provide
/// `static constexpr std::array<std::pair<E, std::string_view>, N> entries`.
template <typename E> struct EnumNames;

/// Conversion for an enumeration as a unit variant: the enumerator's name.
///
/// ```cpp
/// template <> struct Converter<Color> : EnumConverter<Color> {};
/// ```
template <typename E> struct EnumConverter {
    /// Throws `std::logic_error` for an enumerator missing from `EnumNames<E>`.
    static auto to_value(E value) -> Value {
        for (const auto& [entry, name] : EnumNames<E>::entries) {
            if (entry == value) {
                return Value(name);
            }
        }
        throw std::logic_error("enumerator " +
                               std::to_string(static_cast<int64_t>(value)) +
                               " has no name");
    }

    static auto from_value(const Value& value) -> Result<E, Error> {
        if (!value.is_string()) {
            return detail::kind_mismatch(ValueKind::String, value);
        }
        for (const auto& [entry, name] : EnumNames<E>::entries) {
            if (name == value.as_string()) {
                return entry;
            }
        }
        return Error::make(ErrorKind::Conversion,
                           "unknown enumerator '" + value.as_string() + "'");
    }
};

// ============================================================================
// Bytes In, Bytes Out
// ============================================================================

/// Converts `value` and encodes it.
template <typename T>
[[nodiscard]] auto serialize(const T& value, const EncoderConfig& config = {})
    -> Result<std::string, Error> {
    return encode(to_value(value), config);
}

/// Decodes `input` and converts the result to `T`.
///
/// # Returns
///
/// The native value, the decode error, or a `Conversion` error.
template <typename T>
[[nodiscard]] auto deserialize(std::string_view input, const DecoderConfig& config = {})
    -> Result<T, Error> {
    auto decoded = decode(input, config);
    if (is_err(decoded)) {
        return unwrap_err(decoded);
    }
    return from_value<T>(unwrap(decoded));
}

} // namespace tnet
