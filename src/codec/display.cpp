//! # Value Display
//!
//! Renders `Value` trees in a compact, human-readable form for diagnostics,
//! log messages and test failure output.
//!
//! | Kind | Rendering |
//! |------|-----------|
//! | Null | `null` |
//! | Boolean | `true` / `false` |
//! | Integer | `-42` |
//! | Float | `1.5`, `-0`, `1e+300` |
//! | String | `"text"`, non-printable bytes as `\xNN` |
//! | List | `[a, b]` |
//! | Dict | `{"k": v, "k2": w}` |

#include "tnet/number.hpp"
#include "tnet/value.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace tnet {

namespace {

/// Quotes a byte string, escaping `"`, `\` and anything outside printable ASCII.
void write_quoted(std::ostream& os, const std::string& bytes) {
    os << '"';
    for (char c : bytes) {
        auto byte = static_cast<unsigned char>(c);
        switch (c) {
        case '"':
            os << "\\\"";
            break;
        case '\\':
            os << "\\\\";
            break;
        case '\n':
            os << "\\n";
            break;
        case '\r':
            os << "\\r";
            break;
        case '\t':
            os << "\\t";
            break;
        default:
            if (byte < 0x20 || byte >= 0x7f) {
                std::ostringstream hex;
                hex << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                    << static_cast<int>(byte);
                os << hex.str();
            } else {
                os << c;
            }
            break;
        }
    }
    os << '"';
}

void write_display(std::ostream& os, const Value& value) {
    switch (value.kind()) {
    case ValueKind::Null:
        os << "null";
        return;
    case ValueKind::Boolean:
        os << (value.as_bool() ? "true" : "false");
        return;
    case ValueKind::Integer:
        os << format_integer(value.as_integer());
        return;
    case ValueKind::Float:
        os << format_float_text(value.as_float());
        return;
    case ValueKind::String:
        write_quoted(os, value.as_string());
        return;
    case ValueKind::List: {
        os << '[';
        const auto& items = value.as_list();
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                os << ", ";
            }
            write_display(os, items[i]);
        }
        os << ']';
        return;
    }
    case ValueKind::Dict: {
        os << '{';
        const auto& entries = value.as_dict();
        for (size_t i = 0; i < entries.size(); ++i) {
            if (i > 0) {
                os << ", ";
            }
            write_quoted(os, entries[i].first);
            os << ": ";
            write_display(os, entries[i].second);
        }
        os << '}';
        return;
    }
    }
}

} // namespace

auto Value::write_to(std::ostream& os) const -> std::ostream& {
    write_display(os, *this);
    return os;
}

auto Value::to_display_string() const -> std::string {
    std::ostringstream oss;
    write_display(oss, *this);
    return oss.str();
}

auto operator<<(std::ostream& os, const Value& value) -> std::ostream& {
    return value.write_to(os);
}

} // namespace tnet
