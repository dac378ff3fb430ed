//! # Encoder Implementation

#include "tnet/encoder.hpp"

#include "tnet/framer.hpp"
#include "tnet/log.hpp"
#include "tnet/number.hpp"

#include <optional>

namespace tnet {

namespace {

/// Writes one value, children first, onto `out`.
class FrameWriter {
public:
    explicit FrameWriter(const EncoderConfig& config) : config_(config) {}

    auto write(const Value& value, std::string& out) -> std::optional<Error> {
        switch (value.kind()) {
        case ValueKind::Null:
            write_frame(out, "", Tag::Null);
            return std::nullopt;
        case ValueKind::Boolean:
            write_frame(out, value.as_bool() ? "true" : "false", Tag::Boolean);
            return std::nullopt;
        case ValueKind::Integer:
            write_frame(out, format_integer(value.as_integer()), Tag::Integer);
            return std::nullopt;
        case ValueKind::Float: {
            auto text = format_float(value.as_float());
            if (is_err(text)) {
                return unwrap_err(text);
            }
            write_frame(out, unwrap(text), Tag::Float);
            return std::nullopt;
        }
        case ValueKind::String:
            write_frame(out, value.as_string(), Tag::String);
            return std::nullopt;
        case ValueKind::List:
        case ValueKind::Dict:
            return write_aggregate(value, out);
        }
        return Error::make(ErrorKind::Type, "unknown value kind");
    }

private:
    const EncoderConfig& config_;
    size_t depth_ = 0;

    auto write_aggregate(const Value& value, std::string& out) -> std::optional<Error> {
        if (depth_ + 1 > config_.max_depth) {
            return Error::make(ErrorKind::DepthExceeded, "nesting depth exceeds maximum of " +
                                                             std::to_string(config_.max_depth));
        }
        ++depth_;

        std::string payload;
        std::optional<Error> error;
        if (value.is_list()) {
            for (const auto& item : value.as_list()) {
                error = write(item, payload);
                if (error) {
                    break;
                }
            }
        } else {
            for (const auto& [key, item] : value.as_dict()) {
                write_frame(payload, key, Tag::String);
                error = write(item, payload);
                if (error) {
                    break;
                }
            }
        }

        --depth_;
        if (error) {
            return error;
        }
        write_frame(out, payload, value.is_list() ? Tag::List : Tag::Dict);
        return std::nullopt;
    }
};

} // namespace

auto encode(const Value& value, const EncoderConfig& config) -> Result<std::string, Error> {
    std::string out;
    auto written = encode_to(value, out, config);
    if (is_err(written)) {
        return unwrap_err(written);
    }
    return out;
}

auto encode_to(const Value& value, std::string& out, const EncoderConfig& config)
    -> Result<size_t, Error> {
    std::string bytes;
    FrameWriter writer(config);
    if (auto error = writer.write(value, bytes)) {
        TNET_LOG_DEBUG("encode", "cannot encode " << value_kind_name(value.kind()) << ": "
                                                  << error->message);
        return *error;
    }

    out += bytes;
    return bytes.size();
}

} // namespace tnet
