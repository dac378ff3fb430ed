//! # Decoder Implementation
//!
//! Recursive descent over frames. Each aggregate frames its children inside
//! its own payload, so a lying child length is reported as a structural error
//! at the child's offset rather than being clipped or read past the parent.

#include "tnet/decoder.hpp"

#include "tnet/log.hpp"
#include "tnet/number.hpp"

namespace tnet {

Decoder::Decoder(std::string_view input, DecoderConfig config)
    : input_(input), config_(config) {}

auto Decoder::decode() -> Result<Value, Error> {
    auto prefix = decode_prefix();
    if (is_err(prefix)) {
        return unwrap_err(prefix);
    }

    auto& decoded = unwrap(prefix);
    if (decoded.consumed != input_.size()) {
        auto error = Error::make(ErrorKind::TrailingData,
                                 std::to_string(input_.size() - decoded.consumed) +
                                     " bytes after top-level frame",
                                 decoded.consumed);
        TNET_LOG_DEBUG("decode", "rejected input: " << error.to_string());
        return error;
    }
    return std::move(decoded.value);
}

auto Decoder::decode_prefix() -> Result<DecodedPrefix, Error> {
    depth_ = 0;
    total_size_ = 0;

    auto frame_result = next_frame(0, std::nullopt);
    if (is_err(frame_result)) {
        TNET_LOG_DEBUG("decode", "rejected input: " << unwrap_err(frame_result).to_string());
        return unwrap_err(frame_result);
    }

    const Frame& frame = unwrap(frame_result);
    auto value = decode_frame(frame);
    if (is_err(value)) {
        TNET_LOG_DEBUG("decode", "rejected input: " << unwrap_err(value).to_string());
        return unwrap_err(value);
    }

    TNET_LOG_TRACE("decode", "decoded " << value_kind_name(tag_kind(frame.tag)) << " frame of "
                                        << frame.next_offset << " bytes");
    return DecodedPrefix{std::move(unwrap(value)), frame.next_offset};
}

auto Decoder::next_frame(size_t offset, std::optional<size_t> parent_end)
    -> Result<Frame, Error> {
    auto result = parent_end ? parse_child_frame(input_, offset, *parent_end)
                             : parse_frame(input_, offset);
    if (is_err(result)) {
        return result;
    }

    // Aggregate payloads are the bytes of their children, which are charged
    // when they are framed.
    const Frame& frame = unwrap(result);
    if (is_aggregate(frame.tag)) {
        return result;
    }
    total_size_ += frame.length;
    if (config_.max_total_size && total_size_ > *config_.max_total_size) {
        return Error::make(ErrorKind::SizeExceeded,
                           "total payload size " + std::to_string(total_size_) +
                               " exceeds limit " + std::to_string(*config_.max_total_size),
                           offset);
    }
    return result;
}

auto Decoder::decode_frame(const Frame& frame) -> Result<Value, Error> {
    switch (frame.tag) {
    case Tag::String:
        return Value(std::string(frame.payload(input_)));
    case Tag::Integer: {
        auto result = parse_integer(frame.payload(input_), frame.payload_start);
        if (is_err(result)) {
            return unwrap_err(result);
        }
        return Value(unwrap(result));
    }
    case Tag::Float: {
        auto result = parse_float(frame.payload(input_), frame.payload_start);
        if (is_err(result)) {
            return unwrap_err(result);
        }
        return Value(unwrap(result));
    }
    case Tag::Boolean:
        return decode_bool(frame);
    case Tag::Null:
        return decode_null(frame);
    case Tag::List:
    case Tag::Dict: {
        if (depth_ + 1 > config_.max_depth) {
            return Error::make(ErrorKind::DepthExceeded,
                               "nesting depth exceeds maximum of " +
                                   std::to_string(config_.max_depth),
                               frame.start);
        }
        ++depth_;
        auto result = frame.tag == Tag::List ? decode_list(frame) : decode_dict(frame);
        --depth_;
        return result;
    }
    }
    return Error::make(ErrorKind::Framing, "unknown tag", frame.payload_end);
}

auto Decoder::decode_list(const Frame& frame) -> Result<Value, Error> {
    List items;
    size_t offset = frame.payload_start;

    while (offset < frame.payload_end) {
        auto child = next_frame(offset, frame.payload_end);
        if (is_err(child)) {
            return unwrap_err(child);
        }

        auto item = decode_frame(unwrap(child));
        if (is_err(item)) {
            return unwrap_err(item);
        }
        items.push_back(std::move(unwrap(item)));
        offset = unwrap(child).next_offset;
    }

    return Value(std::move(items));
}

auto Decoder::decode_dict(const Frame& frame) -> Result<Value, Error> {
    Dict entries;
    size_t offset = frame.payload_start;

    while (offset < frame.payload_end) {
        // Key
        auto key_frame = next_frame(offset, frame.payload_end);
        if (is_err(key_frame)) {
            return unwrap_err(key_frame);
        }
        const Frame& key = unwrap(key_frame);
        if (key.tag != Tag::String) {
            return Error::make(ErrorKind::Structural,
                               std::string("dictionary key must be a string, found ") +
                                   value_kind_name(tag_kind(key.tag)),
                               key.start);
        }
        offset = key.next_offset;

        // Value
        if (offset == frame.payload_end) {
            return Error::make(ErrorKind::Structural,
                               "dictionary key has no value (odd number of frames)", key.start);
        }
        auto value_frame = next_frame(offset, frame.payload_end);
        if (is_err(value_frame)) {
            return unwrap_err(value_frame);
        }

        auto value = decode_frame(unwrap(value_frame));
        if (is_err(value)) {
            return unwrap_err(value);
        }
        entries.emplace_back(std::string(key.payload(input_)), std::move(unwrap(value)));
        offset = unwrap(value_frame).next_offset;
    }

    return Value(std::move(entries));
}

auto Decoder::decode_bool(const Frame& frame) const -> Result<Value, Error> {
    auto payload = frame.payload(input_);
    if (payload == "true") {
        return Value(true);
    }
    if (payload == "false") {
        return Value(false);
    }
    return Error::make(ErrorKind::Type, "boolean payload must be 'true' or 'false'",
                       frame.payload_start);
}

auto Decoder::decode_null(const Frame& frame) const -> Result<Value, Error> {
    if (frame.length != 0) {
        return Error::make(ErrorKind::Type,
                           "null payload must be empty, found " + std::to_string(frame.length) +
                               " bytes",
                           frame.payload_start);
    }
    return Value();
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto decode(std::string_view input, const DecoderConfig& config) -> Result<Value, Error> {
    Decoder decoder(input, config);
    return decoder.decode();
}

auto decode_prefix(std::string_view input, const DecoderConfig& config)
    -> Result<DecodedPrefix, Error> {
    Decoder decoder(input, config);
    return decoder.decode_prefix();
}

} // namespace tnet
