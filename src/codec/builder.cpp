//! # Value Builder Implementation
//!
//! Every finished value, whether a scalar from `item()` or an aggregate
//! closed by `end()`, goes through `place()`, which appends it to the open
//! list, pairs it with the pending dictionary key, or stores it as the result
//! when the stack is empty.

#include "tnet/builder.hpp"

namespace tnet {

void ValueBuilder::open(Context::Kind kind) {
    if (stack_.empty() && has_result_) {
        throw std::logic_error("ValueBuilder: a complete value was already built");
    }
    if (!stack_.empty() && stack_.top().kind == Context::Kind::Dict &&
        !stack_.top().pending_key) {
        throw std::logic_error("ValueBuilder: dictionary value added without a key");
    }

    Context ctx;
    ctx.kind = kind;
    stack_.push(std::move(ctx));
}

void ValueBuilder::place(Value value) {
    if (stack_.empty()) {
        if (has_result_) {
            throw std::logic_error("ValueBuilder: a complete value was already built");
        }
        result_ = std::move(value);
        has_result_ = true;
        return;
    }

    auto& top = stack_.top();
    if (top.kind == Context::Kind::List) {
        top.items.push_back(std::move(value));
        return;
    }

    if (!top.pending_key) {
        throw std::logic_error("ValueBuilder: dictionary value added without a key");
    }
    top.entries.emplace_back(std::move(*top.pending_key), std::move(value));
    top.pending_key.reset();
}

auto ValueBuilder::list() -> ValueBuilder& {
    open(Context::Kind::List);
    return *this;
}

auto ValueBuilder::dict() -> ValueBuilder& {
    open(Context::Kind::Dict);
    return *this;
}

auto ValueBuilder::end() -> ValueBuilder& {
    if (stack_.empty()) {
        throw std::logic_error("ValueBuilder::end() called with nothing open");
    }
    if (stack_.top().pending_key) {
        throw std::logic_error("ValueBuilder::end() called with key '" +
                               *stack_.top().pending_key + "' still waiting for a value");
    }

    Context ctx = std::move(stack_.top());
    stack_.pop();

    if (ctx.kind == Context::Kind::List) {
        place(Value(std::move(ctx.items)));
    } else {
        place(Value(std::move(ctx.entries)));
    }
    return *this;
}

auto ValueBuilder::key(std::string_view key) -> ValueBuilder& {
    if (stack_.empty() || stack_.top().kind != Context::Kind::Dict) {
        throw std::logic_error("ValueBuilder::key() called outside a dictionary");
    }
    if (stack_.top().pending_key) {
        throw std::logic_error("ValueBuilder::key() called twice without a value");
    }
    stack_.top().pending_key = std::string(key);
    return *this;
}

// ============================================================================
// Value Methods
// ============================================================================

auto ValueBuilder::item(Value value) -> ValueBuilder& {
    place(std::move(value));
    return *this;
}

auto ValueBuilder::item(const char* value) -> ValueBuilder& {
    return item(Value(value));
}

auto ValueBuilder::item(const std::string& value) -> ValueBuilder& {
    return item(Value(value));
}

auto ValueBuilder::item(std::string_view value) -> ValueBuilder& {
    return item(Value(value));
}

auto ValueBuilder::item(bool value) -> ValueBuilder& {
    return item(Value(value));
}

auto ValueBuilder::item(int value) -> ValueBuilder& {
    return item(Value(value));
}

auto ValueBuilder::item(int64_t value) -> ValueBuilder& {
    return item(Value(value));
}

auto ValueBuilder::item(uint64_t value) -> ValueBuilder& {
    return item(Value(value));
}

auto ValueBuilder::item(Integer value) -> ValueBuilder& {
    return item(Value(value));
}

auto ValueBuilder::item(double value) -> ValueBuilder& {
    return item(Value(value));
}

auto ValueBuilder::item(std::nullptr_t) -> ValueBuilder& {
    return item(Value());
}

auto ValueBuilder::item_null() -> ValueBuilder& {
    return item(Value());
}

// ============================================================================
// Finalization
// ============================================================================

auto ValueBuilder::build() -> Value {
    if (!stack_.empty()) {
        throw std::logic_error("ValueBuilder::build() called with " +
                               std::to_string(stack_.size()) + " unclosed aggregate(s)");
    }
    if (!has_result_) {
        throw std::logic_error("ValueBuilder::build() called before any value was added");
    }
    has_result_ = false;
    return std::move(result_);
}

auto ValueBuilder::is_complete() const -> bool {
    return stack_.empty() && has_result_;
}

} // namespace tnet
