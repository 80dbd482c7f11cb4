#include "value.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/core.h>
#include <limits>
#include <stdexcept>

namespace querygate {

Value Value::list(List items) {
    Value v;
    v.kind_ = Kind::List;
    v.children_ = std::move(items);
    return v;
}

Value Value::object() {
    Value v;
    v.kind_ = Kind::Object;
    return v;
}

bool Value::isBlank() const {
    if (kind_ == Kind::Null) {
        return true;
    }
    if (kind_ != Kind::String) {
        return false;
    }
    return std::all_of(string_.begin(), string_.end(),
        [](unsigned char c) { return std::isspace(c); });
}

void Value::requireKind(Kind expected) const {
    if (kind_ != expected) {
        throw std::logic_error("Value is " + kindName(kind_) + ", expected " + kindName(expected));
    }
}

bool Value::asBool() const {
    requireKind(Kind::Boolean);
    return bool_;
}

int64_t Value::asInt() const {
    if (kind_ == Kind::Double) {
        if (!std::isfinite(double_) || double_ < -9223372036854775808.0 || double_ >= 9223372036854775808.0) {
            throw std::out_of_range(fmt::format("Value {} does not fit a 64-bit integer", double_));
        }
        return static_cast<int64_t>(double_);
    }
    requireKind(Kind::Integer);
    return int_;
}

double Value::asDouble() const {
    if (kind_ == Kind::Integer) {
        return static_cast<double>(int_);
    }
    requireKind(Kind::Double);
    return double_;
}

const std::string& Value::asString() const {
    requireKind(Kind::String);
    return string_;
}

const Value::List& Value::asList() const {
    requireKind(Kind::List);
    return children_;
}

Value::List& Value::asList() {
    requireKind(Kind::List);
    return children_;
}

std::string Value::toString() const {
    switch (kind_) {
        case Kind::Null:
            return "";
        case Kind::Boolean:
            return bool_ ? "true" : "false";
        case Kind::Integer:
            return std::to_string(int_);
        case Kind::Double:
            return fmt::format("{}", double_);
        case Kind::String:
            return string_;
        case Kind::List:
        case Kind::Object:
            return dump();
    }
    return "";
}

const Value* Value::find(const std::string& key) const {
    if (kind_ != Kind::Object) {
        return nullptr;
    }
    for (size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &children_[i];
        }
    }
    return nullptr;
}

Value* Value::find(const std::string& key) {
    return const_cast<Value*>(static_cast<const Value&>(*this).find(key));
}

void Value::set(const std::string& key, Value value) {
    requireKind(Kind::Object);
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    keys_.push_back(key);
    children_.push_back(std::move(value));
}

bool Value::erase(const std::string& key) {
    if (kind_ != Kind::Object) {
        return false;
    }
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it == keys_.end()) {
        return false;
    }
    auto index = std::distance(keys_.begin(), it);
    keys_.erase(it);
    children_.erase(children_.begin() + index);
    return true;
}

const std::vector<std::string>& Value::keys() const {
    requireKind(Kind::Object);
    return keys_;
}

void Value::push_back(Value value) {
    requireKind(Kind::List);
    children_.push_back(std::move(value));
}

size_t Value::size() const {
    if (kind_ == Kind::List || kind_ == Kind::Object) {
        return children_.size();
    }
    return 0;
}

Value Value::fromJson(const crow::json::rvalue& json) {
    switch (json.t()) {
        case crow::json::type::Null:
            return Value();
        case crow::json::type::True:
            return Value(true);
        case crow::json::type::False:
            return Value(false);
        case crow::json::type::Number:
            if (json.nt() == crow::json::num_type::Floating_point) {
                return Value(json.d());
            }
            if (json.nt() == crow::json::num_type::Unsigned_integer) {
                // Beyond int64_t the value survives only as a double
                if (json.u() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return Value(static_cast<double>(json.u()));
                }
                return Value(static_cast<int64_t>(json.u()));
            }
            return Value(static_cast<int64_t>(json.i()));
        case crow::json::type::String:
            return Value(std::string(json.s()));
        case crow::json::type::List: {
            Value result = Value::list();
            for (const auto& item : json) {
                result.push_back(fromJson(item));
            }
            return result;
        }
        case crow::json::type::Object: {
            // Iterating keeps document order
            Value result = Value::object();
            for (const auto& item : json) {
                result.set(item.key(), fromJson(item));
            }
            return result;
        }
        default:
            return Value();
    }
}

crow::json::wvalue Value::toJson() const {
    switch (kind_) {
        case Kind::Null:
            return crow::json::wvalue(nullptr);
        case Kind::Boolean:
            return crow::json::wvalue(bool_);
        case Kind::Integer:
            return crow::json::wvalue(int_);
        case Kind::Double:
            return crow::json::wvalue(double_);
        case Kind::String:
            return crow::json::wvalue(string_);
        case Kind::List: {
            std::vector<crow::json::wvalue> items;
            items.reserve(children_.size());
            for (const auto& child : children_) {
                items.push_back(child.toJson());
            }
            return crow::json::wvalue(std::move(items));
        }
        case Kind::Object: {
            crow::json::wvalue::object members;
            for (size_t i = 0; i < keys_.size(); ++i) {
                members.emplace(keys_[i], children_[i].toJson());
            }
            return crow::json::wvalue(std::move(members));
        }
    }
    return crow::json::wvalue(nullptr);
}

std::string Value::dump() const {
    return toJson().dump();
}

bool Value::operator==(const Value& other) const {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
        case Kind::Null:
            return true;
        case Kind::Boolean:
            return bool_ == other.bool_;
        case Kind::Integer:
            return int_ == other.int_;
        case Kind::Double:
            return double_ == other.double_;
        case Kind::String:
            return string_ == other.string_;
        case Kind::List:
            return children_ == other.children_;
        case Kind::Object:
            // Key order does not affect equality
            if (keys_.size() != other.keys_.size()) {
                return false;
            }
            for (size_t i = 0; i < keys_.size(); ++i) {
                const Value* match = other.find(keys_[i]);
                if (!match || *match != children_[i]) {
                    return false;
                }
            }
            return true;
    }
    return false;
}

std::string Value::kindName(Kind kind) {
    switch (kind) {
        case Kind::Null:
            return "null";
        case Kind::Boolean:
            return "boolean";
        case Kind::Integer:
            return "integer";
        case Kind::Double:
            return "double";
        case Kind::String:
            return "string";
        case Kind::List:
            return "list";
        case Kind::Object:
            return "object";
    }
    return "unknown";
}

} // namespace querygate
