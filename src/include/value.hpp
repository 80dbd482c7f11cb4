#pragma once

#include <crow.h>
#include <cstdint>
#include <string>
#include <vector>

namespace querygate {

/**
 * Dynamically typed request/response value.
 *
 * Objects keep their keys in insertion order, which XML output and key
 * iteration follow; JSON output goes through crow::json and does not.
 * Equality ignores key order. Setting an existing key overwrites it in
 * place; there is no deep merge.
 */
class Value {
public:
    enum class Kind {
        Null,
        Boolean,
        Integer,
        Double,
        String,
        List,
        Object
    };

    using List = std::vector<Value>;

    Value() : kind_(Kind::Null) {}
    Value(std::nullptr_t) : kind_(Kind::Null) {}
    Value(bool value) : kind_(Kind::Boolean), bool_(value) {}
    Value(int value) : kind_(Kind::Integer), int_(value) {}
    Value(int64_t value) : kind_(Kind::Integer), int_(value) {}
    Value(double value) : kind_(Kind::Double), double_(value) {}
    Value(const char* value) : kind_(Kind::String), string_(value ? value : "") {}
    Value(std::string value) : kind_(Kind::String), string_(std::move(value)) {}

    static Value list(List items = {});
    static Value object();

    Kind kind() const { return kind_; }
    bool isNull() const { return kind_ == Kind::Null; }
    bool isBool() const { return kind_ == Kind::Boolean; }
    bool isInteger() const { return kind_ == Kind::Integer; }
    bool isDouble() const { return kind_ == Kind::Double; }
    bool isNumber() const { return kind_ == Kind::Integer || kind_ == Kind::Double; }
    bool isString() const { return kind_ == Kind::String; }
    bool isList() const { return kind_ == Kind::List; }
    bool isObject() const { return kind_ == Kind::Object; }

    // Null or a string made only of whitespace
    bool isBlank() const;

    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;
    const std::string& asString() const;
    const List& asList() const;
    List& asList();

    // Scalar text form; lists and objects render as compact JSON
    std::string toString() const;

    // Object access
    const Value* find(const std::string& key) const;
    Value* find(const std::string& key);
    bool contains(const std::string& key) const { return find(key) != nullptr; }
    void set(const std::string& key, Value value);
    bool erase(const std::string& key);
    const std::vector<std::string>& keys() const;

    // List access
    void push_back(Value value);

    // Element count for lists and objects, zero for scalars
    size_t size() const;

    static Value fromJson(const crow::json::rvalue& json);
    // Object members come out in crow::json's own key order, not insertion order
    crow::json::wvalue toJson() const;
    std::string dump() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    static std::string kindName(Kind kind);

private:
    Kind kind_;
    bool bool_ = false;
    int64_t int_ = 0;
    double double_ = 0.0;
    std::string string_;
    std::vector<Value> children_;      // list items or object values
    std::vector<std::string> keys_;    // object keys, parallel to children_

    void requireKind(Kind expected) const;
};

} // namespace querygate
