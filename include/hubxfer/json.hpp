#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace hubxfer::json {

class Value;
using Null = std::monostate;
using Boolean = bool;
using Number = double;
using String = std::string;
using Array = std::vector<Value>;
// Insertion-ordered so documents serialise with a stable key order
using Object = std::vector<std::pair<std::string, Value>>;

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& what, size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    size_t offset() const { return offset_; }
private:
    size_t offset_;
};

class Value {
public:
    using VariantType = std::variant<Null, Boolean, Number, String, Array, Object>;
    Value() : data_(Null{}) {}
    Value(Null) : data_(Null{}) {}
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(int i) : data_(static_cast<double>(i)) {}
    Value(int64_t i) : data_(static_cast<double>(i)) {}
    Value(size_t u) : data_(static_cast<double>(u)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Boolean>(data_); }
    bool is_number() const { return std::holds_alternative<Number>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<Array>(data_); }
    bool is_object() const { return std::holds_alternative<Object>(data_); }

    bool as_bool() const { return std::get<Boolean>(data_); }
    double as_number() const { return std::get<Number>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    Object& as_object() { return std::get<Object>(data_); }

    // Missing keys and non-objects yield null
    const Value& operator[](std::string_view key) const;

    bool contains(std::string_view key) const;

    // Appends, or replaces an existing key in place
    Value& set(std::string key, Value value);

    std::string string_or(std::string_view fallback) const {
        return is_string() ? as_string() : std::string(fallback);
    }

    // indent < 0 renders compact output; otherwise one item per line
    std::string dump(int indent = -1) const;

private:
    VariantType data_;

    void dump_to(std::string& out, int indent, int depth) const;
};

Value parse(std::string_view input);

std::string escape(std::string_view s);

} // namespace hubxfer::json
