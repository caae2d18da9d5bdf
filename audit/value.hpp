#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace auditstore {

class Value;

// String-keyed bag used for event metadata and for every plain result
// structure handed to callers.
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

enum class ValueKind {
    Null,
    Bool,
    Integer,
    Number,
    String,
    Object,
    Array
};

class Value {
public:
    Value() : data_(nullptr) {}
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<std::int64_t>(i)) {}
    Value(std::int64_t i) : data_(i) {}
    Value(std::uint64_t u) : data_(static_cast<std::int64_t>(u)) {}
    Value(double d) : data_(d) {}
    Value(const char *s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Object o) : data_(std::move(o)) {}
    Value(Array a) : data_(std::move(a)) {}

    ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }

    bool is_null() const { return kind() == ValueKind::Null; }
    bool is_object() const { return kind() == ValueKind::Object; }
    bool is_array() const { return kind() == ValueKind::Array; }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_integer() const { return std::get<std::int64_t>(data_); }
    double as_number() const { return std::get<double>(data_); }
    const std::string &as_string() const { return std::get<std::string>(data_); }
    const Object &as_object() const { return std::get<Object>(data_); }
    Object &as_object() { return std::get<Object>(data_); }
    const Array &as_array() const { return std::get<Array>(data_); }

    bool operator==(const Value &other) const { return data_ == other.data_; }
    bool operator!=(const Value &other) const { return !(*this == other); }

private:
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Object, Array> data_;
};

std::string value_kind_to_string(ValueKind kind);

// With ascii_only, UTF-8 sequences become 4-hex-digit u-escapes (surrogate
// pairs above U+FFFF) and malformed bytes become U+FFFD.
std::string json_escape(const std::string &s, bool ascii_only = false);

// Serializes to JSON. indent < 0 gives the single-line form
// {"a": 1, "b": [..]}; indent >= 0 pretty-prints with that many spaces.
std::string to_json(const Value &v, int indent = -1, bool ascii_only = false);

} // namespace auditstore
