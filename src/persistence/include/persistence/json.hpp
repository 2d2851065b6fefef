#pragma once

#include "core/result.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sk::persistence::json {

/**
 * @brief Parsed JSON value
 *
 * Objects keep their members in document order. Every value remembers the byte offset it
 * started at so loaders can point at the offending spot.
 */
class Value {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    struct Member;
    using Array = std::vector<Value>;
    using Object = std::vector<Member>;

    Value() = default;

    static Value make_null(size_t offset);
    static Value make_bool(bool b, size_t offset);
    static Value make_number(double n, size_t offset);
    static Value make_string(std::string s, size_t offset);
    static Value make_array(Array items, size_t offset);
    static Value make_object(Object members, size_t offset);

    Type type() const { return type_; }
    size_t offset() const { return offset_; }

    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    bool as_bool() const { return bool_; }
    double as_number() const { return number_; }
    const std::string& as_string() const { return string_; }
    const Array& as_array() const { return array_; }
    const Object& as_object() const { return object_; }

    // Object member lookup; nullptr when absent or when this is not an object.
    const Value* find(const std::string& key) const;

private:
    Type type_ = Type::Null;
    size_t offset_ = 0;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    Array array_;
    Object object_;
};

struct Value::Member {
    std::string key;
    Value value;
};

const char* type_name(Value::Type type);

// Whole-document parse. Errors read "offset <n>: <what>".
core::Result<Value> parse(const std::string& text) noexcept;

core::Result<std::string> read_file(const std::string& path) noexcept;

// Schema violation inside a well-formed document; message carries the value's offset.
struct FieldError : std::runtime_error {
    FieldError(const Value& at, const std::string& what);
};

// Member accessors for loaders. Absent or null members yield the fallback; a member of the
// wrong type throws FieldError.
double get_number(const Value& object, const std::string& key, double fallback);
int get_int(const Value& object, const std::string& key, int fallback);
bool get_bool(const Value& object, const std::string& key, bool fallback);
std::string get_string(const Value& object, const std::string& key, const std::string& fallback = {});
const Value::Array* get_array(const Value& object, const std::string& key);
const Value* get_object(const Value& object, const std::string& key);

// Throws FieldError unless `value` is an object.
void expect_object(const Value& value, const std::string& what);

} // namespace sk::persistence::json
