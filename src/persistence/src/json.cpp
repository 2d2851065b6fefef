#include "persistence/json.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sk::persistence::json {

Value Value::make_null(size_t offset) {
    Value v; v.offset_ = offset; return v;
}

Value Value::make_bool(bool b, size_t offset) {
    Value v; v.type_ = Type::Bool; v.bool_ = b; v.offset_ = offset; return v;
}

Value Value::make_number(double n, size_t offset) {
    Value v; v.type_ = Type::Number; v.number_ = n; v.offset_ = offset; return v;
}

Value Value::make_string(std::string s, size_t offset) {
    Value v; v.type_ = Type::String; v.string_ = std::move(s); v.offset_ = offset; return v;
}

Value Value::make_array(Array items, size_t offset) {
    Value v; v.type_ = Type::Array; v.array_ = std::move(items); v.offset_ = offset; return v;
}

Value Value::make_object(Object members, size_t offset) {
    Value v; v.type_ = Type::Object; v.object_ = std::move(members); v.offset_ = offset; return v;
}

const Value* Value::find(const std::string& key) const {
    if(type_ != Type::Object) return nullptr;
    for(const auto& member : object_) {
        if(member.key == key) return &member.value;
    }
    return nullptr;
}

const char* type_name(Value::Type type) {
    switch(type) {
        case Value::Type::Null: return "null";
        case Value::Type::Bool: return "bool";
        case Value::Type::Number: return "number";
        case Value::Type::String: return "string";
        case Value::Type::Array: return "array";
        case Value::Type::Object: return "object";
    }
    return "unknown";
}

namespace {

constexpr int kMaxDepth = 256;

struct ParseError : std::runtime_error {
    ParseError(size_t offset, const std::string& what)
        : std::runtime_error("offset " + std::to_string(offset) + ": " + what) {}
};

// Recursive descent over the raw text; tracks the byte position for diagnostics.
class Parser {
public:
    explicit Parser(const std::string& s) : s_(s) {}

    Value document() {
        Value root = value(0);
        skip_ws();
        if(i_ < s_.size()) throw ParseError(i_, "trailing characters after document");
        return root;
    }

private:
    void skip_ws() {
        while(i_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
    }

    char peek() const { return i_ < s_.size() ? s_[i_] : '\0'; }

    void expect(char c) {
        skip_ws();
        if(peek() != c) throw ParseError(i_, std::string("expected '") + c + "'");
        ++i_;
    }

    bool literal(const char* word) {
        size_t n = 0;
        while(word[n]) ++n;
        if(s_.compare(i_, n, word) != 0) return false;
        i_ += n;
        return true;
    }

    Value value(int depth) {
        if(depth > kMaxDepth) throw ParseError(i_, "nesting too deep");
        skip_ws();
        const size_t start = i_;
        if(i_ >= s_.size()) throw ParseError(i_, "unexpected end of input");

        const char c = s_[i_];
        switch(c) {
            case '{': return object(depth);
            case '[': return array(depth);
            case '"': return Value::make_string(string(), start);
            case 't': if(literal("true")) return Value::make_bool(true, start); break;
            case 'f': if(literal("false")) return Value::make_bool(false, start); break;
            case 'n': if(literal("null")) return Value::make_null(start); break;
            default:
                if(c == '-' || std::isdigit(static_cast<unsigned char>(c))) return number();
                break;
        }
        throw ParseError(start, std::string("unexpected character '") + c + "'");
    }

    Value object(int depth) {
        const size_t start = i_;
        ++i_; // '{'
        Value::Object members;
        skip_ws();
        if(peek() == '}') { ++i_; return Value::make_object(std::move(members), start); }

        for(;;) {
            skip_ws();
            if(peek() != '"') throw ParseError(i_, "expected member name");
            std::string key = string();
            expect(':');
            members.push_back(Value::Member{std::move(key), value(depth + 1)});
            skip_ws();
            if(peek() == ',') { ++i_; continue; }
            if(peek() == '}') { ++i_; break; }
            throw ParseError(i_, "expected ',' or '}'");
        }
        return Value::make_object(std::move(members), start);
    }

    Value array(int depth) {
        const size_t start = i_;
        ++i_; // '['
        Value::Array items;
        skip_ws();
        if(peek() == ']') { ++i_; return Value::make_array(std::move(items), start); }

        for(;;) {
            items.push_back(value(depth + 1));
            skip_ws();
            if(peek() == ',') { ++i_; continue; }
            if(peek() == ']') { ++i_; break; }
            throw ParseError(i_, "expected ',' or ']'");
        }
        return Value::make_array(std::move(items), start);
    }

    Value number() {
        const size_t start = i_;
        if(peek() == '-') ++i_;
        if(!std::isdigit(static_cast<unsigned char>(peek()))) throw ParseError(i_, "malformed number");
        while(std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
        if(peek() == '.') {
            ++i_;
            if(!std::isdigit(static_cast<unsigned char>(peek()))) throw ParseError(i_, "malformed number");
            while(std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
        }
        if(peek() == 'e' || peek() == 'E') {
            ++i_;
            if(peek() == '+' || peek() == '-') ++i_;
            if(!std::isdigit(static_cast<unsigned char>(peek()))) throw ParseError(i_, "malformed exponent");
            while(std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
        }
        const std::string text = s_.substr(start, i_ - start);
        return Value::make_number(std::strtod(text.c_str(), nullptr), start);
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if(cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if(cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if(cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    unsigned hex4() {
        if(i_ + 4 > s_.size()) throw ParseError(i_, "truncated \\u escape");
        unsigned cp = 0;
        for(int k = 0; k < 4; ++k) {
            const char h = s_[i_++];
            cp <<= 4;
            if(h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if(h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if(h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else throw ParseError(i_ - 1, "bad hex digit in \\u escape");
        }
        return cp;
    }

    std::string string() {
        ++i_; // opening quote
        std::string out;
        for(;;) {
            if(i_ >= s_.size()) throw ParseError(i_, "unterminated string");
            const char d = s_[i_++];
            if(d == '"') break;
            if(d != '\\') { out.push_back(d); continue; }
            if(i_ >= s_.size()) throw ParseError(i_, "unterminated escape");
            const char e = s_[i_++];
            switch(e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned cp = hex4();
                    if(cp >= 0xD800 && cp <= 0xDBFF && s_.compare(i_, 2, "\\u") == 0) {
                        i_ += 2;
                        const unsigned low = hex4();
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: throw ParseError(i_ - 1, std::string("invalid escape '\\") + e + "'");
            }
        }
        return out;
    }

    const std::string& s_;
    size_t i_ = 0;
};

} // namespace

FieldError::FieldError(const Value& at, const std::string& what)
    : std::runtime_error("offset " + std::to_string(at.offset()) + ": " + what) {}

namespace {

const Value* member(const Value& object, const std::string& key) {
    const Value* v = object.find(key);
    return v && !v->is_null() ? v : nullptr;
}

[[noreturn]] void wrong_type(const Value& v, const std::string& key, const char* wanted) {
    throw FieldError(v, "'" + key + "' must be " + wanted + ", got " + type_name(v.type()));
}

} // namespace

double get_number(const Value& object, const std::string& key, double fallback) {
    const Value* v = member(object, key);
    if(!v) return fallback;
    if(!v->is_number()) wrong_type(*v, key, "a number");
    return v->as_number();
}

int get_int(const Value& object, const std::string& key, int fallback) {
    const Value* v = member(object, key);
    if(!v) return fallback;
    if(!v->is_number()) wrong_type(*v, key, "a number");
    const double n = v->as_number();
    if(n != std::floor(n) || n < -2147483648.0 || n > 2147483647.0) {
        throw FieldError(*v, "'" + key + "' must be an integer");
    }
    return static_cast<int>(n);
}

bool get_bool(const Value& object, const std::string& key, bool fallback) {
    const Value* v = member(object, key);
    if(!v) return fallback;
    if(!v->is_bool()) wrong_type(*v, key, "a bool");
    return v->as_bool();
}

std::string get_string(const Value& object, const std::string& key, const std::string& fallback) {
    const Value* v = member(object, key);
    if(!v) return fallback;
    if(!v->is_string()) wrong_type(*v, key, "a string");
    return v->as_string();
}

const Value::Array* get_array(const Value& object, const std::string& key) {
    const Value* v = member(object, key);
    if(!v) return nullptr;
    if(!v->is_array()) wrong_type(*v, key, "an array");
    return &v->as_array();
}

const Value* get_object(const Value& object, const std::string& key) {
    const Value* v = member(object, key);
    if(!v) return nullptr;
    if(!v->is_object()) wrong_type(*v, key, "an object");
    return v;
}

void expect_object(const Value& value, const std::string& what) {
    if(!value.is_object()) throw FieldError(value, what + " must be an object");
}

core::Result<Value> parse(const std::string& text) noexcept {
    try {
        Parser parser(text);
        return parser.document();
    } catch(const std::exception& e) {
        return core::Error<Value>(e.what());
    }
}

core::Result<std::string> read_file(const std::string& path) noexcept {
    try {
        std::ifstream ifs(path, std::ios::binary);
        if(!ifs) return core::Error<std::string>("Failed to open file '" + path + "'");
        std::stringstream buf;
        buf << ifs.rdbuf();
        return buf.str();
    } catch(const std::exception& e) {
        return core::Error<std::string>(e.what());
    }
}

} // namespace sk::persistence::json
