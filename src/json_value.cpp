#include "config/json_value.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace ramm {

namespace {

// Simple recursive descent JSON parser
class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    JsonValue parse() {
        skip_ws();
        JsonValue v = parse_value(0);
        skip_ws();
        if (pos_ != input_.size()) {
            fail("trailing characters");
        }
        return v;
    }

private:
    static constexpr int kMaxDepth = 64;

    const std::string& input_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& what) const {
        std::ostringstream ss;
        ss << "json: " << what << " at offset " << pos_;
        throw ParseError(ss.str());
    }

    char peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }
    char next() {
        if (pos_ >= input_.size()) fail("unexpected end of input");
        return input_[pos_++];
    }
    void expect(char c) {
        if (next() != c) {
            --pos_;
            fail(std::string("expected '") + c + "'");
        }
    }
    void skip_ws() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) ++pos_;
    }
    void expect_literal(const char* lit) {
        for (const char* p = lit; *p; ++p) {
            if (next() != *p) fail(std::string("invalid literal, expected ") + lit);
        }
    }

    JsonValue parse_value(int depth) {
        if (depth > kMaxDepth) fail("nesting too deep");
        skip_ws();
        char c = peek();
        if (c == '"') return JsonValue::make_string(parse_string());
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == 'n') { expect_literal("null"); return JsonValue{}; }
        if (c == 't') { expect_literal("true"); return JsonValue::make_bool(true); }
        if (c == 'f') { expect_literal("false"); return JsonValue::make_bool(false); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        if (c == '\0') fail("unexpected end of input");
        fail(std::string("unexpected character '") + c + "'");
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (true) {
            char c = next();
            if (c == '"') break;
            if (c != '\\') {
                out += c;
                continue;
            }
            char esc = next();
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    unsigned cp = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = next();
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
                        else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
                        else fail("invalid \\u escape");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail("invalid escape");
            }
        }
        return out;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') ++pos_;
        if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
        while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        if (peek() == '.') {
            ++pos_;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid exponent");
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        }
        try {
            return JsonValue::make_number(std::stod(input_.substr(start, pos_ - start)));
        } catch (const std::out_of_range&) {
            fail("number out of range");
        }
    }

    JsonValue parse_array(int depth) {
        expect('[');
        JsonValue v = JsonValue::make_array();
        skip_ws();
        if (peek() == ']') { ++pos_; return v; }
        while (true) {
            v.arr.push_back(parse_value(depth + 1));
            skip_ws();
            char c = next();
            if (c == ']') break;
            if (c != ',') { --pos_; fail("expected ',' or ']'"); }
        }
        return v;
    }

    JsonValue parse_object(int depth) {
        expect('{');
        JsonValue v = JsonValue::make_object();
        skip_ws();
        if (peek() == '}') { ++pos_; return v; }
        while (true) {
            skip_ws();
            std::string key = parse_string();
            skip_ws();
            expect(':');
            auto val = parse_value(depth + 1);
            v.obj.emplace_back(std::move(key), std::move(val));
            skip_ws();
            char c = next();
            if (c == '}') break;
            if (c != ',') { --pos_; fail("expected ',' or '}'"); }
        }
        return v;
    }
};

void write_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void write_number(std::string& out, double n) {
    if (!std::isfinite(n)) {
        out += "null";
        return;
    }
    char buf[32];
    if (n == std::floor(n) && std::fabs(n) < 1e15) {
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(n));
    } else {
        std::snprintf(buf, sizeof(buf), "%.15g", n);
    }
    out += buf;
}

void write_value(std::string& out, const JsonValue& v) {
    switch (v.type) {
        case JsonValue::Null:   out += "null"; break;
        case JsonValue::Bool:   out += v.boolean ? "true" : "false"; break;
        case JsonValue::Number: write_number(out, v.number); break;
        case JsonValue::String: write_string(out, v.str); break;
        case JsonValue::Array: {
            out += '[';
            for (size_t i = 0; i < v.arr.size(); ++i) {
                if (i) out += ',';
                write_value(out, v.arr[i]);
            }
            out += ']';
            break;
        }
        case JsonValue::Object: {
            out += '{';
            for (size_t i = 0; i < v.obj.size(); ++i) {
                if (i) out += ',';
                write_string(out, v.obj[i].first);
                out += ':';
                write_value(out, v.obj[i].second);
            }
            out += '}';
            break;
        }
    }
}

} // anonymous namespace

JsonValue JsonValue::make_bool(bool b) {
    JsonValue v;
    v.type = Bool;
    v.boolean = b;
    return v;
}

JsonValue JsonValue::make_number(double n) {
    JsonValue v;
    v.type = Number;
    v.number = n;
    return v;
}

JsonValue JsonValue::make_string(std::string s) {
    JsonValue v;
    v.type = String;
    v.str = std::move(s);
    return v;
}

JsonValue JsonValue::make_array() {
    JsonValue v;
    v.type = Array;
    return v;
}

JsonValue JsonValue::make_object() {
    JsonValue v;
    v.type = Object;
    return v;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    for (const auto& [k, v] : obj) {
        if (k == key) return &v;
    }
    return nullptr;
}

double JsonValue::get_number(const std::string& key, double def) const {
    const JsonValue* v = find(key);
    return (v && v->type == Number) ? v->number : def;
}

int64_t JsonValue::get_int(const std::string& key, int64_t def) const {
    const JsonValue* v = find(key);
    if (!v || v->type != Number || !std::isfinite(v->number)) return def;
    return static_cast<int64_t>(std::llround(v->number));
}

bool JsonValue::get_bool(const std::string& key, bool def) const {
    const JsonValue* v = find(key);
    return (v && v->type == Bool) ? v->boolean : def;
}

std::string JsonValue::get_string(const std::string& key, const std::string& def) const {
    const JsonValue* v = find(key);
    return (v && v->type == String) ? v->str : def;
}

const JsonValue* JsonValue::get_array(const std::string& key) const {
    const JsonValue* v = find(key);
    return (v && v->type == Array) ? v : nullptr;
}

const JsonValue* JsonValue::get_object(const std::string& key) const {
    const JsonValue* v = find(key);
    return (v && v->type == Object) ? v : nullptr;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    type = Object;
    for (auto& [k, v] : obj) {
        if (k == key) {
            v = std::move(value);
            return *this;
        }
    }
    obj.emplace_back(key, std::move(value));
    return *this;
}

JsonValue& JsonValue::push(JsonValue value) {
    type = Array;
    arr.push_back(std::move(value));
    return *this;
}

JsonValue parse_json(const std::string& input) {
    JsonParser parser(input);
    return parser.parse();
}

std::string to_json(const JsonValue& value) {
    std::string out;
    write_value(out, value);
    return out;
}

} // namespace ramm
