#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ramm {

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Minimal JSON document model shared by the config loader, the wire codec
// and the step log. Objects keep insertion order so written records are
// stable and diffable.
struct JsonValue {
    enum Type { Null, Bool, Number, String, Array, Object };
    Type type = Null;
    bool boolean = false;
    double number = 0;
    std::string str;
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;

    static JsonValue make_bool(bool b);
    static JsonValue make_number(double n);
    static JsonValue make_string(std::string s);
    static JsonValue make_array();
    static JsonValue make_object();

    bool is_null()   const { return type == Null; }
    bool is_number() const { return type == Number; }
    bool is_string() const { return type == String; }
    bool is_object() const { return type == Object; }
    bool is_array()  const { return type == Array; }

    const JsonValue* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    double get_number(const std::string& key, double def = 0) const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    std::string get_string(const std::string& key, const std::string& def = "") const;
    const JsonValue* get_array(const std::string& key) const;
    const JsonValue* get_object(const std::string& key) const;

    // Builders. set() replaces an existing key in place.
    JsonValue& set(const std::string& key, JsonValue value);
    JsonValue& push(JsonValue value);
};

// Throws ParseError on malformed input or trailing garbage.
JsonValue parse_json(const std::string& input);

// Compact single-line serialization. Non-finite numbers are written as null.
std::string to_json(const JsonValue& value);

} // namespace ramm
