#ifndef SIMPLE_JSON_H
#define SIMPLE_JSON_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace SimpleJson {

enum class Type {
    Null,
    Bool,
    Number,
    String,
    Object,
    Array
};

struct Value {
    Value(Type t = Type::Null);

    Type type;
    double number_value;
    bool bool_value;
    std::string string_value;
    std::map<std::string, Value> object_values;   // ordered for stable output
    std::vector<Value> array_values;

    bool isNull() const { return type == Type::Null; }
    bool isBool() const { return type == Type::Bool; }
    bool isNumber() const { return type == Type::Number; }
    bool isString() const { return type == Type::String; }
    bool isObject() const { return type == Type::Object; }
    bool isArray() const { return type == Type::Array; }

    const Value* find(const std::string& key) const;

    static Value number(double v);
    static Value boolean(bool v);
    static Value string(const std::string& v);
};

// Parses a complete document. On failure returns false and sets error to
// "line L, column C: message".
bool parse(const std::string& input, Value& out, std::string& error);

// Compact serialization; numbers use 17 significant digits so doubles
// survive a round trip.
std::string write(const Value& value);

// Converts a number holding a non-negative integer below 2^64; false for
// fractions, negatives, non-finite or out-of-range values.
bool toCount(double value, uint64_t& out);

// Reads a whole file into content; false when it cannot be opened
bool readFile(const std::string& path, std::string& content);

}  // namespace SimpleJson

#endif  // SIMPLE_JSON_H
