#include "utils/simple_json.h"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace SimpleJson {

Value::Value(Type t) : type(t), number_value(0.0), bool_value(false) {}

const Value* Value::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    auto it = object_values.find(key);
    if (it == object_values.end()) return nullptr;
    return &it->second;
}

Value Value::number(double v) {
    Value out(Type::Number);
    out.number_value = v;
    return out;
}

Value Value::boolean(bool v) {
    Value out(Type::Bool);
    out.bool_value = v;
    return out;
}

Value Value::string(const std::string& v) {
    Value out(Type::String);
    out.string_value = v;
    return out;
}

namespace {

// Nesting limit keeps recursion bounded on hostile input
const int kMaxDepth = 64;

class Reader {
public:
    explicit Reader(const std::string& input) : input_(input), pos_(0), depth_(0) {}

    bool read(Value& out, std::string& error) {
        skipWhitespace();
        bool ok = readValue(out);
        if (ok) {
            skipWhitespace();
            if (pos_ != input_.size()) {
                fail("unexpected trailing characters");
                ok = false;
            }
        }
        if (!ok) {
            error = location() + ": " + error_;
        }
        return ok;
    }

private:
    const std::string& input_;
    size_t pos_;
    int depth_;
    std::string error_;

    bool fail(const std::string& message) {
        if (error_.empty()) error_ = message;
        return false;
    }

    std::string location() const {
        size_t line = 1;
        size_t column = 1;
        for (size_t i = 0; i < pos_ && i < input_.size(); ++i) {
            if (input_[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        std::ostringstream oss;
        oss << "line " << line << ", column " << column;
        return oss.str();
    }

    bool atEnd() const { return pos_ >= input_.size(); }

    bool readValue(Value& out) {
        if (atEnd()) return fail("unexpected end of input");
        switch (input_[pos_]) {
            case '{': return readObject(out);
            case '[': return readArray(out);
            case '"':
                out = Value(Type::String);
                return readString(out.string_value);
            case 't':
                out = Value::boolean(true);
                return expectWord("true");
            case 'f':
                out = Value::boolean(false);
                return expectWord("false");
            case 'n':
                out = Value(Type::Null);
                return expectWord("null");
            default:
                break;
        }
        char c = input_[pos_];
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return readNumber(out);
        }
        return fail(std::string("unexpected character '") + c + "'");
    }

    bool readObject(Value& out) {
        if (++depth_ > kMaxDepth) return fail("nesting too deep");
        out = Value(Type::Object);
        ++pos_;
        skipWhitespace();
        if (consume('}')) {
            --depth_;
            return true;
        }
        for (;;) {
            skipWhitespace();
            if (atEnd() || input_[pos_] != '"') return fail("expected string key");
            std::string key;
            if (!readString(key)) return false;
            skipWhitespace();
            if (!consume(':')) return fail("expected ':' after key \"" + key + "\"");
            skipWhitespace();
            Value member;
            if (!readValue(member)) return false;
            out.object_values[key] = std::move(member);
            skipWhitespace();
            if (consume('}')) break;
            if (!consume(',')) return fail("expected ',' or '}' in object");
        }
        --depth_;
        return true;
    }

    bool readArray(Value& out) {
        if (++depth_ > kMaxDepth) return fail("nesting too deep");
        out = Value(Type::Array);
        ++pos_;
        skipWhitespace();
        if (consume(']')) {
            --depth_;
            return true;
        }
        for (;;) {
            skipWhitespace();
            Value element;
            if (!readValue(element)) return false;
            out.array_values.push_back(std::move(element));
            skipWhitespace();
            if (consume(']')) break;
            if (!consume(',')) return fail("expected ',' or ']' in array");
        }
        --depth_;
        return true;
    }

    static void appendUtf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    bool readString(std::string& out) {
        ++pos_;  // opening quote
        while (!atEnd()) {
            char c = input_[pos_++];
            if (c == '"') return true;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (atEnd()) break;
            char esc = input_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    if (pos_ + 4 > input_.size()) return fail("truncated \\u escape");
                    unsigned code = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = input_[pos_++];
                        code <<= 4;
                        if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
                        else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
                        else return fail("invalid hex digit in \\u escape");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default:
                    return fail(std::string("unsupported escape '\\") + esc + "'");
            }
        }
        return fail("unterminated string");
    }

    bool readNumber(Value& out) {
        const char* begin = input_.c_str() + pos_;
        char* end = nullptr;
        double v = std::strtod(begin, &end);
        if (end == begin) return fail("invalid number");
        pos_ += static_cast<size_t>(end - begin);
        if (!std::isfinite(v)) return fail("number out of range");
        out = Value::number(v);
        return true;
    }

    bool expectWord(const char* word) {
        std::string w(word);
        if (input_.compare(pos_, w.size(), w) != 0) {
            return fail("invalid literal");
        }
        pos_ += w.size();
        return true;
    }

    bool consume(char expected) {
        if (!atEnd() && input_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skipWhitespace() {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            ++pos_;
        }
    }
};

void writeString(std::ostringstream& oss, const std::string& s) {
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const Value& value) {
    switch (value.type) {
        case Type::Null: oss << "null"; break;
        case Type::Bool: oss << (value.bool_value ? "true" : "false"); break;
        case Type::Number: oss << value.number_value; break;
        case Type::String: writeString(oss, value.string_value); break;
        case Type::Array: {
            oss << '[';
            for (size_t i = 0; i < value.array_values.size(); ++i) {
                if (i > 0) oss << ',';
                writeValue(oss, value.array_values[i]);
            }
            oss << ']';
            break;
        }
        case Type::Object: {
            oss << '{';
            bool first = true;
            for (const auto& member : value.object_values) {
                if (!first) oss << ',';
                first = false;
                writeString(oss, member.first);
                oss << ':';
                writeValue(oss, member.second);
            }
            oss << '}';
            break;
        }
    }
}

}  // namespace

bool parse(const std::string& input, Value& out, std::string& error) {
    Reader reader(input);
    return reader.read(out, error);
}

std::string write(const Value& value) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    writeValue(oss, value);
    return oss.str();
}

bool toCount(double value, uint64_t& out) {
    // 2^64 is exact in a double
    const double limit = 18446744073709551616.0;
    if (!std::isfinite(value) || value < 0.0 || value >= limit || std::floor(value) != value) {
        return false;
    }
    out = static_cast<uint64_t>(value);
    return true;
}

bool readFile(const std::string& path, std::string& content) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    content = oss.str();
    return true;
}

}  // namespace SimpleJson
