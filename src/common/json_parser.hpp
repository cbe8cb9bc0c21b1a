/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * json_parser.hpp - Small JSON reader for run configuration files
 *
 * Features:
 *   - Parse JSON config files into a JsonValue tree
 *   - Typed accessors with defaults, dot-path lookup
 *   - Serializer for reports (statistics --json)
 *   - Header-only, no external dependencies
 */

#ifndef LFICHEF_JSON_PARSER_HPP
#define LFICHEF_JSON_PARSER_HPP

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <cstdint>

namespace lfichef {

enum class JsonType {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

/**
 * Any JSON value. Objects keep their keys sorted so that
 * serialized reports are stable between runs.
 */
class JsonValue {
public:
    JsonType type = JsonType::Null;

    bool bool_value = false;
    double number_value = 0.0;
    std::string string_value;
    std::vector<JsonValue> array_value;
    std::map<std::string, JsonValue> object_value;

    JsonValue() : type(JsonType::Null) {}
    JsonValue(bool v) : type(JsonType::Bool), bool_value(v) {}
    JsonValue(int v) : type(JsonType::Number), number_value(v) {}
    JsonValue(double v) : type(JsonType::Number), number_value(v) {}
    JsonValue(const std::string& v) : type(JsonType::String), string_value(v) {}
    JsonValue(const char* v) : type(JsonType::String), string_value(v) {}

    static JsonValue object() {
        JsonValue v;
        v.type = JsonType::Object;
        return v;
    }

    bool isNull() const { return type == JsonType::Null; }
    bool isBool() const { return type == JsonType::Bool; }
    bool isNumber() const { return type == JsonType::Number; }
    bool isString() const { return type == JsonType::String; }
    bool isArray() const { return type == JsonType::Array; }
    bool isObject() const { return type == JsonType::Object; }

    bool asBool(bool def = false) const {
        return isBool() ? bool_value : def;
    }

    double asDouble(double def = 0.0) const {
        return isNumber() ? number_value : def;
    }

    int asInt(int def = 0) const {
        return isNumber() ? static_cast<int>(number_value) : def;
    }

    std::string asString(const std::string& def = "") const {
        return isString() ? string_value : def;
    }

    size_t size() const {
        if (isArray()) return array_value.size();
        if (isObject()) return object_value.size();
        return 0;
    }

    const JsonValue& operator[](size_t index) const {
        static const JsonValue null_value;
        if (!isArray() || index >= array_value.size()) {
            return null_value;
        }
        return array_value[index];
    }

    const JsonValue& operator[](const std::string& key) const {
        static const JsonValue null_value;
        if (!isObject()) return null_value;
        auto it = object_value.find(key);
        return it != object_value.end() ? it->second : null_value;
    }

    // writable member access, turns a null into an object
    JsonValue& set(const std::string& key, JsonValue value) {
        if (!isObject()) {
            *this = object();
        }
        object_value[key] = std::move(value);
        return object_value[key];
    }

    bool has(const std::string& key) const {
        return isObject() && object_value.find(key) != object_value.end();
    }

    // nested lookup, e.g. get("traversal.range")
    const JsonValue& get(const std::string& path) const {
        size_t dot = path.find('.');
        if (dot == std::string::npos) {
            return (*this)[path];
        }
        return (*this)[path.substr(0, dot)].get(path.substr(dot + 1));
    }

    std::vector<std::string> asStringArray() const {
        std::vector<std::string> result;
        if (isArray()) {
            for (const auto& item : array_value) {
                if (item.isString()) {
                    result.push_back(item.string_value);
                }
            }
        }
        return result;
    }
};

/**
 * Recursive descent parser
 */
class JsonParser {
public:
    /**
     * @throws std::runtime_error on malformed input
     */
    static JsonValue parse(const std::string& json) {
        JsonParser parser(json);
        JsonValue value = parser.parseValue();
        parser.skipWhitespace();
        if (parser.pos_ != parser.json_.size()) {
            throw std::runtime_error("Trailing characters at position " +
                                     std::to_string(parser.pos_));
        }
        return value;
    }

    /**
     * @throws std::runtime_error on file or parse error
     */
    static JsonValue parseFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file: " + path);
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        return parse(content);
    }

private:
    std::string json_;
    size_t pos_ = 0;

    explicit JsonParser(const std::string& json) : json_(json) {}

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char get() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skipWhitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            pos_++;
        }
    }

    void expect(char c) {
        skipWhitespace();
        if (get() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " +
                                     std::to_string(pos_));
        }
    }

    void expectLiteral(const char* literal) {
        for (const char* p = literal; *p; ++p) {
            if (get() != *p) {
                throw std::runtime_error(std::string("Invalid literal, expected ") + literal);
            }
        }
    }

    JsonValue parseValue() {
        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') { expectLiteral("true"); return JsonValue(true); }
        if (c == 'f') { expectLiteral("false"); return JsonValue(false); }
        if (c == 'n') { expectLiteral("null"); return JsonValue(); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        throw std::runtime_error("Unexpected character at position " + std::to_string(pos_));
    }

    static void appendUtf8(std::string& out, uint32_t cp) {
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

    JsonValue parseString() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = get();

            if (c == '"') {
                return JsonValue(result);
            }

            if (c != '\\') {
                result += c;
                continue;
            }

            char escaped = get();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > json_.size()) {
                        throw std::runtime_error("Truncated \\u escape");
                    }
                    std::string hex = json_.substr(pos_, 4);
                    for (char h : hex) {
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            throw std::runtime_error("Invalid \\u escape: " + hex);
                        }
                    }
                    pos_ += 4;
                    appendUtf8(result, static_cast<uint32_t>(std::stoul(hex, nullptr, 16)));
                    break;
                }
                default:
                    throw std::runtime_error(std::string("Invalid escape \\") + escaped);
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    JsonValue parseNumber() {
        size_t start = pos_;

        if (peek() == '-') pos_++;
        while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) pos_++;

        if (peek() == '.') {
            pos_++;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) pos_++;
        }

        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) pos_++;
        }

        std::string num = json_.substr(start, pos_ - start);
        try {
            return JsonValue(std::stod(num));
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid number: " + num);
        }
    }

    JsonValue parseArray() {
        expect('[');
        JsonValue v;
        v.type = JsonType::Array;

        skipWhitespace();
        if (peek() == ']') {
            get();
            return v;
        }

        while (true) {
            v.array_value.push_back(parseValue());
            skipWhitespace();
            if (peek() == ']') {
                get();
                return v;
            }
            expect(',');
        }
    }

    JsonValue parseObject() {
        expect('{');
        JsonValue v = JsonValue::object();

        skipWhitespace();
        if (peek() == '}') {
            get();
            return v;
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                throw std::runtime_error("Object key must be a string at position " +
                                         std::to_string(pos_));
            }
            std::string key = parseString().string_value;

            expect(':');
            v.object_value[key] = parseValue();

            skipWhitespace();
            if (peek() == '}') {
                get();
                return v;
            }
            expect(',');
        }
    }
};

/**
 * Convert a JsonValue back to text
 */
class JsonSerializer {
public:
    static std::string serialize(const JsonValue& value, bool pretty = true, int indent = 0) {
        std::ostringstream oss;
        serializeValue(oss, value, pretty, indent);
        return oss.str();
    }

    static std::string escapeString(const std::string& s) {
        std::string result;
        for (char c : s) {
            switch (c) {
                case '"': result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default: result += c;
            }
        }
        return result;
    }

private:
    static void serializeValue(std::ostringstream& oss, const JsonValue& v,
                               bool pretty, int indent) {
        switch (v.type) {
            case JsonType::Null:
                oss << "null";
                break;
            case JsonType::Bool:
                oss << (v.bool_value ? "true" : "false");
                break;
            case JsonType::Number:
                oss << v.number_value;
                break;
            case JsonType::String:
                oss << '"' << escapeString(v.string_value) << '"';
                break;
            case JsonType::Array:
                serializeArray(oss, v, pretty, indent);
                break;
            case JsonType::Object:
                serializeObject(oss, v, pretty, indent);
                break;
        }
    }

    static void serializeArray(std::ostringstream& oss, const JsonValue& v,
                               bool pretty, int indent) {
        oss << '[';

        bool first = true;
        for (const auto& item : v.array_value) {
            if (!first) oss << ',';
            if (pretty) oss << '\n' << std::string(indent + 2, ' ');
            serializeValue(oss, item, pretty, indent + 2);
            first = false;
        }

        if (pretty && !v.array_value.empty()) {
            oss << '\n' << std::string(indent, ' ');
        }
        oss << ']';
    }

    static void serializeObject(std::ostringstream& oss, const JsonValue& v,
                                bool pretty, int indent) {
        oss << '{';

        bool first = true;
        for (const auto& [key, value] : v.object_value) {
            if (!first) oss << ',';
            if (pretty) oss << '\n' << std::string(indent + 2, ' ');
            oss << '"' << escapeString(key) << "\":";
            if (pretty) oss << ' ';
            serializeValue(oss, value, pretty, indent + 2);
            first = false;
        }

        if (pretty && !v.object_value.empty()) {
            oss << '\n' << std::string(indent, ' ');
        }
        oss << '}';
    }
};

} // namespace lfichef

#endif // LFICHEF_JSON_PARSER_HPP
