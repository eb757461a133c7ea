#include "config/toml_parser.hpp"

#include <cctype>
#include <stdexcept>

namespace lspack::config {

const TomlTable* TomlDocument::table(const std::string& name) const {
    auto it = tables.find(name);
    return it != tables.end() ? &it->second : nullptr;
}

const std::vector<TomlTable>& TomlDocument::array(const std::string& name) const {
    static const std::vector<TomlTable> empty;
    auto it = table_arrays.find(name);
    return it != table_arrays.end() ? it->second : empty;
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(const std::string& content) : content_(content) {}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof()) {
        char c = peek();
        if (c == '#') {
            skip_comment();
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else {
            break;
        }
    }
}

void SimpleTomlParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

char SimpleTomlParser::advance() {
    if (is_eof())
        return '\0';
    char c = content_[pos_++];
    if (c == '\n')
        line_++;
    return c;
}

std::string SimpleTomlParser::parse_identifier() {
    std::string result;
    while (!is_eof() &&
           (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '-')) {
        result += advance();
    }
    return result;
}

std::optional<std::string> SimpleTomlParser::parse_string() {
    if (peek() != '"') {
        set_error("Expected string");
        return std::nullopt;
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case 'r':
                result += '\r';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                set_error(std::string("Unknown escape sequence '\\") + escaped + "'");
                return std::nullopt;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return std::nullopt;
    }
    advance(); // Skip closing quote

    return result;
}

std::optional<int64_t> SimpleTomlParser::parse_number() {
    std::string num_str;
    if (peek() == '-' || peek() == '+') {
        num_str += advance();
    }
    while (!is_eof() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
        char c = advance();
        if (c != '_')
            num_str += c;
    }
    if (num_str.empty() || num_str == "-" || num_str == "+") {
        set_error("Expected number");
        return std::nullopt;
    }
    if (peek() == '.' || peek() == 'e' || peek() == 'E') {
        set_error("Floating point values are not supported");
        return std::nullopt;
    }
    try {
        return std::stoll(num_str);
    } catch (const std::out_of_range&) {
        set_error("Integer out of range");
        return std::nullopt;
    }
}

std::optional<bool> SimpleTomlParser::parse_boolean() {
    std::string value = parse_identifier();
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    set_error("Expected value, found '" + value + "'");
    return std::nullopt;
}

std::optional<std::vector<std::string>> SimpleTomlParser::parse_string_array() {
    std::vector<std::string> result;

    if (peek() != '[') {
        set_error("Expected array");
        return std::nullopt;
    }
    advance(); // Skip '['

    skip_whitespace();

    while (!is_eof() && peek() != ']') {
        if (peek() != '"') {
            set_error("Arrays may only contain strings");
            return std::nullopt;
        }
        auto item = parse_string();
        if (!item)
            return std::nullopt;
        result.push_back(std::move(*item));

        skip_whitespace();

        if (peek() == ',') {
            advance();
            skip_whitespace();
        } else if (peek() != ']') {
            set_error("Expected ',' or ']' in array");
            return std::nullopt;
        }
    }

    if (peek() != ']') {
        set_error("Expected closing bracket");
        return std::nullopt;
    }
    advance(); // Skip ']'

    return result;
}

std::optional<TomlValue> SimpleTomlParser::parse_value() {
    char c = peek();
    if (c == '"') {
        auto s = parse_string();
        if (!s)
            return std::nullopt;
        return TomlValue{std::move(*s)};
    }
    if (c == '[') {
        auto arr = parse_string_array();
        if (!arr)
            return std::nullopt;
        return TomlValue{std::move(*arr)};
    }
    if (c == '{') {
        set_error("Inline tables are not supported");
        return std::nullopt;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+') {
        auto n = parse_number();
        if (!n)
            return std::nullopt;
        return TomlValue{*n};
    }
    auto b = parse_boolean();
    if (!b)
        return std::nullopt;
    return TomlValue{*b};
}

bool SimpleTomlParser::expect_line_end() {
    skip_inline_whitespace();
    skip_comment();
    if (!is_eof() && peek() != '\n' && peek() != '\r') {
        set_error("Unexpected trailing characters");
        return false;
    }
    return true;
}

bool SimpleTomlParser::parse_header(TomlDocument& doc, TomlTable*& current) {
    int header_line = line_;
    advance(); // Skip '['
    bool is_array = false;
    if (peek() == '[') {
        advance();
        is_array = true;
    }

    skip_inline_whitespace();
    std::string name = parse_identifier();
    skip_inline_whitespace();

    if (name.empty()) {
        set_error("Expected table name");
        return false;
    }
    if (peek() == '.') {
        set_error("Dotted table names are not supported");
        return false;
    }
    if (peek() != ']' || (is_array && content_.compare(pos_, 2, "]]") != 0)) {
        set_error(is_array ? "Expected ']]'" : "Expected ']'");
        return false;
    }
    advance();
    if (is_array)
        advance();

    if (is_array) {
        auto& list = doc.table_arrays[name];
        list.emplace_back();
        current = &list.back();
    } else {
        if (doc.tables.count(name) > 0 && doc.tables[name].header_line != 0) {
            set_error("Duplicate table [" + name + "]");
            return false;
        }
        current = &doc.tables[name];
    }
    current->header_line = header_line;

    return expect_line_end();
}

std::optional<TomlDocument> SimpleTomlParser::parse() {
    TomlDocument doc;
    TomlTable* current = &doc.tables[""];

    while (true) {
        skip_whitespace();
        if (is_eof())
            break;

        if (peek() == '[') {
            if (!parse_header(doc, current))
                return std::nullopt;
            continue;
        }

        int key_line = line_;
        std::string key;
        if (peek() == '"') {
            auto quoted = parse_string();
            if (!quoted)
                return std::nullopt;
            key = std::move(*quoted);
        } else {
            key = parse_identifier();
        }
        if (key.empty()) {
            set_error(std::string("Unexpected character '") + peek() + "'");
            return std::nullopt;
        }

        skip_inline_whitespace();
        if (peek() != '=') {
            set_error("Expected '=' after key");
            return std::nullopt;
        }
        advance();
        skip_inline_whitespace();

        if (current->has(key)) {
            set_error("Duplicate key '" + key + "'");
            return std::nullopt;
        }

        auto value = parse_value();
        if (!value)
            return std::nullopt;

        current->values[key] = std::move(*value);
        current->lines[key] = key_line;

        if (!expect_line_end())
            return std::nullopt;
    }

    return doc;
}

void SimpleTomlParser::set_error(const std::string& message) {
    error_message_ = "Line " + std::to_string(line_) + ": " + message;
}

} // namespace lspack::config
