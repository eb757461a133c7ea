#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace lspack::json {

auto JsonParser::advance() -> char {
    if (is_eof())
        return '\0';
    char c = input_[pos_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

void JsonParser::skip_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) {
        advance();
    }
}

auto JsonParser::consume_literal(std::string_view word) -> bool {
    if (input_.substr(pos_, word.size()) != word) {
        return false;
    }
    for (size_t i = 0; i < word.size(); ++i) {
        advance();
    }
    return true;
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    auto value = parse_value();
    if (is_err(value)) {
        return value;
    }
    skip_whitespace();
    if (!is_eof()) {
        return make_error("Unexpected trailing characters");
    }
    return value;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    char c = peek();

    switch (c) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto s = parse_string();
        if (is_err(s)) {
            return unwrap_err(s);
        }
        return JsonValue(std::move(unwrap(s)));
    }
    case 't':
        if (consume_literal("true"))
            return JsonValue(true);
        break;
    case 'f':
        if (consume_literal("false"))
            return JsonValue(false);
        break;
    case 'n':
        if (consume_literal("null"))
            return JsonValue();
        break;
    case '\0':
        return make_error("Unexpected end of input");
    default:
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parse_number();
        }
        break;
    }

    return make_error(std::string("Unexpected character '") + c + "'");
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Nesting too deep");
    }
    advance(); // Skip '{'

    JsonObject obj;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return make_error("Expected string key");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            return make_error("Expected ':' after key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[unwrap(key)] = std::move(unwrap(value));

        skip_whitespace();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (peek() == '}') {
            advance();
            break;
        }
        return make_error("Expected ',' or '}' in object");
    }

    --depth_;
    return JsonValue(std::move(obj));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Nesting too deep");
    }
    advance(); // Skip '['

    JsonArray arr;
    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        if (peek() == ',') {
            advance();
            continue;
        }
        if (peek() == ']') {
            advance();
            break;
        }
        return make_error("Expected ',' or ']' in array");
    }

    --depth_;
    return JsonValue(std::move(arr));
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"') {
        char c = advance();
        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("Control character in string");
        }
        if (c != '\\') {
            result += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
            result += '"';
            break;
        case '\\':
            result += '\\';
            break;
        case '/':
            result += '/';
            break;
        case 'b':
            result += '\b';
            break;
        case 'f':
            result += '\f';
            break;
        case 'n':
            result += '\n';
            break;
        case 'r':
            result += '\r';
            break;
        case 't':
            result += '\t';
            break;
        case 'u': {
            if (pos_ + 4 > input_.size()) {
                return make_error("Truncated \\u escape");
            }
            uint32_t cp = 0;
            auto hex = input_.substr(pos_, 4);
            auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, cp, 16);
            if (ec != std::errc() || ptr != hex.data() + 4) {
                return make_error("Invalid \\u escape");
            }
            for (int i = 0; i < 4; ++i)
                advance();
            append_utf8(result, cp);
            break;
        }
        default:
            return make_error(std::string("Invalid escape '\\") + escaped + "'");
        }
    }

    if (peek() != '"') {
        return make_error("Unterminated string");
    }
    advance(); // Skip closing quote
    return result;
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-')
        advance();
    while (std::isdigit(static_cast<unsigned char>(peek())))
        advance();
    if (peek() == '.') {
        is_float = true;
        advance();
        while (std::isdigit(static_cast<unsigned char>(peek())))
            advance();
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-')
            advance();
        while (std::isdigit(static_cast<unsigned char>(peek())))
            advance();
    }

    std::string text(input_.substr(start, pos_ - start));
    if (text == "-" || text.empty()) {
        return make_error("Invalid number");
    }

    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            return JsonValue(value);
        }
    }

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return make_error("Invalid number '" + text + "'");
    }
    return JsonValue(value);
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace lspack::json
