//! # JSON Parser
//!
//! Recursive descent parser building `JsonValue` trees, with line/column
//! tracking for error messages and a nesting limit.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(text);
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace lspack::json {

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input) {}

    /// Parses the whole input; trailing non-whitespace is an error.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;
    static constexpr size_t MAX_DEPTH = 256;

    [[nodiscard]] auto is_eof() const -> bool {
        return pos_ >= input_.size();
    }
    [[nodiscard]] auto peek() const -> char {
        return is_eof() ? '\0' : input_[pos_];
    }
    auto advance() -> char;
    void skip_whitespace();
    auto consume_literal(std::string_view word) -> bool;

    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
};

/// Parses a JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace lspack::json
