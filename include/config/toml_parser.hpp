//! # TOML Subset Parser
//!
//! `SimpleTomlParser` reads the subset of TOML used by `lspack.toml`:
//!
//! | Construct            | Example                          |
//! |----------------------|----------------------------------|
//! | Table                | `[app]`                          |
//! | Array of tables      | `[[dependency]]`                 |
//! | String               | `name = "LocalLLM Studio"`       |
//! | Integer              | `api-port = 8000`                |
//! | Boolean              | `required = true`                |
//! | String array         | `sources = ["ui", "backends"]`   |
//! | Comment              | `# ...`                          |
//!
//! Inline tables, dotted keys, floats and dates are rejected with an error.

#ifndef LSPACK_CONFIG_TOML_PARSER_HPP
#define LSPACK_CONFIG_TOML_PARSER_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lspack::config {

using TomlValue = std::variant<std::string, int64_t, bool, std::vector<std::string>>;

/**
 * Key/value pairs of one table, plus the line each key was defined on
 */
struct TomlTable {
    std::map<std::string, TomlValue> values;
    std::map<std::string, int> lines;
    int header_line = 0;

    bool has(const std::string& key) const {
        return values.count(key) > 0;
    }
};

/**
 * Parsed document. Keys before the first header land in the "" table.
 */
struct TomlDocument {
    std::map<std::string, TomlTable> tables;
    std::map<std::string, std::vector<TomlTable>> table_arrays;

    const TomlTable* table(const std::string& name) const;
    const std::vector<TomlTable>& array(const std::string& name) const;
};

class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    /**
     * Parse the whole document. Returns nullopt on the first error.
     */
    std::optional<TomlDocument> parse();

    /**
     * Get error message if parsing failed ("Line N: ...")
     */
    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_inline_whitespace();
    void skip_comment();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::string parse_identifier();
    std::optional<std::string> parse_string();
    std::optional<int64_t> parse_number();
    std::optional<bool> parse_boolean();
    std::optional<std::vector<std::string>> parse_string_array();
    std::optional<TomlValue> parse_value();

    bool parse_header(TomlDocument& doc, TomlTable*& current);
    bool expect_line_end();

    void set_error(const std::string& message);
};

} // namespace lspack::config

#endif // LSPACK_CONFIG_TOML_PARSER_HPP
