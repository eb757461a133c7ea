//! # JSON Values
//!
//! Value tree used for persisted build state (`manifest.json`), read back by
//! `lspack manifest-check`.
//!
//! ## Number Handling
//!
//! | JSON Input | Storage Type | Reason             |
//! |------------|--------------|--------------------|
//! | `42`       | `int64_t`    | No decimal point   |
//! | `3.14`     | `double`     | Has decimal point  |
//! | `1e10`     | `double`     | Has exponent       |
//!
//! ## Example
//!
//! ```cpp
//! JsonValue obj(JsonObject{});
//! obj.set("dest", JsonValue("ui/index.html"));
//! obj.set("size", JsonValue(int64_t{1024}));
//! std::string text = obj.to_string_pretty();
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lspack::json {

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object (ordered by key, so output is deterministic).
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonError
// ============================================================================

/// An error encountered while parsing JSON.
struct JsonError {
    std::string message;
    /// 1-based line number (0 if unknown).
    size_t line = 0;
    /// 1-based column number (0 if unknown).
    size_t column = 0;

    static auto make(std::string msg, size_t line = 0, size_t column = 0) -> JsonError {
        return JsonError{std::move(msg), line, column};
    }

    /// "line X, column Y: message", or just the message without a location.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        return message;
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// A JSON value. Arrays and objects are boxed, so values are move-only;
/// use `clone()` for a deep copy.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      int64_t,          // integer
                                      double,           // float
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(static_cast<int64_t>(value)) {}
    explicit JsonValue(int64_t value) : data(value) {}
    explicit JsonValue(double value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    JsonValue(JsonValue&&) noexcept = default;
    JsonValue& operator=(JsonValue&&) noexcept = default;

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return is_integer() || std::holds_alternative<double>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Accessors (throw std::bad_variant_access on a type mismatch)
    // ========================================================================

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_i64() const -> int64_t {
        if (auto* d = std::get_if<double>(&data)) {
            return static_cast<int64_t>(*d);
        }
        return std::get<int64_t>(data);
    }
    [[nodiscard]] auto as_f64() const -> double {
        if (auto* i = std::get_if<int64_t>(&data)) {
            return static_cast<double>(*i);
        }
        return std::get<double>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Looks up a key in an object. Returns nullptr if absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// String member or nullopt.
    [[nodiscard]] auto get_string(const std::string& key) const -> std::optional<std::string>;

    // ========================================================================
    // Mutation
    // ========================================================================

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Compact output without whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Pretty-printed output with newlines and `indent` spaces per level.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

/// Array of strings.
[[nodiscard]] auto json_string_array(const std::vector<std::string>& items) -> JsonValue;

} // namespace lspack::json
