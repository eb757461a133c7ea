//! # JSON Serializer
//!
//! Compact and pretty-printed output for `JsonValue`, plus deep copy and
//! equality.
//!
//! ## String Escaping
//!
//! | Character           | Escape Sequence |
//! |---------------------|-----------------|
//! | `"`                 | `\"`            |
//! | `\`                 | `\\`            |
//! | Line feed           | `\n`            |
//! | Carriage return     | `\r`            |
//! | Tab                 | `\t`            |
//! | Control (0x00-0x1F) | `\uXXXX`        |

#include "json/json_value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace lspack::json {

namespace {

auto escape_string(const std::string& s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                result += oss.str();
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

auto format_double(double value) -> std::string {
    if (std::isnan(value) || std::isinf(value)) {
        return "null"; // not representable in JSON
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    std::string out = oss.str();
    if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
    }
    return out;
}

void write_value(std::ostringstream& os, const JsonValue& value, int indent, int depth) {
    auto newline = [&](int level) {
        if (indent > 0) {
            os << '\n' << std::string(static_cast<size_t>(indent * level), ' ');
        }
    };

    if (value.is_null()) {
        os << "null";
    } else if (value.is_bool()) {
        os << (value.as_bool() ? "true" : "false");
    } else if (value.is_integer()) {
        os << std::get<int64_t>(value.data);
    } else if (value.is_number()) {
        os << format_double(std::get<double>(value.data));
    } else if (value.is_string()) {
        os << '"' << escape_string(value.as_string()) << '"';
    } else if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            os << "[]";
            return;
        }
        os << '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0)
                os << ',';
            newline(depth + 1);
            write_value(os, arr[i], indent, depth + 1);
        }
        newline(depth);
        os << ']';
    } else if (value.is_object()) {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            os << "{}";
            return;
        }
        os << '{';
        bool first = true;
        for (const auto& [key, member] : obj) {
            if (!first)
                os << ',';
            first = false;
            newline(depth + 1);
            os << '"' << escape_string(key) << '"' << (indent > 0 ? ": " : ":");
            write_value(os, member, indent, depth + 1);
        }
        newline(depth);
        os << '}';
    }
}

} // namespace

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        auto it = (*obj)->find(key);
        if (it != (*obj)->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

auto JsonValue::get_string(const std::string& key) const -> std::optional<std::string> {
    const JsonValue* member = get(key);
    if (member == nullptr || !member->is_string()) {
        return std::nullopt;
    }
    return member->as_string();
}

auto JsonValue::to_string() const -> std::string {
    std::ostringstream os;
    write_value(os, *this, 0, 0);
    return os.str();
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::ostringstream os;
    write_value(os, *this, indent, 0);
    return os.str();
}

auto JsonValue::clone() const -> JsonValue {
    if (is_array()) {
        JsonArray arr;
        arr.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            arr.push_back(elem.clone());
        }
        return JsonValue(std::move(arr));
    }
    if (is_object()) {
        JsonObject obj;
        for (const auto& [key, val] : as_object()) {
            obj[key] = val.clone();
        }
        return JsonValue(std::move(obj));
    }

    JsonValue copy;
    std::visit(
        [&copy](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (!std::is_same_v<T, Box<JsonArray>> &&
                          !std::is_same_v<T, Box<JsonObject>>) {
                copy.data = v;
            }
        },
        data);
    return copy;
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_array()) {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size())
            return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (!(a[i] == b[i]))
                return false;
        }
        return true;
    }
    if (is_object()) {
        const auto& a = as_object();
        const auto& b = other.as_object();
        if (a.size() != b.size())
            return false;
        for (const auto& [key, val] : a) {
            auto it = b.find(key);
            if (it == b.end() || !(val == it->second))
                return false;
        }
        return true;
    }
    return data == other.data;
}

auto json_string_array(const std::vector<std::string>& items) -> JsonValue {
    JsonArray arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.emplace_back(item);
    }
    return JsonValue(std::move(arr));
}

} // namespace lspack::json
