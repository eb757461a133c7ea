//! # JSON Module Tests
//!
//! Parsing, serialization and equality of the JSON values used by the bundle
//! manifest file.

#include "json/json_parser.hpp"
#include "json/json_value.hpp"

#include <gtest/gtest.h>

using namespace lspack;
using namespace lspack::json;

// ============================================================================
// Parser
// ============================================================================

TEST(JsonParserTest, ParsesScalars) {
    auto null_v = parse_json("null");
    ASSERT_TRUE(is_ok(null_v));
    EXPECT_TRUE(unwrap(null_v).is_null());

    auto t = parse_json(" true ");
    ASSERT_TRUE(is_ok(t));
    EXPECT_TRUE(unwrap(t).as_bool());

    auto n = parse_json("-42");
    ASSERT_TRUE(is_ok(n));
    EXPECT_TRUE(unwrap(n).is_integer());
    EXPECT_EQ(unwrap(n).as_i64(), -42);

    auto f = parse_json("2.5e3");
    ASSERT_TRUE(is_ok(f));
    EXPECT_FALSE(unwrap(f).is_integer());
    EXPECT_DOUBLE_EQ(unwrap(f).as_f64(), 2500.0);
}

TEST(JsonParserTest, ParsesStringEscapes) {
    auto s = parse_json(R"("ui\/index.html\n\"q\" \u00e9")");
    ASSERT_TRUE(is_ok(s));
    EXPECT_EQ(unwrap(s).as_string(), "ui/index.html\n\"q\" \xC3\xA9");
}

TEST(JsonParserTest, ParsesManifestShapedDocument) {
    auto parsed = parse_json(R"({
        "version": 1,
        "target": "linux-x86_64-none",
        "entries": [
            {"source": "/src/ui/index.html", "dest": "ui/index.html", "kind": "source"},
            {"source": "/env/llama_cpp/lib/libllama.so", "dest": "llama_cpp/lib/libllama.so",
             "kind": "native_binary"}
        ],
        "hidden_modules": ["flask", "llama_cpp"]
    })");
    ASSERT_TRUE(is_ok(parsed)) << unwrap_err(parsed).to_string();
    const auto& root = unwrap(parsed);

    EXPECT_EQ(root.get("version")->as_i64(), 1);
    EXPECT_EQ(root.get_string("target"), "linux-x86_64-none");
    EXPECT_FALSE(root.get_string("version").has_value());
    EXPECT_EQ(root.get("missing"), nullptr);

    const auto& entries = root.get("entries")->as_array();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].get_string("kind"), "native_binary");
    EXPECT_EQ(root.get("hidden_modules")->as_array()[1].as_string(), "llama_cpp");
}

TEST(JsonParserTest, ReportsErrorsWithLocation) {
    auto result = parse_json("{\n  \"dest\" \"ui\"\n}");
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.message, "Expected ':' after key");
    EXPECT_EQ(err.line, 2u);
    EXPECT_NE(err.to_string().find("line 2"), std::string::npos);
}

TEST(JsonParserTest, RejectsMalformedInput) {
    const char* cases[] = {
        "",            "[1,]",      "{\"a\": 1,}", "\"open", "tru",
        "{\"a\" 1}",   "[1 2]",     "-",           "{} {}",  "\"bad \\q\"",
    };
    for (const char* text : cases) {
        EXPECT_TRUE(is_err(parse_json(text))) << text;
    }
}

TEST(JsonParserTest, RejectsDeepNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    auto result = parse_json(deep);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Nesting too deep");
}

// ============================================================================
// Serializer
// ============================================================================

TEST(JsonSerializerTest, CompactOutputSortsKeys) {
    JsonObject obj;
    obj["kind"] = JsonValue("source");
    obj["dest"] = JsonValue("ui/app.js");
    obj["size"] = JsonValue(int64_t{21});
    EXPECT_EQ(JsonValue(std::move(obj)).to_string(),
              R"({"dest":"ui/app.js","kind":"source","size":21})");
}

TEST(JsonSerializerTest, PrettyOutput) {
    JsonObject obj;
    obj["hidden_modules"] = json_string_array({"flask", "webview"});
    obj["empty"] = JsonValue(JsonArray{});
    EXPECT_EQ(JsonValue(std::move(obj)).to_string_pretty(),
              "{\n  \"empty\": [],\n  \"hidden_modules\": [\n    \"flask\",\n    \"webview\"\n  ]\n}");
}

TEST(JsonSerializerTest, EscapesStrings) {
    EXPECT_EQ(JsonValue("C:\\dist\t\"x\"").to_string(), R"("C:\\dist\t\"x\"")");
    EXPECT_EQ(JsonValue(std::string("\x02", 1)).to_string(), "\"\\u0002\"");
}

TEST(JsonSerializerTest, DoublesKeepTheirType) {
    EXPECT_EQ(JsonValue(3.0).to_string(), "3.0");
    EXPECT_EQ(JsonValue(0.5).to_string(), "0.5");
}

TEST(JsonSerializerTest, OutputParsesBackEqual) {
    JsonObject entry;
    entry["dest"] = JsonValue("backends/llama_backend.py");
    entry["origin"] = JsonValue("backends");
    JsonArray entries;
    entries.push_back(JsonValue(std::move(entry)));
    JsonObject root;
    root["entries"] = JsonValue(std::move(entries));
    root["sealed"] = JsonValue(true);
    JsonValue original(std::move(root));

    auto reparsed = parse_json(original.to_string_pretty());
    ASSERT_TRUE(is_ok(reparsed));
    EXPECT_TRUE(unwrap(reparsed) == original);
}

// ============================================================================
// Value Operations
// ============================================================================

TEST(JsonValueTest, CloneIsDeep) {
    JsonValue original(JsonArray{});
    original.push(JsonValue("ui/index.html"));

    JsonValue copy = original.clone();
    copy.push(JsonValue("ui/static/app.js"));

    EXPECT_EQ(original.as_array().size(), 1u);
    EXPECT_EQ(copy.as_array().size(), 2u);
    EXPECT_FALSE(original == copy);
}

TEST(JsonValueTest, EqualityComparesTypes) {
    EXPECT_FALSE(JsonValue(1) == JsonValue(1.0));
    EXPECT_TRUE(JsonValue("a") == JsonValue(std::string("a")));
    EXPECT_TRUE(JsonValue() == JsonValue());
}
