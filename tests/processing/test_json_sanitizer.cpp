#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "processing/JsonSanitizer.hpp"

#include <string>

using processing::clean_json_output;

TEST_CASE("clean_json_output strips control characters", "[processing][sanitizer]") {

    SECTION("Removes every control byte except tab, LF and CR") {
        std::string input = "a";
        for (int c = 0; c < 0x20; ++c) {
            input.push_back(static_cast<char>(c));
        }
        input += "b";

        REQUIRE(clean_json_output(input) == "a\t\n\rb");
    }

    SECTION("Keeps tab, newline and carriage return inside text") {
        REQUIRE(clean_json_output("x\ty\nz\rw") == "x\ty\nz\rw");
    }

    SECTION("Leaves multi-byte UTF-8 text untouched") {
        const std::string text = "{\"output\": \"\xE4\xBD\xA0\xE5\xA5\xBD \xF0\x9F\x98\x80\"}";
        REQUIRE(clean_json_output(text) == text);
    }

    SECTION("Makes a string with embedded control bytes parseable") {
        const std::string raw = std::string("{\"text\": \"This is") + '\x01' + '\x02' + '\x03' + "a test\"}";
        REQUIRE_THROWS(nlohmann::json::parse(raw));

        const auto parsed = nlohmann::json::parse(clean_json_output(raw));
        REQUIRE(parsed["text"] == "This isa test");
    }
}

TEST_CASE("clean_json_output strips wrappers", "[processing][sanitizer]") {

    SECTION("json tags") {
        REQUIRE(clean_json_output("<json>{\"a\": 1}</json>") == "{\"a\": 1}");
    }

    SECTION("Fenced json block") {
        REQUIRE(clean_json_output("```json\n[1, 2]\n```") == "[1, 2]");
    }

    SECTION("Bare fence") {
        REQUIRE(clean_json_output("```{\"a\": true}```") == "{\"a\": true}");
    }

    SECTION("Surrounding whitespace") {
        REQUIRE(clean_json_output("  \n {\"a\": 1} \t\n") == "{\"a\": 1}");
    }

    SECTION("Empty and whitespace-only input") {
        REQUIRE(clean_json_output("").empty());
        REQUIRE(clean_json_output(" \n\t ").empty());
    }
}

TEST_CASE("clean_json_output is idempotent", "[processing][sanitizer]") {
    const std::string samples[] = {
        "<json>```json\n{\"a\": \"b\x01\"}\n```</json>",
        std::string("plain text with \x1f unit separator"),
        "```\n[{\"id\": 1, \"output\": \"x\"}]\n```",
        "\t\n",
    };

    for (const auto& sample : samples) {
        const auto once = clean_json_output(sample);
        REQUIRE(clean_json_output(once) == once);
    }
}

TEST_CASE("ControlCharJsonSanitizer matches the free function", "[processing][sanitizer]") {
    processing::ControlCharJsonSanitizer sanitizer;
    const std::string input = "<json>{\"k\": \"v\x07\"}</json>";
    REQUIRE(sanitizer.clean(input) == clean_json_output(input));
}

TEST_CASE("Each rejected control byte is removed between multi-byte text", "[processing][sanitizer]") {
    for (int c = 0; c < 0x20; ++c) {
        if (c == '\t' || c == '\n' || c == '\r') {
            continue;
        }
        DYNAMIC_SECTION("byte " << c) {
            std::string reply = "[{\"id\": 1, \"output\": \"日本";
            reply.push_back(static_cast<char>(c));
            reply += "語のテキスト café\"}]";

            REQUIRE_THROWS_AS(nlohmann::json::parse(reply), nlohmann::json::parse_error);

            const auto parsed = nlohmann::json::parse(clean_json_output(reply));
            REQUIRE(parsed.size() == 1);
            REQUIRE(parsed[0]["id"] == 1);
            REQUIRE(parsed[0]["output"] == "日本語のテキスト café");
        }
    }
}
