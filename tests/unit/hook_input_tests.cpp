#include <doctest/doctest.h>
#include <worthit/hook_input.hpp>

using namespace worthit;
using json = nlohmann::json;

TEST_CASE("valid payload returns the raw path unmodified") {
    auto r = validate_hook_input(json{{"transcript_path", "/tmp/test.jsonl"}});
    REQUIRE(r.ok);
    CHECK(r.error == InputError::None);
    CHECK(r.transcript_path == "/tmp/test.jsonl");
}

TEST_CASE("raw path is not normalized or checked here") {
    // Deny-list and canonicalization belong to the path sanitizer
    auto r = validate_hook_input(json{{"transcript_path", "./a/../b//c.jsonl"}});
    REQUIRE(r.ok);
    CHECK(r.transcript_path == "./a/../b//c.jsonl");
}

TEST_CASE("extra fields are ignored") {
    auto r = validate_hook_input(json{
        {"session_id", "abc"},
        {"hook_event_name", "Stop"},
        {"transcript_path", "/tmp/t.jsonl"},
    });
    REQUIRE(r.ok);
    CHECK(r.transcript_path == "/tmp/t.jsonl");
}

TEST_CASE("non-object payloads are structural errors") {
    SUBCASE("string") {
        auto r = validate_hook_input(json("not a dict"));
        CHECK_FALSE(r.ok);
        CHECK(r.error == InputError::NotAnObject);
        CHECK(r.message.find("must be a dict") != std::string::npos);
    }
    SUBCASE("array") {
        auto r = validate_hook_input(json::array({"transcript_path", "/tmp/x"}));
        CHECK(r.error == InputError::NotAnObject);
    }
    SUBCASE("null") {
        auto r = validate_hook_input(json(nullptr));
        CHECK(r.error == InputError::NotAnObject);
    }
    SUBCASE("number") {
        auto r = validate_hook_input(json(42));
        CHECK(r.error == InputError::NotAnObject);
    }
}

TEST_CASE("missing transcript_path") {
    auto r = validate_hook_input(json::object());
    CHECK_FALSE(r.ok);
    CHECK(r.error == InputError::MissingField);
    CHECK(r.message.find("Missing transcript_path") != std::string::npos);

    auto other = validate_hook_input(json{{"other_field", "value"}});
    CHECK(other.error == InputError::MissingField);
}

TEST_CASE("falsy transcript_path values count as missing") {
    CHECK(validate_hook_input(json{{"transcript_path", ""}}).error == InputError::MissingField);
    CHECK(validate_hook_input(json{{"transcript_path", nullptr}}).error == InputError::MissingField);
    CHECK(validate_hook_input(json{{"transcript_path", false}}).error == InputError::MissingField);
    CHECK(validate_hook_input(json{{"transcript_path", 0}}).error == InputError::MissingField);
    CHECK(validate_hook_input(json{{"transcript_path", 0.0}}).error == InputError::MissingField);
    CHECK(validate_hook_input(json{{"transcript_path", json::array()}}).error == InputError::MissingField);
    CHECK(validate_hook_input(json{{"transcript_path", json::object()}}).error == InputError::MissingField);
}

TEST_CASE("truthy non-string transcript_path is a type error") {
    auto r = validate_hook_input(json{{"transcript_path", 123}});
    CHECK_FALSE(r.ok);
    CHECK(r.error == InputError::WrongType);
    CHECK(r.message.find("must be string") != std::string::npos);

    CHECK(validate_hook_input(json{{"transcript_path", true}}).error == InputError::WrongType);
    CHECK(validate_hook_input(json{{"transcript_path", json::array({"/tmp/x"})}}).error ==
          InputError::WrongType);
    CHECK(validate_hook_input(json{{"transcript_path", {{"path", "/tmp/x"}}}}).error ==
          InputError::WrongType);
}

TEST_CASE("each failure has a distinct category") {
    auto structural = validate_hook_input(json("x"));
    auto missing = validate_hook_input(json::object());
    auto type = validate_hook_input(json{{"transcript_path", 1}});
    CHECK(structural.error != missing.error);
    CHECK(missing.error != type.error);
    CHECK(structural.error != type.error);
    CHECK(std::string(input_error_to_string(structural.error)) == "structural_error");
    CHECK(std::string(input_error_to_string(missing.error)) == "missing_field");
    CHECK(std::string(input_error_to_string(type.error)) == "type_error");
}

TEST_CASE("parse_hook_input decodes then validates") {
    SUBCASE("valid text") {
        auto r = parse_hook_input(R"({"transcript_path": "/tmp/t.jsonl"})");
        REQUIRE(r.ok);
        CHECK(r.transcript_path == "/tmp/t.jsonl");
    }
    SUBCASE("malformed text") {
        auto r = parse_hook_input("not valid json");
        CHECK_FALSE(r.ok);
        CHECK(r.error == InputError::MalformedJson);
    }
    SUBCASE("empty text") {
        CHECK(parse_hook_input("").error == InputError::MalformedJson);
    }
    SUBCASE("valid JSON, wrong shape") {
        CHECK(parse_hook_input(R"(["a"])").error == InputError::NotAnObject);
        CHECK(parse_hook_input("{}").error == InputError::MissingField);
        CHECK(parse_hook_input(R"({"transcript_path": 123})").error == InputError::WrongType);
    }
}
