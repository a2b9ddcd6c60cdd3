#include <pathbind/bind/Validation.hpp>

#include "LogCapture.hpp"

#include <doctest/doctest.h>

using namespace PB;
using namespace PB::Bind;

TEST_SUITE("bind.validation") {

TEST_CASE("rule strings split on bars and on the first colon") {
    auto rules = parseRules("required||min:3|pattern:^a:b$|");
    REQUIRE(rules.size() == 3);
    CHECK(rules[0].name == "required");
    CHECK(rules[0].parameter.empty());
    CHECK(rules[1].name == "min");
    CHECK(rules[1].parameter == "3");
    CHECK(rules[2].name == "pattern");
    CHECK(rules[2].parameter == "^a:b$");
    CHECK(parseRules("").empty());
}

TEST_CASE("the first failing rule wins") {
    CHECK(validate(Value{""}, "required|min:3") == "This field is required");
    CHECK(validate(Value{"Jo"}, "required|min:3") == "Must be at least 3 characters");
    CHECK(validate(Value{"Joe"}, "required|min:3").empty());
    CHECK(validate(Value{}, "required") == "This field is required");
    CHECK(validate(Value{0}, "required").empty());
    CHECK(validate(Value{false}, "required").empty());
}

TEST_CASE("email") {
    CHECK(validate(Value{"ada@example.com"}, "email").empty());
    CHECK(validate(Value{"ada@example"}, "email") == "Invalid email address");
    CHECK(validate(Value{"a b@example.com"}, "email") == "Invalid email address");
    CHECK(validate(Value{""}, "email").empty());
}

TEST_CASE("numeric") {
    CHECK(validate(Value{"42"}, "numeric").empty());
    CHECK(validate(Value{" 4.5 "}, "numeric").empty());
    CHECK(validate(Value{"4x"}, "numeric") == "Must be a number");
    CHECK(validate(Value{7}, "numeric").empty());
    CHECK(validate(Value{""}, "numeric").empty());
}

TEST_CASE("min and max by length or magnitude") {
    CHECK(validate(Value{10}, "min:18") == "Must be at least 18");
    CHECK(validate(Value{20}, "min:18").empty());
    CHECK(validate(Value{120}, "max:99") == "Must be no more than 99");
    CHECK(validate(Value{"abcdef"}, "max:5") == "Must be no more than 5 characters");
    CHECK(validate(Value{"abcde"}, "max:5").empty());
    CHECK(validate(Value{1.25}, "min:1.5") == "Must be at least 1.5");
    CHECK(validate(Value{true}, "min:3").empty());
    CHECK(validate(Value{"x"}, "min:abc").empty());
}

TEST_CASE("pattern") {
    CHECK(validate(Value{"AB-12"}, "pattern:^[A-Z]{2}-\\d+$").empty());
    CHECK(validate(Value{"ab-12"}, "pattern:^[A-Z]{2}-\\d+$") == "Invalid format");
    CHECK(validate(Value{""}, "pattern:^x$").empty());
}

TEST_CASE("an invalid pattern warns and is skipped") {
    LogCapture capture;
    CHECK(validate(Value{"anything"}, "pattern:([a-z").empty());
    CHECK(capture.warnings("Validation") == 1);
    CHECK(validate(Value{""}, "pattern:([a-z|required") == "This field is required");
}

TEST_CASE("unknown rules are ignored") {
    CHECK(validate(Value{""}, "lowercase|phone").empty());
    CHECK(validate(Value{"x"}, std::vector<ValidationRule>{{.name = "min", .parameter = "2"}}) == "Must be at least 2 characters");
}

} // TEST_SUITE
