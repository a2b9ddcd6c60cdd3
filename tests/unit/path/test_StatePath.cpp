#include <pathbind/path/StatePath.hpp>

#include <doctest/doctest.h>

using namespace PB;

static_assert(is_binding_path("user.profile.name"));
static_assert(!is_binding_path("user..name"));
static_assert(is_identifier("$item"));

TEST_SUITE("path.statepath") {

TEST_CASE("validate_binding_path reports detailed errors") {
    using Code = PathValidationError::Code;
    CHECK(validate_binding_path("").code == Code::EmptyPath);
    CHECK(validate_binding_path(".a").code == Code::LeadingDot);
    CHECK(validate_binding_path("a.").code == Code::TrailingDot);
    CHECK(validate_binding_path("a..b").code == Code::EmptySegment);
    CHECK(validate_binding_path("1a").code == Code::InvalidSegmentStart);
    CHECK(validate_binding_path("a.0").code == Code::InvalidSegmentStart);

    auto invalid = validate_binding_path("a-b");
    CHECK(invalid.code == Code::InvalidCharacter);
    CHECK(invalid.position == 1);

    CHECK(validate_binding_path("user.profile.name").code == Code::None);
    CHECK(validate_binding_path("_private.$value9").code == Code::None);
    CHECK_FALSE(describe_path_error(invalid).empty());
}

TEST_CASE("identifiers are single segments") {
    CHECK(is_identifier("item"));
    CHECK_FALSE(is_identifier("item.name"));
    CHECK_FALSE(is_identifier("(item"));
}

TEST_CASE("split and join") {
    auto parts = split_path("a.b.c");
    REQUIRE(parts.size() == 3);
    CHECK(parts[0] == "a");
    CHECK(parts[2] == "c");
    CHECK(split_path("").empty());
    CHECK(split_path("a..b").size() == 3);

    CHECK(join_path("", "name") == "name");
    CHECK(join_path("user", "name") == "user.name");
}

TEST_CASE("ancestors are listed nearest first") {
    auto ancestors = ancestor_paths("a.b.c");
    REQUIRE(ancestors.size() == 2);
    CHECK(ancestors[0] == "a.b");
    CHECK(ancestors[1] == "a");
    CHECK(ancestor_paths("root").empty());
    CHECK(parent_path("a.b").value() == "a");
    CHECK_FALSE(parent_path("a").has_value());
}

TEST_CASE("prefix stripping respects segment boundaries") {
    CHECK(strip_path_prefix("user.name", "user").value() == "name");
    CHECK(strip_path_prefix("user", "user").value().empty());
    CHECK_FALSE(strip_path_prefix("username", "user").has_value());
    CHECK_FALSE(strip_path_prefix("other.name", "user").has_value());
}

TEST_CASE("index segments") {
    CHECK(parse_index_segment("12").value() == 12);
    CHECK(parse_index_segment("0").value() == 0);
    CHECK_FALSE(parse_index_segment("-1").has_value());
    CHECK_FALSE(parse_index_segment("1a").has_value());
    CHECK_FALSE(parse_index_segment("").has_value());
}

TEST_CASE("resolve_path walks records and lists") {
    auto root = Value::record({{"users", Value::list({Value::record({{"name", "Ada"}})})}, {"count", 2}});

    CHECK(resolve_path(root, "users.0.name").value() == Value{"Ada"});
    CHECK(resolve_path(root, "count").value() == Value{2});
    CHECK(resolve_path(root, "").value() == root);
    CHECK_FALSE(resolve_path(root, "users.1.name").has_value());
    CHECK_FALSE(resolve_path(root, "count.value").has_value());
    CHECK_FALSE(resolve_path(root, "missing").has_value());
}

}
