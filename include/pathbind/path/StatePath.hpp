#pragma once
#include <pathbind/core/Value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PB {

struct PathValidationError {
    enum class Code {
        None,
        EmptyPath,
        EmptySegment,
        LeadingDot,
        TrailingDot,
        InvalidSegmentStart,
        InvalidCharacter
    };
    Code        code;
    std::size_t position = 0;
};

constexpr auto is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

constexpr auto is_identifier_char(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

// Dotted identifier chain: [A-Za-z_$][A-Za-z0-9_$]* ('.' segment)*
constexpr auto validate_binding_path(std::string_view str) -> PathValidationError {
    if (str.empty())
        return {PathValidationError::Code::EmptyPath, 0};
    if (str.front() == '.')
        return {PathValidationError::Code::LeadingDot, 0};
    if (str.back() == '.')
        return {PathValidationError::Code::TrailingDot, str.size() - 1};

    bool segmentStart = true;
    for (std::size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '.') {
            if (segmentStart)
                return {PathValidationError::Code::EmptySegment, i};
            segmentStart = true;
            continue;
        }
        if (segmentStart) {
            if (!is_identifier_start(c))
                return {PathValidationError::Code::InvalidSegmentStart, i};
            segmentStart = false;
            continue;
        }
        if (!is_identifier_char(c))
            return {PathValidationError::Code::InvalidCharacter, i};
    }
    return {PathValidationError::Code::None, 0};
}

constexpr auto is_binding_path(std::string_view str) -> bool {
    return validate_binding_path(str).code == PathValidationError::Code::None;
}

constexpr auto is_identifier(std::string_view str) -> bool {
    return is_binding_path(str) && str.find('.') == std::string_view::npos;
}

[[nodiscard]] auto describe_path_error(PathValidationError const& error) -> std::string;

// Segments of a dotted path. Empty segments are kept so callers can reject them.
[[nodiscard]] auto split_path(std::string_view path) -> std::vector<std::string_view>;
[[nodiscard]] auto join_path(std::string_view prefix, std::string_view key) -> std::string;
// "a.b.c" -> "a.b"; single-segment paths have no parent.
[[nodiscard]] auto parent_path(std::string_view path) -> std::optional<std::string_view>;
// Strict ancestors, nearest first: "a.b.c" -> {"a.b", "a"}.
[[nodiscard]] auto ancestor_paths(std::string_view path) -> std::vector<std::string>;
// Remainder of path below head: ("user.name", "user") -> "name"; ("user", "user") -> "".
[[nodiscard]] auto strip_path_prefix(std::string_view path, std::string_view head) -> std::optional<std::string_view>;
// Parses a non-negative decimal list index segment.
[[nodiscard]] auto parse_index_segment(std::string_view segment) -> std::optional<std::size_t>;
// Walks path below root through record fields and list indices. An empty
// path yields root; std::nullopt when a segment does not resolve.
[[nodiscard]] auto resolve_path(Value const& root, std::string_view path) -> std::optional<Value>;

} // namespace PB
