#pragma once

#include <pathbind/core/Value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace PB::Bind {

struct ValidationRule {
    std::string name;
    std::string parameter;
};

// Splits "required|min:3|pattern:^a:b$" into rules. Only the first ':'
// separates name from parameter; empty tokens are dropped.
[[nodiscard]] auto parseRules(std::string_view rules) -> std::vector<ValidationRule>;

/**
 * Evaluates rules left to right and returns the message of the first rule
 * that fails, or an empty string when every rule passes.
 *
 *   required     null or "" fails          "This field is required"
 *   email        truthy values only        "Invalid email address"
 *   numeric      truthy values only        "Must be a number"
 *   min:n        string length / number    "Must be at least n characters" / "Must be at least n"
 *   max:n        string length / number    "Must be no more than n characters" / "Must be no more than n"
 *   pattern:re   truthy values only        "Invalid format"
 *
 * An unparsable pattern logs a warning and the rule is skipped. Unknown rule
 * names are ignored.
 */
[[nodiscard]] auto validate(Value const& value, std::string_view rules) -> std::string;
[[nodiscard]] auto validate(Value const& value, std::vector<ValidationRule> const& rules) -> std::string;

} // namespace PB::Bind
