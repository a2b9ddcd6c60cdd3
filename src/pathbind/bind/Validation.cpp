#include <pathbind/bind/Validation.hpp>
#include <pathbind/log/TaggedLogger.hpp>

#include <cmath>
#include <regex>

namespace PB::Bind {

namespace {

auto matches_email(std::string const& text) -> bool {
    static std::regex const email(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)", std::regex::ECMAScript);
    return std::regex_search(text, email);
}

// Returns a message when value lies on the wrong side of bound.
auto check_bound(Value const& value, std::string const& parameter, bool lower) -> std::string {
    double const bound = parseLeadingNumber(parameter);
    if (std::isnan(bound))
        return {};
    auto const label = formatNumber(bound);

    if (value.isString()) {
        auto const length = static_cast<double>(value.asString().size());
        if (lower && length < bound)
            return "Must be at least " + label + " characters";
        if (!lower && length > bound)
            return "Must be no more than " + label + " characters";
        return {};
    }
    if (value.isNumber()) {
        double const n = value.asNumber();
        if (lower && n < bound)
            return "Must be at least " + label;
        if (!lower && n > bound)
            return "Must be no more than " + label;
    }
    return {};
}

auto check_rule(Value const& value, ValidationRule const& rule) -> std::string {
    if (rule.name == "required") {
        if (value.isNull() || (value.isString() && value.asString().empty()))
            return "This field is required";
        return {};
    }
    if (rule.name == "email") {
        if (value.isTruthy() && !matches_email(value.toDisplayString()))
            return "Invalid email address";
        return {};
    }
    if (rule.name == "numeric") {
        if (value.isTruthy() && std::isnan(value.toNumber()))
            return "Must be a number";
        return {};
    }
    if (rule.name == "min")
        return check_bound(value, rule.parameter, true);
    if (rule.name == "max")
        return check_bound(value, rule.parameter, false);
    if (rule.name == "pattern") {
        std::regex pattern;
        try {
            pattern = std::regex(rule.parameter, std::regex::ECMAScript);
        } catch (std::regex_error const& ex) {
            pb_warn("invalid pattern '" + rule.parameter + "' in validation rule: " + ex.what(), "Validation");
            return {};
        }
        if (value.isTruthy() && !std::regex_search(value.toDisplayString(), pattern))
            return "Invalid format";
        return {};
    }
    return {};
}

} // namespace

auto parseRules(std::string_view rules) -> std::vector<ValidationRule> {
    std::vector<ValidationRule> parsed;
    while (!rules.empty()) {
        auto const bar   = rules.find('|');
        auto       token = rules.substr(0, bar);
        rules            = bar == std::string_view::npos ? std::string_view{} : rules.substr(bar + 1);
        if (token.empty())
            continue;

        auto const colon = token.find(':');
        if (colon == std::string_view::npos)
            parsed.push_back(ValidationRule{.name = std::string(token), .parameter = {}});
        else
            parsed.push_back(ValidationRule{.name = std::string(token.substr(0, colon)), .parameter = std::string(token.substr(colon + 1))});
    }
    return parsed;
}

auto validate(Value const& value, std::vector<ValidationRule> const& rules) -> std::string {
    for (auto const& rule : rules) {
        if (auto message = check_rule(value, rule); !message.empty())
            return message;
    }
    return {};
}

auto validate(Value const& value, std::string_view rules) -> std::string {
    return validate(value, parseRules(rules));
}

} // namespace PB::Bind
