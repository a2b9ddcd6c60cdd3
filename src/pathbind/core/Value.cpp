#include <pathbind/core/Value.hpp>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <unordered_set>

namespace PB {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v'; };
    while (!text.empty() && is_space(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && is_space(text.back()))
        text.remove_suffix(1);
    return text;
}

auto parse_number_text(std::string_view text) -> double {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    text                 = trim(text);
    if (text.empty())
        return 0.0;

    bool negative = false;
    if (text.front() == '+' || text.front() == '-') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text == "Infinity")
        return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    if (text.empty())
        return nan;

    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        std::uint64_t parsed = 0;
        auto [ptr, ec]       = std::from_chars(text.data() + 2, text.data() + text.size(), parsed, 16);
        if (ec != std::errc{} || ptr != text.data() + text.size())
            return nan;
        return negative ? -static_cast<double>(parsed) : static_cast<double>(parsed);
    }

    if (!(std::isdigit(static_cast<unsigned char>(text.front())) || text.front() == '.'))
        return nan;

    double parsed  = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return nan;
    return negative ? -parsed : parsed;
}

auto to_json_impl(Value const& value, std::unordered_set<void const*>& active) -> nlohmann::json {
    if (value.isNull())
        return nullptr;
    if (value.isBool())
        return value.asBool();
    if (value.isNumber()) {
        double n = value.asNumber();
        if (std::isfinite(n) && std::trunc(n) == n && std::fabs(n) < 9007199254740992.0)
            return static_cast<std::int64_t>(n);
        if (!std::isfinite(n))
            return nullptr;
        return n;
    }
    if (value.isString())
        return value.asString();

    auto const* id = value.identity();
    if (!active.insert(id).second)
        return nullptr;

    nlohmann::json out;
    if (value.isRecord()) {
        out = nlohmann::json::object();
        for (auto const& [key, field] : value.asRecord()->fields)
            out[key] = to_json_impl(field, active);
    } else {
        out = nlohmann::json::array();
        for (auto const& item : value.asList()->items)
            out.push_back(to_json_impl(item, active));
    }
    active.erase(id);
    return out;
}

auto deep_equals_impl(Value const& lhs, Value const& rhs, std::set<std::pair<void const*, void const*>>& seen) -> bool {
    if (lhs == rhs)
        return true;
    if (lhs.isRecord() && rhs.isRecord()) {
        if (!seen.emplace(lhs.identity(), rhs.identity()).second)
            return true;
        auto const& a = lhs.asRecord()->fields;
        auto const& b = rhs.asRecord()->fields;
        if (a.size() != b.size())
            return false;
        for (auto const& [key, field] : a) {
            auto it = b.find(key);
            if (it == b.end() || !deep_equals_impl(field, it->second, seen))
                return false;
        }
        return true;
    }
    if (lhs.isList() && rhs.isList()) {
        if (!seen.emplace(lhs.identity(), rhs.identity()).second)
            return true;
        auto const& a = lhs.asList()->items;
        auto const& b = rhs.asList()->items;
        if (a.size() != b.size())
            return false;
        for (std::size_t i = 0; i < a.size(); ++i)
            if (!deep_equals_impl(a[i], b[i], seen))
                return false;
        return true;
    }
    return false;
}

} // namespace

Value::Value(RecordPtr record) {
    if (record)
        storage = std::move(record);
}

Value::Value(ListPtr list) {
    if (list)
        storage = std::move(list);
}

auto Value::record(std::initializer_list<std::pair<const std::string, Value>> fields) -> Value {
    auto node = makeRecord();
    for (auto const& [key, field] : fields)
        node->fields.insert_or_assign(key, field);
    return Value{std::move(node)};
}

auto Value::list(std::initializer_list<Value> items) -> Value {
    auto node   = makeList();
    node->items = items;
    return Value{std::move(node)};
}

auto Value::list(std::vector<Value> items) -> Value {
    auto node   = makeList();
    node->items = std::move(items);
    return Value{std::move(node)};
}

auto Value::fromJson(nlohmann::json const& json) -> Value {
    switch (json.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
        return Value{};
    case nlohmann::json::value_t::boolean:
        return Value{json.get<bool>()};
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
        return Value{json.get<double>()};
    case nlohmann::json::value_t::string:
        return Value{json.get<std::string>()};
    case nlohmann::json::value_t::object: {
        auto node = makeRecord();
        for (auto const& [key, field] : json.items())
            node->fields.insert_or_assign(key, fromJson(field));
        return Value{std::move(node)};
    }
    case nlohmann::json::value_t::array: {
        auto node = makeList();
        node->items.reserve(json.size());
        for (auto const& item : json)
            node->items.push_back(fromJson(item));
        return Value{std::move(node)};
    }
    case nlohmann::json::value_t::binary:
        break;
    }
    return Value{};
}

auto Value::identity() const -> void const* {
    if (auto const* record = std::get_if<RecordPtr>(&storage))
        return record->get();
    if (auto const* list = std::get_if<ListPtr>(&storage))
        return list->get();
    return nullptr;
}

auto Value::isTruthy() const -> bool {
    if (isNull())
        return false;
    if (isBool())
        return asBool();
    if (isNumber()) {
        double n = asNumber();
        return n != 0.0 && !std::isnan(n);
    }
    if (isString())
        return !asString().empty();
    return true;
}

auto Value::toNumber() const -> double {
    if (isNull())
        return 0.0;
    if (isBool())
        return asBool() ? 1.0 : 0.0;
    if (isNumber())
        return asNumber();
    if (isString())
        return parse_number_text(asString());
    if (isList()) {
        auto const& items = asList()->items;
        if (items.empty())
            return 0.0;
        if (items.size() == 1)
            return items.front().toNumber();
    }
    return std::numeric_limits<double>::quiet_NaN();
}

auto Value::toDisplayString() const -> std::string {
    if (isNull())
        return {};
    if (isBool())
        return asBool() ? "true" : "false";
    if (isNumber())
        return formatNumber(asNumber());
    if (isString())
        return asString();
    return toJson().dump();
}

auto Value::toJson() const -> nlohmann::json {
    std::unordered_set<void const*> active;
    return to_json_impl(*this, active);
}

auto Record::find(std::string_view key) const -> Value const* {
    auto it = fields.find(key);
    return it == fields.end() ? nullptr : &it->second;
}

auto Record::set(std::string_view key, Value value) -> void {
    auto it = fields.find(key);
    if (it == fields.end())
        fields.emplace(std::string(key), std::move(value));
    else
        it->second = std::move(value);
}

auto makeRecord() -> RecordPtr {
    return std::make_shared<Record>();
}

auto makeList() -> ListPtr {
    return std::make_shared<List>();
}

auto shallowEquals(Value const& lhs, Value const& rhs) -> bool {
    if (lhs == rhs)
        return true;
    if (lhs.isList() && rhs.isList()) {
        auto const& a = lhs.asList()->items;
        auto const& b = rhs.asList()->items;
        return a == b;
    }
    if (lhs.isRecord() && rhs.isRecord()) {
        auto const& a = lhs.asRecord()->fields;
        auto const& b = rhs.asRecord()->fields;
        return a == b;
    }
    return false;
}

auto deepEquals(Value const& lhs, Value const& rhs) -> bool {
    std::set<std::pair<void const*, void const*>> seen;
    return deep_equals_impl(lhs, rhs, seen);
}

auto formatNumber(double value) -> std::string {
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value < 0 ? "-Infinity" : "Infinity";
    if (value == 0.0)
        return "0";

    char buffer[64];
    std::to_chars_result result{};
    if (std::trunc(value) == value && std::fabs(value) < 1e21)
        result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed);
    else
        result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc{})
        return std::to_string(value);
    return std::string(buffer, result.ptr);
}

auto parseLeadingNumber(std::string_view text) -> double {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);

    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.starts_with("Infinity"))
        return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    if (text.empty() || !(std::isdigit(static_cast<unsigned char>(text.front())) || text.front() == '.'))
        return nan;

    double parsed  = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{})
        return nan;
    return negative ? -parsed : parsed;
}

} // namespace PB
