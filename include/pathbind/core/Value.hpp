#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace PB {

struct Record;
struct List;

using RecordPtr = std::shared_ptr<Record>;
using ListPtr   = std::shared_ptr<List>;

/**
 * Value: one slot of the application data graph.
 *
 * Primitives (null, bool, number, string) are held by value. Records and
 * lists are shared raw nodes owned by the application; a Value referring to
 * one only shares it. Node identity is the node's address, so two Values
 * are strictly equal when they hold equal primitives or the same node.
 */
class Value {
public:
    using Storage = std::variant<std::monostate, bool, double, std::string, RecordPtr, ListPtr>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : storage(b) {}
    Value(int n) : storage(static_cast<double>(n)) {}
    Value(long n) : storage(static_cast<double>(n)) {}
    Value(long long n) : storage(static_cast<double>(n)) {}
    Value(unsigned n) : storage(static_cast<double>(n)) {}
    Value(unsigned long n) : storage(static_cast<double>(n)) {}
    Value(double n) : storage(n) {}
    Value(char const* s) : storage(std::string(s)) {}
    Value(std::string s) : storage(std::move(s)) {}
    Value(std::string_view s) : storage(std::string(s)) {}
    Value(RecordPtr record);
    Value(ListPtr list);

    static auto record(std::initializer_list<std::pair<const std::string, Value>> fields = {}) -> Value;
    static auto list(std::initializer_list<Value> items = {}) -> Value;
    static auto list(std::vector<Value> items) -> Value;
    static auto fromJson(nlohmann::json const& json) -> Value;

    [[nodiscard]] auto isNull() const -> bool { return std::holds_alternative<std::monostate>(storage); }
    [[nodiscard]] auto isBool() const -> bool { return std::holds_alternative<bool>(storage); }
    [[nodiscard]] auto isNumber() const -> bool { return std::holds_alternative<double>(storage); }
    [[nodiscard]] auto isString() const -> bool { return std::holds_alternative<std::string>(storage); }
    [[nodiscard]] auto isRecord() const -> bool { return std::holds_alternative<RecordPtr>(storage); }
    [[nodiscard]] auto isList() const -> bool { return std::holds_alternative<ListPtr>(storage); }
    [[nodiscard]] auto isNode() const -> bool { return isRecord() || isList(); }

    // Accessors assume the matching alternative; check with isX() first.
    [[nodiscard]] auto asBool() const -> bool { return std::get<bool>(storage); }
    [[nodiscard]] auto asNumber() const -> double { return std::get<double>(storage); }
    [[nodiscard]] auto asString() const -> std::string const& { return std::get<std::string>(storage); }
    [[nodiscard]] auto asRecord() const -> RecordPtr const& { return std::get<RecordPtr>(storage); }
    [[nodiscard]] auto asList() const -> ListPtr const& { return std::get<ListPtr>(storage); }

    // Address of the referenced record/list, nullptr for primitives.
    [[nodiscard]] auto identity() const -> void const*;

    [[nodiscard]] auto isTruthy() const -> bool;
    // Numeric coercion: booleans map to 0/1, strings are parsed after
    // trimming (empty is 0), anything unparsable yields NaN.
    [[nodiscard]] auto toNumber() const -> double;
    // Text as shown in a rendered node: null is empty, integral numbers
    // drop the fraction, records and lists render as compact JSON.
    [[nodiscard]] auto toDisplayString() const -> std::string;
    // Revisited nodes (cycles) serialize as null.
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] auto storageRef() const -> Storage const& { return storage; }

    // Strict equality: primitives by value, nodes by identity.
    friend auto operator==(Value const& lhs, Value const& rhs) -> bool { return lhs.storage == rhs.storage; }

private:
    Storage storage;
};

struct Record {
    std::map<std::string, Value, std::less<>> fields;

    [[nodiscard]] auto find(std::string_view key) const -> Value const*;
    [[nodiscard]] auto contains(std::string_view key) const -> bool { return find(key) != nullptr; }
    auto               set(std::string_view key, Value value) -> void;
};

struct List {
    std::vector<Value> items;
};

[[nodiscard]] auto makeRecord() -> RecordPtr;
[[nodiscard]] auto makeList() -> ListPtr;

// Equality on one level of structure: same identity, or lists/records whose
// elements are strictly equal.
[[nodiscard]] auto shallowEquals(Value const& lhs, Value const& rhs) -> bool;
// Structural equality at every level. Cyclic graphs compare by identity once
// a node pair is revisited.
[[nodiscard]] auto deepEquals(Value const& lhs, Value const& rhs) -> bool;
// Number text the way a rendered node shows it.
[[nodiscard]] auto formatNumber(double value) -> std::string;
// Longest numeric prefix after leading whitespace ("12px" -> 12); NaN when
// the text does not start with a number.
[[nodiscard]] auto parseLeadingNumber(std::string_view text) -> double;

} // namespace PB
