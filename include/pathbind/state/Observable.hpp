#pragma once

#include <pathbind/core/Error.hpp>
#include <pathbind/core/Value.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PB {

class State;

/**
 * Observable: the reactive view over exactly one raw record or list.
 *
 * Reads return the raw value stored under a key; child() returns the
 * wrapped view of a nested node, created on first access and cached by the
 * owning State by node identity, so repeated reads yield the same wrapper.
 *
 * Writes go through set()/setAt() and the sequence mutators. A write is
 * reported to the owning State's scheduler under this wrapper's path plus
 * the key, and only when the new value is not strictly equal to the old one.
 * Sequence mutators apply the operation to the raw list first and then
 * report one change on the list's own path.
 *
 * Numeric keys address list elements, so "items.2" reaches the third item.
 * A wrapper's path is worked out from its parent when a write is reported,
 * so an element moved by a sequence mutator reports under its new index. A
 * node that is no longer reachable from its parent reports nothing.
 *
 * A nested node that already appears on this wrapper's ancestor chain is a
 * cyclic edge: child() returns null for it (the edge is not reactive) and
 * the State logs one GraphIntegrity warning for that path. get() still
 * returns the raw node.
 */
class Observable : public std::enable_shared_from_this<Observable> {
public:
    using Comparator = std::function<bool(Value const&, Value const&)>;

    Observable(Observable const&)            = delete;
    Observable& operator=(Observable const&) = delete;

    // Current path; the path of the first wrapping once the node is detached.
    [[nodiscard]] auto path() const -> std::string;
    [[nodiscard]] auto raw() const -> Value const& { return node; }
    [[nodiscard]] auto isRecord() const -> bool { return node.isRecord(); }
    [[nodiscard]] auto isList() const -> bool { return node.isList(); }

    [[nodiscard]] auto get(std::string_view key) const -> Value;
    [[nodiscard]] auto has(std::string_view key) const -> bool;
    [[nodiscard]] auto keys() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t;
    auto               child(std::string_view key) -> std::shared_ptr<Observable>;
    auto               set(std::string_view key, Value value) -> std::optional<Error>;

    [[nodiscard]] auto at(std::size_t index) const -> Value;
    auto               childAt(std::size_t index) -> std::shared_ptr<Observable>;
    // index may be at most size(); writing at size() appends.
    auto               setAt(std::size_t index, Value value) -> std::optional<Error>;

    auto push(Value value) -> Expected<std::size_t>;
    auto pop() -> Expected<Value>;
    auto shift() -> Expected<Value>;
    auto unshift(Value value) -> Expected<std::size_t>;
    auto insert(std::size_t index, Value value) -> Expected<void>;
    auto splice(std::size_t start, std::size_t deleteCount, std::vector<Value> items = {}) -> Expected<std::vector<Value>>;
    // Stable sort; without a comparator items are ordered by display text.
    auto sort(Comparator comparator = {}) -> Expected<void>;
    auto reverse() -> Expected<void>;

private:
    friend class State;

    Observable(std::weak_ptr<State>       owner,
               Value                      node,
               std::string                path,
               std::vector<void const*>   lineage,
               std::weak_ptr<Observable>  parent,
               std::string                key);

    auto currentPath() const -> std::optional<std::string>;
    auto wrapChild(Value const& value, std::string key) -> std::shared_ptr<Observable>;
    auto sequence(char const* operation) -> Expected<ListPtr>;
    // Reports a change at key below this node, or at the node itself when key is empty.
    auto reportChange(std::string_view key, Value value) -> void;
    auto reportSequenceChange() -> void;

    std::weak_ptr<State>      owner;
    Value                     node;
    std::string               nodePath;
    std::vector<void const*>  lineage;
    std::weak_ptr<Observable> parent;
    std::string               parentKey; // field name under a record parent
};

} // namespace PB
