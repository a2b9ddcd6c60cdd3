#pragma once

#include <pathbind/bind/BinderOptions.hpp>
#include <pathbind/core/Value.hpp>
#include <pathbind/state/State.hpp>
#include <pathbind/ui/Element.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace PB::Bind {

/**
 * ListReconciler: keeps one rendered node per collection item, keyed.
 *
 * Purpose:
 * - Map every item of the source list to a stable key and keep exactly one
 *   rendered node per key directly after the anchor, in list order.
 *
 * Render pass (linear in the list size):
 * - Resolve the source list (item scopes around the anchor first, then the
 *   root state). Anything that is not a list clears the rendered items.
 * - Remove nodes whose key disappeared.
 * - Walk the new keys with a cursor starting at the anchor: existing nodes
 *   are re-populated only when their item, its content or its index
 *   changed, and moved with a single after() when they do not already
 *   follow the cursor; new keys get a populated clone of the template
 *   inserted after the cursor.
 *
 * Nested collection markers inside a new clone are handed to bindNested in
 * a later tick, once the clone is attached to the live tree. Nodes leaving
 * the list are passed to unbindNested.
 */
class ListReconciler : public std::enable_shared_from_this<ListReconciler> {
public:
    using KeyFunction = std::function<std::string(Value const& item, std::size_t index)>;
    using SubtreeHook = std::function<void(std::shared_ptr<UI::Element> const&)>;

    struct Config {
        std::shared_ptr<UI::Element> templateNode;
        std::shared_ptr<UI::Element> anchor;
        std::shared_ptr<State>       state;
        std::string                  sourcePath;
        KeyFunction                  key; // defaults to the item index
        std::string                  varName;
        std::string                  indexName;
        BinderOptions                options;
        SubtreeHook                  bindNested;
        SubtreeHook                  unbindNested;
    };

    struct Stats {
        std::size_t created = 0;
        std::size_t moved   = 0;
        std::size_t removed = 0;
        std::size_t updated = 0;
    };

    explicit ListReconciler(Config config);
    ~ListReconciler();

    ListReconciler(ListReconciler const&)            = delete;
    ListReconciler& operator=(ListReconciler const&) = delete;

    // Subscribes to the source and renders once.
    auto start() -> void;
    auto render() -> void;
    // Removes every rendered node; the anchor stays.
    auto clear() -> void;
    // Unsubscribes and clears. Further renders are ignored.
    auto destroy() -> void;

    [[nodiscard]] auto stats() const -> Stats const& { return counters; }
    auto               resetStats() -> void { counters = {}; }
    [[nodiscard]] auto renderedKeys() const -> std::vector<std::string> const& { return order; }
    [[nodiscard]] auto renderedCount() const -> std::size_t { return order.size(); }
    [[nodiscard]] auto renderedNode(std::string const& key) const -> std::shared_ptr<UI::Element>;
    [[nodiscard]] auto anchor() const -> std::shared_ptr<UI::Element> const& { return config.anchor; }
    [[nodiscard]] auto subscriptionPath() const -> std::string const& { return watchedPath; }

    // Key function for a data-key expression: the bare loop variable keys by
    // the item's text, "var.sub" by the text of that sub-value. Items where
    // the sub-value is missing fall back to their index.
    [[nodiscard]] static auto keyFromExpression(std::string_view expression, std::string const& varName) -> KeyFunction;

private:
    struct Entry {
        std::shared_ptr<UI::Element> node;
        Value                        item;
        std::size_t                  index = 0;
        std::string                  snapshot; // serialized record or list item
    };

    auto resolveSource() const -> std::optional<Value>;
    auto outermostScope() const -> UI::ItemScope const*;
    auto createNode(Value const& item, std::size_t index) -> std::shared_ptr<UI::Element>;
    auto populate(UI::Element& node, Value const& item, std::size_t index) -> void;
    auto resolveBinding(std::string_view path, Value const& item, std::size_t index) const -> std::optional<Value>;
    auto scheduleNestedBind(std::shared_ptr<UI::Element> const& node) -> void;
    auto makeScope(Value const& item, std::size_t index) const -> UI::ItemScope;

    Config                                    config;
    std::weak_ptr<State>                      state;
    phmap::flat_hash_map<std::string, Entry>  entries;
    std::vector<std::string>                  order;
    std::string                               watchedPath;
    std::string                               rootSourcePath;
    State::Unsubscribe                        unsubscribe;
    Stats                                     counters;
    bool                                      destroyed = false;
};

} // namespace PB::Bind
