#pragma once

#include <pathbind/bind/BinderOptions.hpp>
#include <pathbind/bind/ListReconciler.hpp>
#include <pathbind/core/Error.hpp>
#include <pathbind/state/State.hpp>
#include <pathbind/ui/Element.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace PB::Bind {

enum class BindingMode {
    OneWay,
    TwoWay,
};

/**
 * DataBinder: wires declarative path markers in a node subtree to a State.
 *
 * bind(root, state):
 * - Collection markers (data-for) are processed first. Each outermost marker
 *   becomes the template of a ListReconciler and is replaced in the tree by
 *   a comment anchor.
 * - Scalar markers (data-bind) are processed next. Controls (input, textarea,
 *   select) get a two-way binding with optional validation rules
 *   (data-rule); every other element gets a one-way text binding. Markers
 *   inside collection templates or rendered items are left to the
 *   reconciler.
 * - Every element handled is recorded, so binding an overlapping subtree
 *   again never attaches a second set of listeners.
 *
 * unbind(root) removes every listener and subscription created under root,
 * including the ones owned by nested reconcilers.
 *
 * Malformed markers log a BindingSyntax warning and only that binding is
 * skipped. The binder must outlive the bindings it creates; ~DataBinder
 * unbinds everything still bound.
 */
class DataBinder {
public:
    explicit DataBinder(BinderOptions options = {});
    ~DataBinder();

    DataBinder(DataBinder const&)            = delete;
    DataBinder& operator=(DataBinder const&) = delete;

    auto bind(std::shared_ptr<UI::Element> const& root, std::shared_ptr<State> const& state) -> std::optional<Error>;
    auto unbind(UI::Element const& root) -> void;
    auto unbindAll() -> void;

    [[nodiscard]] auto options() const -> BinderOptions const& { return binderOptions; }
    [[nodiscard]] auto isBound(UI::Element const& root) const -> bool;
    [[nodiscard]] auto bindingCount(UI::Element const& root) const -> std::size_t;
    [[nodiscard]] auto reconcilers(UI::Element const& root) const -> std::vector<std::shared_ptr<ListReconciler>>;
    [[nodiscard]] auto rootCount() const -> std::size_t { return roots.size(); }

private:
    struct Binding {
        std::weak_ptr<UI::Element> element;
        std::string                path;
        BindingMode                mode;
        std::function<void()>      cleanup;
    };

    struct RootRecord {
        std::weak_ptr<UI::Element>                                           root;
        std::weak_ptr<State>                                                 state;
        phmap::flat_hash_map<UI::Element const*, std::weak_ptr<UI::Element>> processed;
        std::vector<Binding>                                                 bindings;
        std::vector<std::shared_ptr<ListReconciler>>                         reconcilers;
    };

    auto isProcessed(UI::Element const& element) const -> bool;
    auto bindCollections(RootRecord& record, UI::Element& root, std::shared_ptr<State> const& state) -> void;
    auto bindScalars(RootRecord& record, UI::Element& root, std::shared_ptr<State> const& state) -> void;
    auto bindTwoWay(std::shared_ptr<UI::Element> const& control, std::shared_ptr<State> const& state, std::string const& path) -> Binding;
    auto bindOneWay(std::shared_ptr<UI::Element> const& element, std::shared_ptr<State> const& state, std::string const& path) -> Binding;

    BinderOptions                                                        binderOptions;
    phmap::flat_hash_map<UI::Element const*, std::shared_ptr<RootRecord>> roots;
};

// Process-wide binder with default options.
auto defaultBinder() -> DataBinder&;
auto bind(std::shared_ptr<UI::Element> const& root, std::shared_ptr<State> const& state) -> std::optional<Error>;
auto unbind(UI::Element const& root) -> void;

} // namespace PB::Bind
