#pragma once

#include <pathbind/core/Error.hpp>
#include <pathbind/core/Value.hpp>
#include <pathbind/state/ChangeScheduler.hpp>
#include <pathbind/state/Observable.hpp>
#include <pathbind/state/SubscriptionRegistry.hpp>
#include <pathbind/state/TickExecutor.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace PB {

struct StateOptions {
    // Deferred-callback primitive used for flushes. When null the State owns
    // a TickQueue that the host drives through tickQueue().
    TickExecutor* executor = nullptr;
};

/**
 * State: the observable container for one application data graph.
 *
 * Responsibilities:
 * - Hand out Observable wrappers, one per raw node, cached by node identity.
 * - Route every reported write into the ChangeScheduler, which batches them
 *   per tick and dispatches through the SubscriptionRegistry.
 * - Offer path-based access (lookup/get/set/node) on top of the wrappers.
 *
 * Lifetime:
 * - The wrapper cache keeps the wrapped raw nodes alive until destroy() (or
 *   destruction) clears it together with the registry and pending changes.
 * - Unsubscribe functions and wrappers only hold weak references back to the
 *   State, so they are safe to call or keep after it is gone.
 */
class State : public std::enable_shared_from_this<State> {
public:
    using Callback    = SubscriptionRegistry::Callback;
    using Unsubscribe = std::function<void()>;

    // Fails with Error::Code::InvalidType unless initial is a record or list.
    static auto create(Value initial, StateOptions options = {}) -> Expected<std::shared_ptr<State>>;

    ~State();

    State(State const&)            = delete;
    State& operator=(State const&) = delete;

    auto root() -> std::shared_ptr<Observable>;
    // Wrapper for the node at path; null when the path does not reach a node.
    auto node(std::string_view path) -> std::shared_ptr<Observable>;

    // Raw value at path; std::nullopt when the path does not resolve.
    [[nodiscard]] auto lookup(std::string_view path) const -> std::optional<Value>;
    [[nodiscard]] auto get(std::string_view path) const -> Value;
    // Writes through the wrappers, creating missing intermediate records.
    // A cyclic edge on the way continues on the wrapper of the node it points
    // back to, so the write is reported under that node's own path. An index
    // segment may be at most the list's size.
    auto set(std::string_view path, Value value) -> std::optional<Error>;

    // Invalid arguments (empty path, empty callback) log an InvalidCall
    // warning and return a no-op unsubscribe.
    auto subscribe(std::string const& path, Callback callback) -> Unsubscribe;
    auto flushSync() -> void;
    auto unsubscribeAll() -> void;
    auto destroy() -> void;

    [[nodiscard]] auto executor() -> TickExecutor& { return *tickExecutor; }
    // Owned queue, or nullptr when an external executor was supplied.
    [[nodiscard]] auto tickQueue() -> TickQueue* { return ownedQueue.get(); }

    [[nodiscard]] auto isDestroyed() const -> bool { return destroyed; }
    [[nodiscard]] auto subscriberCount(std::string_view path) const -> std::size_t;
    [[nodiscard]] auto subscriberCount() const -> std::size_t;
    [[nodiscard]] auto pendingChanges() const -> std::size_t;
    [[nodiscard]] auto wrapperCount() const -> std::size_t { return wrappers.size(); }

private:
    friend class Observable;

    State(Value initial, StateOptions const& options);

    auto initialize() -> void;
    auto wrap(Value const&               node,
              std::string                path,
              std::vector<void const*>   lineage,
              std::weak_ptr<Observable>  parent = {},
              std::string                key    = {}) -> std::shared_ptr<Observable>;
    auto queueChange(std::string const& path, Value value) -> void;
    auto reportCycle(std::string const& path) -> void;

    Value                                                          rawRoot;
    std::unique_ptr<TickQueue>                                     ownedQueue;
    TickExecutor*                                                  tickExecutor = nullptr;
    std::shared_ptr<SubscriptionRegistry>                          registry;
    std::shared_ptr<ChangeScheduler>                               scheduler;
    phmap::flat_hash_map<void const*, std::shared_ptr<Observable>> wrappers;
    phmap::flat_hash_set<std::string>                              reportedCycles;
    bool                                                           destroyed = false;
};

} // namespace PB
