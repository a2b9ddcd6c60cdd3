#pragma once

#include <pathbind/core/Value.hpp>
#include <pathbind/state/TickExecutor.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace PB {

/**
 * ChangeScheduler: coalesces writes into one notification per path per tick.
 *
 * queueChange(path, value) records the final value for path and a
 * "recompute" sentinel for every strict ancestor that has nothing queued
 * yet. The first queued change of a tick posts exactly one flush job to the
 * TickExecutor; later changes in the same tick only update the pending map.
 *
 * flush() swaps the pending map out before dispatching, so writes made by
 * subscribers land in a fresh batch that is delivered in a later tick.
 * Sentinels are resolved by a live lookup at flush time: an ancestor's
 * notified value is the state as of the flush, not as of any single write.
 */
class ChangeScheduler : public std::enable_shared_from_this<ChangeScheduler> {
public:
    using Resolver   = std::function<Value(std::string const& path)>;
    using Dispatcher = std::function<void(std::string const& path, Value const& value)>;

    ChangeScheduler(TickExecutor& executor, Resolver resolver, Dispatcher dispatcher);
    ~ChangeScheduler() = default;

    ChangeScheduler(ChangeScheduler const&)            = delete;
    ChangeScheduler& operator=(ChangeScheduler const&) = delete;

    auto queueChange(std::string const& path, Value value) -> void;

    // Delivers the current batch; returns the number of paths delivered.
    auto flush() -> std::size_t;
    // Delivers a scheduled batch immediately. No-op when nothing is pending
    // or when called from inside a flush.
    auto flushSync() -> void;

    // Drops pending changes without delivering them.
    auto clear() -> void;

    [[nodiscard]] auto pendingCount() const -> std::size_t { return pending.size(); }
    [[nodiscard]] auto isScheduled() const -> bool { return scheduled; }
    [[nodiscard]] auto isFlushing() const -> bool { return flushing; }

private:
    struct PendingEntry {
        std::string path;
        Value       value;
        bool        recompute = false;
    };

    struct Batch {
        std::vector<PendingEntry>                        entries;
        phmap::flat_hash_map<std::string, std::size_t>   index;

        [[nodiscard]] auto size() const -> std::size_t { return entries.size(); }
        [[nodiscard]] auto empty() const -> bool { return entries.empty(); }
    };

    auto schedule() -> void;

    TickExecutor& executor;
    Resolver      resolver;
    Dispatcher    dispatcher;
    Batch         pending;
    bool          scheduled = false;
    bool          flushing  = false;
};

} // namespace PB
