#pragma once

#include <pathbind/core/Value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace PB {

/**
 * SubscriptionRegistry: path -> callbacks mapping consulted at flush time.
 *
 * Notes
 * -----
 * - Callbacks for one path are kept in registration order so dispatch order
 *   is deterministic.
 * - dispatch() snapshots the callbacks for a path before invoking them, and
 *   checks each one is still registered right before calling it. A callback
 *   removed by an earlier callback of the same dispatch is not invoked.
 * - An exception escaping a callback is logged and does not stop the
 *   remaining callbacks.
 * - Single-threaded: the registry is owned by one State and is only used
 *   from the thread driving it.
 */
class SubscriptionRegistry {
public:
    using Callback       = std::function<void(Value const&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionRegistry()  = default;
    ~SubscriptionRegistry() = default;

    SubscriptionRegistry(SubscriptionRegistry const&)            = delete;
    SubscriptionRegistry& operator=(SubscriptionRegistry const&) = delete;

    auto add(std::string const& path, Callback callback) -> SubscriptionId;
    auto remove(std::string const& path, SubscriptionId id) -> bool;

    // Invokes every live callback registered for the exact path; returns the
    // number of callbacks invoked.
    auto dispatch(std::string const& path, Value const& value) -> std::size_t;

    auto clear() -> void;

    [[nodiscard]] auto countFor(std::string_view path) const -> std::size_t;
    [[nodiscard]] auto size() const -> std::size_t { return total; }
    [[nodiscard]] auto empty() const -> bool { return total == 0; }

private:
    struct Slot {
        SubscriptionId id;
        Callback       callback;
        bool           active = true;
    };

    phmap::flat_hash_map<std::string, std::vector<std::shared_ptr<Slot>>> byPath;
    SubscriptionId                                                        nextId = 1;
    std::size_t                                                           total  = 0;
};

} // namespace PB
