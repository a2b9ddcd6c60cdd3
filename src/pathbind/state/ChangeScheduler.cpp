#include <pathbind/state/ChangeScheduler.hpp>
#include <pathbind/log/TaggedLogger.hpp>
#include <pathbind/path/StatePath.hpp>

namespace PB {

ChangeScheduler::ChangeScheduler(TickExecutor& executor, Resolver resolver, Dispatcher dispatcher)
    : executor(executor), resolver(std::move(resolver)), dispatcher(std::move(dispatcher)) {}

auto ChangeScheduler::queueChange(std::string const& path, Value value) -> void {
    auto& batch = this->pending;
    if (auto it = batch.index.find(path); it != batch.index.end()) {
        auto& entry     = batch.entries[it->second];
        entry.value     = std::move(value);
        entry.recompute = false;
    } else {
        batch.index.emplace(path, batch.entries.size());
        batch.entries.push_back(PendingEntry{.path = path, .value = std::move(value), .recompute = false});
    }

    for (auto& ancestor : ancestor_paths(path)) {
        if (batch.index.contains(ancestor))
            continue;
        batch.index.emplace(ancestor, batch.entries.size());
        batch.entries.push_back(PendingEntry{.path = std::move(ancestor), .value = Value{}, .recompute = true});
    }

    this->schedule();
}

auto ChangeScheduler::schedule() -> void {
    if (this->scheduled)
        return;

    std::weak_ptr<ChangeScheduler> weak = this->weak_from_this();
    auto                           refused = this->executor.post([weak] {
        auto self = weak.lock();
        if (self && self->scheduled)
            self->flush();
    });
    if (refused) {
        pb_warn("could not schedule flush: " + describeError(*refused), "Flush");
        return;
    }
    this->scheduled = true;
}

auto ChangeScheduler::flush() -> std::size_t {
    Batch batch;
    std::swap(batch, this->pending);
    this->scheduled = false;
    if (batch.empty())
        return 0;

    // Subscribers may drop the last external reference to the owning State.
    auto keepAlive = this->weak_from_this().lock();
    pb_log("flush paths=" + std::to_string(batch.size()), "Flush");

    this->flushing = true;
    for (auto const& entry : batch.entries) {
        Value value = entry.recompute ? this->resolver(entry.path) : entry.value;
        this->dispatcher(entry.path, value);
    }
    this->flushing = false;
    return batch.size();
}

auto ChangeScheduler::flushSync() -> void {
    if (this->flushing) {
        pb_log("flushSync ignored inside flush", "Flush");
        return;
    }
    if (this->pending.empty())
        return;
    this->flush();
}

auto ChangeScheduler::clear() -> void {
    this->pending.entries.clear();
    this->pending.index.clear();
    this->scheduled = false;
}

} // namespace PB
