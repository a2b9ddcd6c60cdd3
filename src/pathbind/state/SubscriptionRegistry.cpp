#include <pathbind/state/SubscriptionRegistry.hpp>
#include <pathbind/log/TaggedLogger.hpp>

#include <exception>

namespace PB {

auto SubscriptionRegistry::add(std::string const& path, Callback callback) -> SubscriptionId {
    auto id = this->nextId++;
    this->byPath[path].push_back(std::make_shared<Slot>(Slot{.id = id, .callback = std::move(callback)}));
    ++this->total;
    pb_log("subscribe " + path + " id=" + std::to_string(id), "Registry");
    return id;
}

auto SubscriptionRegistry::remove(std::string const& path, SubscriptionId id) -> bool {
    auto it = this->byPath.find(path);
    if (it == this->byPath.end())
        return false;

    auto& slots = it->second;
    for (auto slotIt = slots.begin(); slotIt != slots.end(); ++slotIt) {
        if ((*slotIt)->id != id)
            continue;
        (*slotIt)->active = false;
        slots.erase(slotIt);
        --this->total;
        if (slots.empty())
            this->byPath.erase(it);
        return true;
    }
    return false;
}

auto SubscriptionRegistry::dispatch(std::string const& path, Value const& value) -> std::size_t {
    auto it = this->byPath.find(path);
    if (it == this->byPath.end())
        return 0;

    auto        snapshot = it->second;
    std::size_t invoked  = 0;
    for (auto const& slot : snapshot) {
        if (!slot->active)
            continue;
        ++invoked;
        try {
            slot->callback(value);
        } catch (std::exception const& ex) {
            pb_error("subscriber for '" + path + "' threw: " + ex.what(), "SubscriberFault");
        } catch (...) {
            pb_error("subscriber for '" + path + "' threw a non-standard exception", "SubscriberFault");
        }
    }
    return invoked;
}

auto SubscriptionRegistry::clear() -> void {
    for (auto& [path, slots] : this->byPath)
        for (auto& slot : slots)
            slot->active = false;
    this->byPath.clear();
    this->total = 0;
}

auto SubscriptionRegistry::countFor(std::string_view path) const -> std::size_t {
    auto it = this->byPath.find(std::string(path));
    return it == this->byPath.end() ? 0 : it->second.size();
}

} // namespace PB
