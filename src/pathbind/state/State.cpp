#include <pathbind/state/State.hpp>
#include <pathbind/log/TaggedLogger.hpp>
#include <pathbind/path/StatePath.hpp>

namespace PB {

auto State::create(Value initial, StateOptions options) -> Expected<std::shared_ptr<State>> {
    if (!initial.isNode())
        return std::unexpected(Error{Error::Code::InvalidType, "initial state must be a record or a list"});

    auto state = std::shared_ptr<State>(new State(std::move(initial), options));
    state->initialize();
    return state;
}

State::State(Value initial, StateOptions const& options)
    : rawRoot(std::move(initial)) {
    if (options.executor) {
        this->tickExecutor = options.executor;
    } else {
        this->ownedQueue   = std::make_unique<TickQueue>();
        this->tickExecutor = this->ownedQueue.get();
    }
    this->registry = std::make_shared<SubscriptionRegistry>();
}

State::~State() {
    this->destroy();
}

auto State::initialize() -> void {
    std::weak_ptr<State>                weak         = this->weak_from_this();
    std::weak_ptr<SubscriptionRegistry> weakRegistry = this->registry;

    this->scheduler = std::make_shared<ChangeScheduler>(
            *this->tickExecutor,
            [weak](std::string const& path) -> Value {
                auto self = weak.lock();
                return self ? self->get(path) : Value{};
            },
            [weakRegistry](std::string const& path, Value const& value) {
                if (auto registry = weakRegistry.lock())
                    registry->dispatch(path, value);
            });
}

auto State::root() -> std::shared_ptr<Observable> {
    if (this->destroyed)
        return nullptr;
    return this->wrap(this->rawRoot, std::string{}, {this->rawRoot.identity()});
}

auto State::node(std::string_view path) -> std::shared_ptr<Observable> {
    auto current = this->root();
    if (path.empty())
        return current;
    for (auto segment : split_path(path)) {
        if (!current)
            return nullptr;
        current = current->child(segment);
    }
    return current;
}

auto State::lookup(std::string_view path) const -> std::optional<Value> {
    return resolve_path(this->rawRoot, path);
}

auto State::get(std::string_view path) const -> Value {
    return this->lookup(path).value_or(Value{});
}

auto State::set(std::string_view path, Value value) -> std::optional<Error> {
    if (this->destroyed)
        return Error{Error::Code::Destroyed, "state has been destroyed"};
    if (path.empty())
        return Error{Error::Code::InvalidPath, "empty path"};

    auto segments = split_path(path);
    for (auto segment : segments) {
        if (!is_identifier(segment) && !parse_index_segment(segment))
            return Error{Error::Code::InvalidPath, "invalid segment '" + std::string(segment) + "' in '" + std::string(path) + "'"};
    }

    auto current = this->root();
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        auto next = current->child(segments[i]);
        if (!next) {
            auto existing = current->get(segments[i]);
            if (existing.isNode()) {
                auto it = this->wrappers.find(existing.identity());
                if (it == this->wrappers.end())
                    return Error{Error::Code::InvalidPath, "path '" + std::string(path) + "' crosses an unwrapped circular reference"};
                current = it->second;
                continue;
            }
            if (!existing.isNull())
                return Error{Error::Code::InvalidType, "'" + std::string(segments[i]) + "' in '" + std::string(path) + "' is not a record or list"};
            if (auto error = current->set(segments[i], Value{makeRecord()}))
                return error;
            next = current->child(segments[i]);
        }
        if (!next)
            return Error{Error::Code::NoSuchPath, "could not create '" + std::string(segments[i]) + "' in '" + std::string(path) + "'"};
        current = std::move(next);
    }
    return current->set(segments.back(), std::move(value));
}

auto State::subscribe(std::string const& path, Callback callback) -> Unsubscribe {
    if (path.empty() || !callback) {
        pb_warn("subscribe called with " + std::string(path.empty() ? "an empty path" : "an empty callback"), "InvalidCall");
        return [] {};
    }
    if (this->destroyed) {
        pb_warn("subscribe to '" + path + "' on a destroyed state", "InvalidCall");
        return [] {};
    }

    auto                                id           = this->registry->add(path, std::move(callback));
    std::weak_ptr<SubscriptionRegistry> weakRegistry = this->registry;
    return [weakRegistry, path, id] {
        if (auto registry = weakRegistry.lock())
            registry->remove(path, id);
    };
}

auto State::flushSync() -> void {
    if (this->scheduler)
        this->scheduler->flushSync();
}

auto State::unsubscribeAll() -> void {
    this->registry->clear();
}

auto State::destroy() -> void {
    if (this->destroyed)
        return;
    this->destroyed = true;
    if (this->scheduler)
        this->scheduler->clear();
    this->registry->clear();
    this->wrappers.clear();
    this->reportedCycles.clear();
    pb_log("state destroyed", "State");
}

auto State::subscriberCount(std::string_view path) const -> std::size_t {
    return this->registry->countFor(path);
}

auto State::subscriberCount() const -> std::size_t {
    return this->registry->size();
}

auto State::pendingChanges() const -> std::size_t {
    return this->scheduler ? this->scheduler->pendingCount() : 0;
}

auto State::wrap(Value const&              node,
                 std::string               path,
                 std::vector<void const*>  lineage,
                 std::weak_ptr<Observable> parent,
                 std::string               key) -> std::shared_ptr<Observable> {
    auto const id = node.identity();
    if (auto it = this->wrappers.find(id); it != this->wrappers.end())
        return it->second;

    auto wrapper = std::shared_ptr<Observable>(
            new Observable(this->weak_from_this(), node, std::move(path), std::move(lineage), std::move(parent), std::move(key)));
    this->wrappers.emplace(id, wrapper);
    return wrapper;
}

auto State::queueChange(std::string const& path, Value value) -> void {
    if (this->destroyed || !this->scheduler)
        return;
    this->scheduler->queueChange(path, std::move(value));
}

auto State::reportCycle(std::string const& path) -> void {
    if (!this->reportedCycles.insert(path).second)
        return;
    pb_warn("circular reference at '" + path + "'; edge is not reactive", "GraphIntegrity");
}

} // namespace PB
