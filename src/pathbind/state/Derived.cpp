#include <pathbind/state/Derived.hpp>
#include <pathbind/log/TaggedLogger.hpp>
#include <pathbind/path/StatePath.hpp>

namespace PB {

namespace {

// Clears the flag again when the getter throws.
struct ComputingScope {
    explicit ComputingScope(bool& flag) : flag(flag) { flag = true; }
    ~ComputingScope() { flag = false; }

    ComputingScope(ComputingScope const&)            = delete;
    ComputingScope& operator=(ComputingScope const&) = delete;

    bool& flag;
};

struct DerivedLink {
    std::weak_ptr<State>              owner;
    std::string                       name;
    Derived::Getter                   getter;
    Derived::Equality                 equality;
    std::vector<State::Unsubscribe>   subscriptions;
    bool                              computing = false;

    auto recompute() -> void {
        auto state = this->owner.lock();
        if (!state || state->isDestroyed() || this->computing)
            return;

        Value next;
        {
            ComputingScope scope{this->computing};
            next = this->getter(*state);
        }

        if (this->equality(state->get(this->name), next))
            return;
        if (auto error = state->set(this->name, std::move(next)))
            pb_warn("derived '" + this->name + "' could not be written: " + describeError(*error), "Derived");
    }
};

} // namespace

auto Derived::attach(std::shared_ptr<State> const& state,
                     std::string                   name,
                     std::vector<std::string>      dependencies,
                     Getter                        getter,
                     Equality                      equality) -> Expected<State::Unsubscribe> {
    if (!state || state->isDestroyed())
        return std::unexpected(Error{Error::Code::Destroyed, "derived value needs a live state"});
    if (!getter)
        return std::unexpected(Error{Error::Code::InvalidArgument, "derived '" + name + "' has no getter"});
    if (auto check = validate_binding_path(name); check.code != PathValidationError::Code::None)
        return std::unexpected(Error{Error::Code::InvalidPath, "derived name '" + name + "': " + describe_path_error(check)});
    for (auto const& dependency : dependencies) {
        if (auto check = validate_binding_path(dependency); check.code != PathValidationError::Code::None)
            return std::unexpected(Error{Error::Code::InvalidPath, "dependency '" + dependency + "': " + describe_path_error(check)});
    }

    auto link      = std::make_shared<DerivedLink>();
    link->owner    = state;
    link->name     = std::move(name);
    link->getter   = std::move(getter);
    link->equality = equality ? std::move(equality) : Equality{shallowEquals};

    if (auto error = state->set(link->name, link->getter(*state)))
        return std::unexpected(*error);

    for (auto const& dependency : dependencies)
        link->subscriptions.push_back(state->subscribe(dependency, [link](Value const&) { link->recompute(); }));

    pb_log("derived '" + link->name + "' attached to " + std::to_string(dependencies.size()) + " paths", "Derived");

    std::weak_ptr<DerivedLink> weakLink = link;
    return State::Unsubscribe{[weakLink] {
        auto held = weakLink.lock();
        if (!held)
            return;
        auto subscriptions = std::move(held->subscriptions);
        held->subscriptions.clear();
        for (auto& unsubscribe : subscriptions)
            unsubscribe();
    }};
}

} // namespace PB
