#pragma once

#include <pathbind/core/Error.hpp>
#include <pathbind/core/Value.hpp>
#include <pathbind/state/State.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace PB {

/**
 * Derived: a state path whose value is computed from other paths.
 *
 * attach() writes getter(state) at name immediately, then recomputes it each
 * time one of the dependency paths is notified. The recomputed value is
 * written only when equality(current, next) is false, so an unchanged
 * result does not notify name's own subscribers.
 *
 * The returned function detaches every dependency subscription; the value
 * already written at name stays in place.
 */
struct Derived {
    using Getter   = std::function<Value(State&)>;
    using Equality = std::function<bool(Value const&, Value const&)>;

    static auto attach(std::shared_ptr<State> const& state,
                       std::string                   name,
                       std::vector<std::string>      dependencies,
                       Getter                        getter,
                       Equality                      equality = shallowEquals) -> Expected<State::Unsubscribe>;
};

} // namespace PB
