#include <pathbind/bind/DataBinder.hpp>
#include <pathbind/log/TaggedLogger.hpp>
#include <pathbind/path/StatePath.hpp>
#include <pathbind/state/Derived.hpp>
#include <pathbind/state/State.hpp>
#include <pathbind/ui/Element.hpp>

#include <iostream>
#include <string>
#include <string_view>

using PB::UI::Element;

namespace {

auto make_todo(int id, std::string title, bool done = false) -> PB::Value {
    return PB::Value::record({{"id", id}, {"title", std::move(title)}, {"done", done}});
}

auto print_list(std::string_view heading, Element const& list, PB::State const& state) -> void {
    std::cout << heading << " (" << state.get("remaining").toDisplayString() << " remaining)\n";
    for (auto const& child : list.children()) {
        if (!child->isElement())
            continue;
        auto const& parts = child->children();
        bool const  done  = !parts.empty() && parts[0]->checked();
        std::cout << "  [" << (done ? 'x' : ' ') << "] " << child->textContent() << '\n';
    }
}

auto count_remaining(PB::State& state) -> PB::Value {
    auto todos = state.get("todos");
    if (!todos.isList())
        return PB::Value{0};
    std::size_t open = 0;
    for (auto const& item : todos.asList()->items)
        if (item.isRecord() && !PB::resolve_path(item, "done").value_or(PB::Value{}).isTruthy())
            ++open;
    return PB::Value{open};
}

} // namespace

int main(int argc, char** argv) {
    bool verbose = false;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--verbose]\n";
            return 1;
        }
    }
    PB::set_thread_name("Main");
    if (verbose)
        PB::set_logging_enabled(true);

    auto created = PB::State::create(PB::Value::record({
            {"todos", PB::Value::list({make_todo(1, "write parser"), make_todo(2, "review binder", true), make_todo(3, "ship")})},
    }));
    if (!created) {
        std::cerr << "State::create failed: " << PB::describeError(created.error()) << '\n';
        return 1;
    }
    auto state = *created;

    auto detach = PB::Derived::attach(state, "remaining", {"todos"}, count_remaining);
    if (!detach) {
        std::cerr << "Derived::attach failed: " << PB::describeError(detach.error()) << '\n';
        return 1;
    }

    // <ul><li data-for="(todo, i) in todos" data-key="todo.id">
    //   <input type="checkbox" data-bind="todo.done"> <span data-bind="i"> <span data-bind="todo.title">
    // </li></ul>
    auto page = Element::create("main");
    auto list = page->appendChild(Element::create("ul"));
    auto item = list->appendChild(Element::create("li"));
    item->setAttribute("data-for", "(todo, i) in todos");
    item->setAttribute("data-key", "todo.id");
    auto box = item->appendChild(Element::create("input"));
    box->setAttribute("type", "checkbox");
    box->setAttribute("data-bind", "todo.done");
    item->appendChild(Element::create("span"))->setAttribute("data-bind", "i");
    item->appendChild(Element::createText(". "));
    item->appendChild(Element::create("span"))->setAttribute("data-bind", "todo.title");

    PB::Bind::DataBinder binder;
    if (auto error = binder.bind(page, state)) {
        std::cerr << "bind failed: " << PB::describeError(*error) << '\n';
        return 1;
    }
    auto reconciler = binder.reconcilers(*page).front();
    print_list("initial", *list, *state);

    auto todos = state->node("todos");
    if (auto pushed = todos->push(make_todo(4, "celebrate")); !pushed) {
        std::cerr << "push failed: " << PB::describeError(pushed.error()) << '\n';
        return 1;
    }
    state->tickQueue()->drain();
    print_list("after push", *list, *state);

    auto first = reconciler->renderedNode("1");
    if (auto sorted = todos->sort([](PB::Value const& lhs, PB::Value const& rhs) {
            auto title = [](PB::Value const& todo) { return PB::resolve_path(todo, "title").value_or(PB::Value{}).toDisplayString(); };
            return title(lhs) < title(rhs);
        });
        !sorted) {
        std::cerr << "sort failed: " << PB::describeError(sorted.error()) << '\n';
        return 1;
    }
    state->tickQueue()->drain();
    print_list("after sort", *list, *state);

    if (auto renamed = state->set("todos.1.title", PB::Value{"review binder again"})) {
        std::cerr << "rename failed: " << PB::describeError(*renamed) << '\n';
        return 1;
    }
    state->tickQueue()->drain();
    print_list("after rename", *list, *state);

    if (auto done = todos->childAt(0)->set("done", PB::Value{true})) {
        std::cerr << "set failed: " << PB::describeError(*done) << '\n';
        return 1;
    }
    if (auto removed = todos->shift(); !removed) {
        std::cerr << "shift failed: " << PB::describeError(removed.error()) << '\n';
        return 1;
    }
    state->tickQueue()->drain();
    print_list("after shift", *list, *state);

    auto const& stats = reconciler->stats();
    std::cout << "created=" << stats.created << " moved=" << stats.moved << " removed=" << stats.removed
              << " updated=" << stats.updated << '\n';
    std::cout << "node for todo 1 kept: " << (reconciler->renderedNode("1") == first ? "yes" : "no") << '\n';

    (*detach)();
    binder.unbind(*page);
    state->destroy();
    return 0;
}
