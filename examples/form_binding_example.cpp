#include <pathbind/bind/DataBinder.hpp>
#include <pathbind/log/TaggedLogger.hpp>
#include <pathbind/state/State.hpp>
#include <pathbind/ui/Element.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

using PB::UI::Element;

namespace {

auto field(Element& form, std::string const& tag, std::string const& path, std::string const& type, std::string const& rules)
        -> std::shared_ptr<Element> {
    auto node = form.appendChild(Element::create(tag));
    node->setAttribute("data-bind", path);
    if (!type.empty())
        node->setAttribute("type", type);
    if (!rules.empty())
        node->setAttribute("data-rule", rules);
    return node;
}

auto load_state(std::string const& file) -> PB::Expected<PB::Value> {
    std::ifstream in(file);
    if (!in)
        return std::unexpected(PB::Error{PB::Error::Code::NoSuchPath, "cannot open " + file});
    auto json = nlohmann::json::parse(in, nullptr, false);
    if (json.is_discarded())
        return std::unexpected(PB::Error{PB::Error::Code::MalformedInput, file + " is not valid JSON"});
    return PB::Value::fromJson(json);
}

auto type_into(Element& control, std::string text) -> void {
    control.setValue(std::move(text));
    control.dispatchEvent("input");
}

auto print_errors(PB::State const& state) -> void {
    for (auto const* path : {"errors.user.name", "errors.user.email", "errors.user.age"}) {
        auto message = state.get(path).toDisplayString();
        std::cout << "  " << path << ": " << (message.empty() ? "ok" : message) << '\n';
    }
}

} // namespace

int main(int argc, char** argv) {
    bool        dumpJson = false;
    std::string stateFile;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--dump_json") {
            dumpJson = true;
        } else if (arg == "--state" && idx + 1 < argc) {
            stateFile = argv[++idx];
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--state <file.json>] [--dump_json]\n";
            return 1;
        }
    }
    PB::set_thread_name("Main");

    auto initial = PB::Value::record({{"user", PB::Value::record({{"name", ""}, {"email", ""}, {"age", 0}, {"newsletter", false}, {"plan", "free"}})}});
    if (!stateFile.empty()) {
        auto loaded = load_state(stateFile);
        if (!loaded) {
            std::cerr << "load_state failed: " << PB::describeError(loaded.error()) << '\n';
            return 1;
        }
        initial = *loaded;
    }

    auto created = PB::State::create(initial);
    if (!created) {
        std::cerr << "State::create failed: " << PB::describeError(created.error()) << '\n';
        return 1;
    }
    auto state = *created;

    auto form       = Element::create("form");
    auto name       = field(*form, "input", "user.name", "text", "required|min:3");
    auto email      = field(*form, "input", "user.email", "email", "required|email");
    auto age        = field(*form, "input", "user.age", "number", "numeric|min:18|max:120");
    auto newsletter = field(*form, "input", "user.newsletter", "checkbox", "");
    auto plan       = field(*form, "select", "user.plan", "", "");
    for (auto const* value : {"free", "pro", "team"}) {
        auto option = plan->appendChild(Element::create("option"));
        option->setAttribute("value", value);
        option->setTextContent(value);
    }
    auto greeting = form->appendChild(Element::create("p"));
    greeting->setAttribute("data-bind", "user.name");

    PB::Bind::DataBinder binder;
    if (auto error = binder.bind(form, state)) {
        std::cerr << "bind failed: " << PB::describeError(*error) << '\n';
        return 1;
    }

    std::cout << "initial:\n";
    print_errors(*state);

    type_into(*name, "Jo");
    type_into(*email, "jo@example");
    type_into(*age, "17");
    std::cout << "after first attempt:\n";
    print_errors(*state);

    type_into(*name, "Joanna");
    type_into(*email, "joanna@example.com");
    type_into(*age, "34");
    newsletter->setChecked(true);
    newsletter->dispatchEvent("change");
    plan->setValue("pro");
    plan->dispatchEvent("change");
    state->tickQueue()->drain();

    std::cout << "after correction:\n";
    print_errors(*state);
    std::cout << "greeting: " << greeting->textContent() << '\n';

    // Programmatic writes flow back into the controls on the next flush.
    if (auto error = state->set("user.plan", PB::Value{"team"})) {
        std::cerr << "set failed: " << PB::describeError(*error) << '\n';
        return 1;
    }
    state->flushSync();
    std::cout << "plan control: " << plan->value() << '\n';

    if (dumpJson)
        std::cout << state->root()->raw().toJson().dump(2) << '\n';

    binder.unbindAll();
    state->destroy();
    return 0;
}
