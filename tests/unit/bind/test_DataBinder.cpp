#include <pathbind/bind/DataBinder.hpp>

#include "LogCapture.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace PB;
using namespace PB::Bind;
using PB::UI::Element;

namespace {

auto makeState(Value initial) -> std::shared_ptr<State> {
    auto state = State::create(std::move(initial));
    REQUIRE(state.has_value());
    return *state;
}

auto control(std::string tag, std::string path, std::string type = {}) -> std::shared_ptr<Element> {
    auto node = Element::create(std::move(tag));
    node->setAttribute("data-bind", std::move(path));
    if (!type.empty())
        node->setAttribute("type", std::move(type));
    return node;
}

auto option(std::string value) -> std::shared_ptr<Element> {
    auto node = Element::create("option");
    node->setAttribute("value", value);
    node->setTextContent(std::move(value));
    return node;
}

} // namespace

TEST_SUITE("bind.data_binder") {

TEST_CASE("bind rejects missing arguments and destroyed states") {
    DataBinder binder;
    auto       state = makeState(Value::record());
    auto       root  = Element::create("div");

    auto noRoot = binder.bind(nullptr, state);
    REQUIRE(noRoot);
    CHECK(noRoot->code == Error::Code::InvalidArgument);

    auto noState = binder.bind(root, nullptr);
    REQUIRE(noState);
    CHECK(noState->code == Error::Code::InvalidArgument);

    state->destroy();
    auto destroyed = binder.bind(root, state);
    REQUIRE(destroyed);
    CHECK(destroyed->code == Error::Code::Destroyed);
    CHECK(binder.rootCount() == 0);
}

TEST_CASE("one-way text follows the state") {
    auto       state = makeState(Value::record({{"user", Value::record({{"name", "Ada"}})}}));
    DataBinder binder;
    auto       root  = Element::create("div");
    auto       label = root->appendChild(Element::create("span"));
    label->setAttribute("data-bind", "user.name");
    auto missing = root->appendChild(Element::create("span"));
    missing->setAttribute("data-bind", "user.nickname");

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(label->textContent() == "Ada");
    CHECK(missing->textContent().empty());
    CHECK(binder.bindingCount(*root) == 2);
    CHECK(state->lookup("errors").has_value());

    REQUIRE_FALSE(state->set("user.name", Value{"Grace"}));
    CHECK(label->textContent() == "Ada");
    state->tickQueue()->drain();
    CHECK(label->textContent() == "Grace");

    REQUIRE_FALSE(state->set("user.nickname", Value{42}));
    state->flushSync();
    CHECK(missing->textContent() == "42");
}

TEST_CASE("binding twice never attaches a second listener") {
    auto       state = makeState(Value::record({{"name", "Ada"}}));
    DataBinder binder;
    auto       root  = Element::create("form");
    auto       input = root->appendChild(control("input", "name"));

    REQUIRE_FALSE(binder.bind(root, state));
    REQUIRE_FALSE(binder.bind(root, state));

    auto section = Element::create("section");
    section->appendChild(root);
    REQUIRE_FALSE(binder.bind(section, state));

    CHECK(input->listenerCount("input") == 1);
    CHECK(state->subscriberCount("name") == 1);
    CHECK(binder.bindingCount(*root) == 1);
    CHECK(binder.bindingCount(*section) == 0);
}

TEST_CASE("number input with validation") {
    auto       state = makeState(Value::record({{"age", 0}}));
    DataBinder binder;
    auto       root  = Element::create("form");
    auto       input = root->appendChild(control("input", "age", "number"));
    input->setAttribute("data-rule", "required|min:18");

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(input->value() == "0");
    CHECK(state->get("errors.age") == Value{"Must be at least 18"});

    input->setValue("10");
    CHECK(input->dispatchEvent("input") == 1);
    CHECK(state->get("age") == Value{10});
    CHECK(state->get("errors.age") == Value{"Must be at least 18"});

    input->setValue("20");
    input->dispatchEvent("input");
    CHECK(state->get("age") == Value{20});
    CHECK(state->get("errors.age") == Value{""});

    state->tickQueue()->drain();
    CHECK(input->value() == "20");

    input->setValue("abc");
    input->dispatchEvent("input");
    CHECK(state->get("age") == Value{0});
}

TEST_CASE("date inputs keep their text") {
    auto       state = makeState(Value::record({{"due", "2024-05-01"}}));
    DataBinder binder;
    auto       root  = Element::create("form");
    auto       input = root->appendChild(control("input", "due", "date"));

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(input->value() == "2024-05-01");

    input->setValue("2024-06-15");
    input->dispatchEvent("input");
    CHECK(state->get("due") == Value{"2024-06-15"});
}

TEST_CASE("external changes update the control and validate again") {
    auto       state = makeState(Value::record({{"name", "Ada"}}));
    DataBinder binder;
    auto       root  = Element::create("form");
    auto       input = root->appendChild(control("textarea", "name"));
    input->setAttribute("data-rule", "required|min:3");

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(state->get("errors.name") == Value{""});

    REQUIRE_FALSE(state->set("name", Value{"Al"}));
    state->tickQueue()->drain();
    CHECK(input->value() == "Al");
    CHECK(state->get("errors.name") == Value{"Must be at least 3 characters"});

    REQUIRE_FALSE(state->set("name", Value{""}));
    state->tickQueue()->drain();
    CHECK(state->get("errors.name") == Value{"This field is required"});
}

TEST_CASE("checkbox") {
    auto       state = makeState(Value::record({{"done", true}}));
    DataBinder binder;
    auto       root  = Element::create("div");
    auto       box   = root->appendChild(control("input", "done", "checkbox"));

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(box->checked());
    CHECK(box->listenerCount("change") == 1);

    box->setChecked(false);
    box->dispatchEvent("change");
    CHECK(state->get("done") == Value{false});

    REQUIRE_FALSE(state->set("done", Value{"yes"}));
    state->tickQueue()->drain();
    CHECK(box->checked());
}

TEST_CASE("radio group") {
    auto       state = makeState(Value::record({{"color", "blue"}}));
    DataBinder binder;
    auto       root  = Element::create("fieldset");
    auto       red   = root->appendChild(control("input", "color", "radio"));
    red->setAttribute("value", "red");
    auto blue = root->appendChild(control("input", "color", "radio"));
    blue->setAttribute("value", "blue");

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK_FALSE(red->checked());
    CHECK(blue->checked());

    red->setChecked(true);
    red->dispatchEvent("change");
    CHECK(state->get("color") == Value{"red"});

    state->tickQueue()->drain();
    CHECK(red->checked());
    CHECK_FALSE(blue->checked());
}

TEST_CASE("single and multiple selects") {
    auto       state = makeState(Value::record({{"size", "m"}, {"tags", Value::list({"b"})}}));
    DataBinder binder;
    auto       root  = Element::create("form");

    auto size = root->appendChild(control("select", "size"));
    for (auto const* v : {"s", "m", "l"})
        size->appendChild(option(v));

    auto tags = root->appendChild(control("select", "tags"));
    tags->setAttribute("multiple", "");
    for (auto const* v : {"a", "b", "c"})
        tags->appendChild(option(v));

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(size->value() == "m");
    CHECK(tags->selectedValues() == std::vector<std::string>{"b"});

    size->setValue("l");
    size->dispatchEvent("change");
    CHECK(state->get("size") == Value{"l"});

    tags->setSelectedValues({"a", "c"});
    tags->dispatchEvent("change");
    auto selected = state->get("tags");
    REQUIRE(selected.isList());
    REQUIRE(selected.asList()->items.size() == 2);
    CHECK(selected.asList()->items[0] == Value{"a"});
    CHECK(selected.asList()->items[1] == Value{"c"});

    state->tickQueue()->drain();
    CHECK(tags->selectedValues() == std::vector<std::string>{"a", "c"});
}

TEST_CASE("malformed markers are skipped with a warning") {
    LogCapture capture;
    auto       state = makeState(Value::record({{"ok", "yes"}}));
    DataBinder binder;
    auto       root  = Element::create("div");
    auto       bad   = root->appendChild(Element::create("span"));
    bad->setAttribute("data-bind", "user..name");
    auto loop = root->appendChild(Element::create("li"));
    loop->setAttribute("data-for", "todos");
    auto good = root->appendChild(Element::create("span"));
    good->setAttribute("data-bind", "ok");

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(capture.warnings("BindingSyntax") == 2);
    CHECK(good->textContent() == "yes");
    CHECK(binder.bindingCount(*root) == 1);
    CHECK(binder.reconcilers(*root).empty());
}

TEST_CASE("unbind removes listeners and subscriptions") {
    auto       state = makeState(Value::record({{"name", "Ada"}, {"title", "Dr"}}));
    DataBinder binder;
    auto       root  = Element::create("div");
    auto       input = root->appendChild(control("input", "name"));
    auto       title = root->appendChild(Element::create("h1"));
    title->setAttribute("data-bind", "title");

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(binder.isBound(*root));
    CHECK(state->subscriberCount() == 2);

    binder.unbind(*root);
    CHECK_FALSE(binder.isBound(*root));
    CHECK(input->listenerCount() == 0);
    CHECK(state->subscriberCount() == 0);

    REQUIRE_FALSE(state->set("title", Value{"Prof"}));
    state->tickQueue()->drain();
    CHECK(title->textContent() == "Dr");

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(input->listenerCount("input") == 1);
    CHECK(title->textContent() == "Prof");
}

TEST_CASE("custom attribute names") {
    auto       state = makeState(Value::record({{"msg", "hi"}}));
    DataBinder binder(BinderOptions{.bindAttribute = "x-text", .forAttribute = "x-for", .keyAttribute = "x-key", .ruleAttribute = "x-rule", .errorsRoot = "invalid"});
    auto       root = Element::create("div");
    auto       text = root->appendChild(Element::create("p"));
    text->setAttribute("x-text", "msg");
    auto input = root->appendChild(Element::create("input"));
    input->setAttribute("x-text", "msg");
    input->setAttribute("x-rule", "min:5");

    REQUIRE_FALSE(binder.bind(root, state));
    CHECK(text->textContent() == "hi");
    CHECK(state->get("invalid.msg") == Value{"Must be at least 5 characters"});
    CHECK_FALSE(state->lookup("errors").has_value());
}

TEST_CASE("module-level bind uses the shared binder") {
    auto state = makeState(Value::record({{"greeting", "hello"}}));
    auto root  = Element::create("div");
    auto text  = root->appendChild(Element::create("p"));
    text->setAttribute("data-bind", "greeting");

    REQUIRE_FALSE(Bind::bind(root, state));
    CHECK(defaultBinder().isBound(*root));
    CHECK(text->textContent() == "hello");

    Bind::unbind(*root);
    CHECK_FALSE(defaultBinder().isBound(*root));
    CHECK(state->subscriberCount() == 0);
}

} // TEST_SUITE
