#include <pathbind/ui/Element.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace PB::UI;

namespace {

auto tags(std::vector<std::shared_ptr<Element>> const& nodes) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (auto const& node : nodes)
        out.push_back(node->isElement() ? node->tag() : "#" + node->textContent());
    return out;
}

auto option(std::string value, std::string label) -> std::shared_ptr<Element> {
    auto node = Element::create("option");
    node->setAttribute("value", std::move(value));
    node->setTextContent(std::move(label));
    return node;
}

} // namespace

TEST_SUITE("ui.element") {

TEST_CASE("attributes and text content") {
    auto div = Element::create("DIV");
    CHECK(div->tag() == "div");

    div->setAttribute("data-bind", "user.name");
    div->setAttribute("data-bind", "user.email");
    CHECK(div->attribute("data-bind") == std::optional<std::string>{"user.email"});
    CHECK(div->attributes().size() == 1);
    CHECK(div->removeAttribute("data-bind"));
    CHECK_FALSE(div->removeAttribute("data-bind"));
    CHECK_FALSE(div->attribute("data-bind").has_value());

    auto span = div->appendChild(Element::create("span"));
    span->setTextContent("Hello");
    div->appendChild(Element::createText(", world"));
    CHECK(div->textContent() == "Hello, world");

    div->setTextContent("replaced");
    REQUIRE(div->children().size() == 1);
    CHECK(div->children()[0]->kind() == NodeKind::Text);
    CHECK(span->parent() == nullptr);
    CHECK_FALSE(div->hasElementChildren());
}

TEST_CASE("sibling navigation after and remove") {
    auto list = Element::create("ul");
    auto a    = list->appendChild(Element::create("a"));
    auto b    = list->appendChild(Element::create("b"));
    auto c    = list->appendChild(Element::create("c"));

    CHECK(b->previousSibling() == a);
    CHECK(b->nextSibling() == c);
    CHECK(a->previousSibling() == nullptr);
    CHECK(c->nextSibling() == nullptr);

    a->after(c);
    CHECK(tags(list->children()) == std::vector<std::string>{"a", "c", "b"});
    b->after(a);
    CHECK(tags(list->children()) == std::vector<std::string>{"c", "b", "a"});

    b->remove();
    CHECK(tags(list->children()) == std::vector<std::string>{"c", "a"});
    CHECK(b->parent() == nullptr);

    auto detached = Element::create("x");
    detached->after(b);
    CHECK(b->parent() == nullptr);

    auto other = Element::create("div");
    other->appendChild(c);
    CHECK(tags(list->children()) == std::vector<std::string>{"a"});
    CHECK(c->parent() == other);
}

TEST_CASE("contains and closest") {
    auto root  = Element::create("div");
    auto outer = root->appendChild(Element::create("section"));
    outer->setAttribute("data-for", "x in xs");
    auto inner = outer->appendChild(Element::create("p"));

    CHECK(root->contains(inner.get()));
    CHECK(root->contains(root.get()));
    CHECK_FALSE(inner->contains(root.get()));
    CHECK(inner->closest("data-for") == outer);
    CHECK(outer->closest("data-for") == outer);
    CHECK(root->closest("data-for") == nullptr);
}

TEST_CASE("querySelectorAll is pre-order and skips the root and non-elements") {
    auto root = Element::create("div");
    root->setAttribute("data-bind", "self");
    auto first = root->appendChild(Element::create("h1"));
    first->setAttribute("data-bind", "title");
    auto nested = first->appendChild(Element::create("em"));
    nested->setAttribute("data-bind", "subtitle");
    root->appendChild(Element::createComment("data-bind"));
    auto last = root->appendChild(Element::create("p"));
    last->setAttribute("data-bind", "body");

    CHECK(tags(root->querySelectorAll("data-bind")) == std::vector<std::string>{"h1", "em", "p"});
    CHECK(root->querySelectorAll("data-for").empty());
}

TEST_CASE("cloneDeep copies structure and state but not listeners or scope") {
    auto root = Element::create("li");
    root->setAttribute("class", "item");
    root->appendChild(Element::create("input"))->setValue("typed");
    root->addEventListener("click", [](Element&) {});
    root->setScope(ItemScope{.item = PB::Value{"x"}, .varName = "item", .index = 0, .indexName = {}, .rootSourcePath = "items"});

    auto copy = root->cloneDeep();
    CHECK(copy != root);
    CHECK(copy->attribute("class") == std::optional<std::string>{"item"});
    REQUIRE(copy->children().size() == 1);
    CHECK(copy->children()[0] != root->children()[0]);
    CHECK(copy->children()[0]->value() == "typed");
    CHECK(copy->children()[0]->parent() == copy);
    CHECK(copy->listenerCount() == 0);
    CHECK(copy->scope() == nullptr);
    CHECK(root->scope() != nullptr);
}

TEST_CASE("events run live listeners in registration order") {
    auto                     button = Element::create("button");
    std::vector<std::string> calls;
    Element::ListenerId      second = 0;

    button->addEventListener("click", [&](Element& target) {
        calls.push_back("first:" + target.tag());
        target.removeEventListener(second);
    });
    second = button->addEventListener("click", [&](Element&) { calls.push_back("second"); });
    button->addEventListener("focus", [&](Element&) { calls.push_back("focus"); });

    CHECK(button->listenerCount("click") == 2);
    CHECK(button->dispatchEvent("click") == 1);
    CHECK(calls == std::vector<std::string>{"first:button"});
    CHECK(button->listenerCount("click") == 1);
    CHECK(button->dispatchEvent("blur") == 0);
}

TEST_CASE("text inputs") {
    auto input = Element::create("input");
    CHECK(input->isControl());
    CHECK(input->inputType() == "text");
    CHECK(input->value().empty());

    input->setAttribute("value", "initial");
    CHECK(input->value() == "initial");
    input->setValue("typed");
    CHECK(input->value() == "typed");
    CHECK(input->attribute("value") == std::optional<std::string>{"initial"});

    CHECK(Element::create("textarea")->isControl());
    CHECK_FALSE(Element::create("div")->isControl());
    CHECK(Element::create("div")->inputType().empty());
}

TEST_CASE("checkboxes and radios") {
    auto box = Element::create("input");
    box->setAttribute("type", "CheckBox");
    CHECK(box->inputType() == "checkbox");
    CHECK(box->value() == "on");
    CHECK_FALSE(box->checked());
    box->setAttribute("checked", "");
    CHECK(box->checked());
    box->setChecked(false);
    CHECK_FALSE(box->checked());

    auto radio = Element::create("input");
    radio->setAttribute("type", "radio");
    radio->setAttribute("value", "red");
    CHECK(radio->value() == "red");
}

TEST_CASE("select options") {
    auto select = Element::create("select");
    select->appendChild(option("a", "Alpha"));
    auto group = select->appendChild(Element::create("optgroup"));
    group->appendChild(option("b", "Beta"));
    auto plain = select->appendChild(Element::create("option"));
    plain->setTextContent("Gamma");
    plain->setAttribute("selected", "");

    CHECK(select->options().size() == 3);
    CHECK(plain->value() == "Gamma");
    CHECK(select->value() == "Gamma");

    select->setValue("b");
    CHECK(select->value() == "b");
    CHECK(select->selectedValues() == std::vector<std::string>{"b"});

    select->setValue("missing");
    CHECK(select->value().empty());

    select->setAttribute("multiple", "");
    CHECK(select->isMultiple());
    select->setSelectedValues({"a", "Gamma"});
    CHECK(select->selectedValues() == std::vector<std::string>{"a", "Gamma"});
}

} // TEST_SUITE
