#include <pathbind/ui/Element.hpp>

#include <algorithm>
#include <cctype>

namespace PB::UI {

namespace {

auto to_lower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

auto append_text(Element const& node, std::string& out) -> void {
    for (auto const& child : node.children()) {
        if (child->kind() == NodeKind::Text)
            out += child->textContent();
        else if (child->kind() == NodeKind::Element)
            append_text(*child, out);
    }
}

} // namespace

Element::Element(NodeKind kind, std::string tagOrData)
    : nodeKind(kind) {
    if (kind == NodeKind::Element)
        this->tagName = to_lower(std::move(tagOrData));
    else
        this->data = std::move(tagOrData);
}

auto Element::create(std::string tag) -> std::shared_ptr<Element> {
    return std::make_shared<Element>(NodeKind::Element, std::move(tag));
}

auto Element::createText(std::string text) -> std::shared_ptr<Element> {
    return std::make_shared<Element>(NodeKind::Text, std::move(text));
}

auto Element::createComment(std::string text) -> std::shared_ptr<Element> {
    return std::make_shared<Element>(NodeKind::Comment, std::move(text));
}

auto Element::attribute(std::string_view name) const -> std::optional<std::string> {
    for (auto const& [key, value] : this->attributeList)
        if (key == name)
            return value;
    return std::nullopt;
}

auto Element::hasAttribute(std::string_view name) const -> bool {
    return std::any_of(this->attributeList.begin(), this->attributeList.end(),
                       [&](auto const& entry) { return entry.first == name; });
}

auto Element::setAttribute(std::string_view name, std::string value) -> void {
    if (this->tagName == "option" && name == "selected")
        this->optionSelected = true;
    for (auto& [key, current] : this->attributeList) {
        if (key == name) {
            current = std::move(value);
            return;
        }
    }
    this->attributeList.emplace_back(std::string(name), std::move(value));
}

auto Element::removeAttribute(std::string_view name) -> bool {
    auto it = std::find_if(this->attributeList.begin(), this->attributeList.end(),
                           [&](auto const& entry) { return entry.first == name; });
    if (it == this->attributeList.end())
        return false;
    this->attributeList.erase(it);
    return true;
}

auto Element::textContent() const -> std::string {
    if (this->nodeKind != NodeKind::Element)
        return this->data;
    std::string out;
    append_text(*this, out);
    return out;
}

auto Element::setTextContent(std::string text) -> void {
    if (this->nodeKind != NodeKind::Element) {
        this->data = std::move(text);
        return;
    }
    for (auto& child : this->childNodes)
        child->parentNode.reset();
    this->childNodes.clear();
    if (!text.empty())
        this->appendChild(Element::createText(std::move(text)));
}

auto Element::isControl() const -> bool {
    return this->tagName == "input" || this->tagName == "textarea" || this->tagName == "select";
}

auto Element::inputType() const -> std::string {
    if (this->tagName != "input")
        return {};
    return to_lower(this->attribute("type").value_or("text"));
}

auto Element::value() const -> std::string {
    if (this->tagName == "option")
        return this->attribute("value").value_or(this->textContent());
    if (this->tagName == "select") {
        auto* self = const_cast<Element*>(this);
        for (auto const& option : self->options())
            if (option->selected())
                return option->value();
        return {};
    }
    if (this->controlValue)
        return *this->controlValue;
    if (auto attr = this->attribute("value"))
        return *attr;
    auto const type = this->inputType();
    if (type == "checkbox" || type == "radio")
        return "on";
    return {};
}

auto Element::setValue(std::string value) -> void {
    if (this->tagName == "select") {
        bool matched = false;
        for (auto const& option : this->options()) {
            bool const select = !matched && option->value() == value;
            option->setSelected(select);
            matched = matched || select;
        }
        return;
    }
    if (this->tagName == "option") {
        this->setAttribute("value", std::move(value));
        return;
    }
    this->controlValue = std::move(value);
}

auto Element::checked() const -> bool {
    if (this->checkedState)
        return *this->checkedState;
    return this->hasAttribute("checked");
}

auto Element::setChecked(bool checked) -> void {
    this->checkedState = checked;
}

auto Element::collectOptions(std::vector<std::shared_ptr<Element>>& out) -> void {
    for (auto const& child : this->childNodes) {
        if (!child->isElement())
            continue;
        if (child->tagName == "option")
            out.push_back(child);
        else
            child->collectOptions(out);
    }
}

auto Element::options() -> std::vector<std::shared_ptr<Element>> {
    std::vector<std::shared_ptr<Element>> out;
    this->collectOptions(out);
    return out;
}

auto Element::selectedValues() -> std::vector<std::string> {
    std::vector<std::string> values;
    for (auto const& option : this->options())
        if (option->selected())
            values.push_back(option->value());
    return values;
}

auto Element::setSelectedValues(std::vector<std::string> const& values) -> void {
    for (auto const& option : this->options())
        option->setSelected(std::find(values.begin(), values.end(), option->value()) != values.end());
}

auto Element::indexInParent() const -> std::optional<std::size_t> {
    auto owner = this->parentNode.lock();
    if (!owner)
        return std::nullopt;
    auto const& siblings = owner->childNodes;
    for (std::size_t i = 0; i < siblings.size(); ++i)
        if (siblings[i].get() == this)
            return i;
    return std::nullopt;
}

auto Element::previousSibling() const -> std::shared_ptr<Element> {
    auto index = this->indexInParent();
    if (!index || *index == 0)
        return nullptr;
    return this->parentNode.lock()->childNodes[*index - 1];
}

auto Element::nextSibling() const -> std::shared_ptr<Element> {
    auto index = this->indexInParent();
    if (!index)
        return nullptr;
    auto const& siblings = this->parentNode.lock()->childNodes;
    return *index + 1 < siblings.size() ? siblings[*index + 1] : nullptr;
}

auto Element::hasElementChildren() const -> bool {
    return std::any_of(this->childNodes.begin(), this->childNodes.end(),
                       [](auto const& child) { return child->isElement(); });
}

auto Element::contains(Element const* node) const -> bool {
    for (auto const* current = node; current != nullptr;) {
        if (current == this)
            return true;
        auto owner = current->parentNode.lock();
        current    = owner.get();
    }
    return false;
}

auto Element::appendChild(std::shared_ptr<Element> child) -> std::shared_ptr<Element> {
    if (!child || child.get() == this)
        return child;
    child->remove();
    child->parentNode = this->weak_from_this();
    this->childNodes.push_back(child);
    return child;
}

auto Element::after(std::shared_ptr<Element> node) -> void {
    if (!node || node.get() == this)
        return;
    auto owner = this->parentNode.lock();
    if (!owner)
        return;
    node->remove();
    auto index = this->indexInParent();
    if (!index)
        return;
    node->parentNode = owner;
    owner->childNodes.insert(owner->childNodes.begin() + static_cast<std::ptrdiff_t>(*index + 1), std::move(node));
}

auto Element::remove() -> void {
    auto owner = this->parentNode.lock();
    if (!owner)
        return;
    auto& siblings = owner->childNodes;
    auto  it       = std::find_if(siblings.begin(), siblings.end(), [this](auto const& child) { return child.get() == this; });
    this->parentNode.reset();
    if (it != siblings.end())
        siblings.erase(it);
}

auto Element::cloneDeep() const -> std::shared_ptr<Element> {
    auto copy = std::make_shared<Element>(this->nodeKind, std::string{});
    copy->tagName        = this->tagName;
    copy->data           = this->data;
    copy->attributeList  = this->attributeList;
    copy->controlValue   = this->controlValue;
    copy->checkedState   = this->checkedState;
    copy->optionSelected = this->optionSelected;
    for (auto const& child : this->childNodes)
        copy->appendChild(child->cloneDeep());
    return copy;
}

auto Element::addEventListener(std::string name, Handler handler) -> ListenerId {
    auto id = this->nextListenerId++;
    this->listeners.push_back(Listener{.id = id, .name = std::move(name), .handler = std::move(handler)});
    return id;
}

auto Element::removeEventListener(ListenerId id) -> bool {
    auto it = std::find_if(this->listeners.begin(), this->listeners.end(), [id](auto const& l) { return l.id == id; });
    if (it == this->listeners.end())
        return false;
    this->listeners.erase(it);
    return true;
}

auto Element::dispatchEvent(std::string_view name) -> std::size_t {
    auto keepAlive = this->shared_from_this();
    std::vector<Listener> snapshot;
    for (auto const& listener : this->listeners)
        if (listener.name == name)
            snapshot.push_back(listener);

    std::size_t invoked = 0;
    for (auto const& listener : snapshot) {
        bool const live = std::any_of(this->listeners.begin(), this->listeners.end(),
                                      [&](auto const& l) { return l.id == listener.id; });
        if (!live)
            continue;
        listener.handler(*this);
        ++invoked;
    }
    return invoked;
}

auto Element::listenerCount(std::string_view name) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(this->listeners.begin(), this->listeners.end(),
                                                  [&](auto const& l) { return l.name == name; }));
}

auto Element::forEachDescendant(Visitor const& visitor) -> void {
    // Snapshot so visitors may restructure the subtree.
    auto snapshot = this->childNodes;
    for (auto const& child : snapshot) {
        if (!child->isElement())
            continue;
        visitor(*child);
        child->forEachDescendant(visitor);
    }
}

auto Element::querySelectorAll(std::string_view attributeName) -> std::vector<std::shared_ptr<Element>> {
    std::vector<std::shared_ptr<Element>> matches;
    this->forEachDescendant([&](Element& node) {
        if (node.hasAttribute(attributeName))
            matches.push_back(node.shared_from_this());
    });
    return matches;
}

auto Element::closest(std::string_view attributeName) -> std::shared_ptr<Element> {
    for (auto current = this->shared_from_this(); current; current = current->parent())
        if (current->hasAttribute(attributeName))
            return current;
    return nullptr;
}

} // namespace PB::UI
