#include <pathbind/bind/DataBinder.hpp>
#include <pathbind/bind/LoopExpression.hpp>
#include <pathbind/bind/Validation.hpp>
#include <pathbind/log/TaggedLogger.hpp>
#include <pathbind/path/StatePath.hpp>

#include "BindingDetail.hpp"

namespace PB::Bind {

namespace {

auto has_item_scope(std::shared_ptr<UI::Element> node) -> bool {
    for (; node; node = node->parent())
        if (node->scope())
            return true;
    return false;
}

auto write_error(State& state, std::string const& errorsPath, std::string message) -> void {
    if (auto error = state.set(errorsPath, Value{std::move(message)}))
        pb_warn("could not record validation result at '" + errorsPath + "': " + describeError(*error), "Validation");
}

} // namespace

DataBinder::DataBinder(BinderOptions options)
    : binderOptions(std::move(options)) {}

DataBinder::~DataBinder() {
    this->unbindAll();
}

auto DataBinder::bind(std::shared_ptr<UI::Element> const& root, std::shared_ptr<State> const& state) -> std::optional<Error> {
    if (!root)
        return Error{Error::Code::InvalidArgument, "bind needs a root element"};
    if (!state)
        return Error{Error::Code::InvalidArgument, "bind needs a state"};
    if (state->isDestroyed())
        return Error{Error::Code::Destroyed, "bind on a destroyed state"};

    auto const& errorsRoot = this->binderOptions.errorsRoot;
    if (!errorsRoot.empty() && !state->lookup(errorsRoot)) {
        if (auto error = state->set(errorsRoot, Value::record()))
            pb_warn("could not create '" + errorsRoot + "': " + describeError(*error), "Validation");
    }

    if (auto it = this->roots.find(root.get()); it != this->roots.end() && it->second->root.lock() != root)
        this->unbind(*root); // stale record left by a destroyed element at the same address

    auto& slot = this->roots[root.get()];
    if (!slot)
        slot = std::make_shared<RootRecord>(RootRecord{.root = root, .state = state, .processed = {}, .bindings = {}, .reconcilers = {}});
    auto record = slot;

    this->bindCollections(*record, *root, state);
    this->bindScalars(*record, *root, state);
    pb_log("bound root bindings=" + std::to_string(record->bindings.size()) + " collections=" + std::to_string(record->reconcilers.size()),
           "Bind");
    return std::nullopt;
}

auto DataBinder::isProcessed(UI::Element const& element) const -> bool {
    for (auto const& [_, record] : this->roots) {
        auto it = record->processed.find(&element);
        if (it != record->processed.end() && it->second.lock().get() == &element)
            return true;
    }
    return false;
}

auto DataBinder::bindCollections(RootRecord& record, UI::Element& root, std::shared_ptr<State> const& state) -> void {
    auto const& forAttribute = this->binderOptions.forAttribute;
    auto const& keyAttribute = this->binderOptions.keyAttribute;

    for (auto const& marker : root.querySelectorAll(forAttribute)) {
        // Earlier markers may have detached this one along with their template.
        if (this->isProcessed(*marker) || !root.contains(marker.get()))
            continue;

        bool nested = false;
        for (auto up = marker->parent(); up && up.get() != &root; up = up->parent()) {
            if (up->hasAttribute(forAttribute) || up->scope()) {
                nested = true;
                break;
            }
        }
        if (nested)
            continue;

        record.processed.emplace(marker.get(), marker);
        auto const expression = *marker->attribute(forAttribute);
        auto       loop       = parseLoopExpression(expression);
        if (!loop) {
            pb_warn("skipping collection binding: " + describeError(loop.error()), "BindingSyntax");
            continue;
        }

        auto const keyExpression = marker->attribute(keyAttribute).value_or(std::string{});
        auto       anchor        = UI::Element::createComment(forAttribute + ": " + expression);
        marker->after(anchor);
        marker->remove();
        marker->removeAttribute(forAttribute);
        marker->removeAttribute(keyAttribute);
        record.processed.emplace(anchor.get(), anchor);

        std::weak_ptr<State> weakState = state;
        auto                 reconciler = std::make_shared<ListReconciler>(ListReconciler::Config{
                .templateNode = marker,
                .anchor       = anchor,
                .state        = state,
                .sourcePath   = loop->sourcePath,
                .key          = ListReconciler::keyFromExpression(keyExpression, loop->varName),
                .varName      = loop->varName,
                .indexName    = loop->indexName,
                .options      = this->binderOptions,
                .bindNested =
                        [this, weakState](std::shared_ptr<UI::Element> const& item) {
                            auto owner = weakState.lock();
                            if (!owner)
                                return;
                            if (auto error = this->bind(item, owner))
                                pb_warn("nested collection not bound: " + describeError(*error), "BindingSyntax");
                        },
                .unbindNested = [this](std::shared_ptr<UI::Element> const& item) { this->unbind(*item); },
        });
        record.reconcilers.push_back(reconciler);
        reconciler->start();
    }
}

auto DataBinder::bindScalars(RootRecord& record, UI::Element& root, std::shared_ptr<State> const& state) -> void {
    auto const& bindAttribute = this->binderOptions.bindAttribute;

    for (auto const& element : root.querySelectorAll(bindAttribute)) {
        if (this->isProcessed(*element) || !root.contains(element.get()))
            continue;
        // Templates and rendered items are populated by their reconciler.
        if (element->closest(this->binderOptions.forAttribute) || has_item_scope(element))
            continue;

        record.processed.emplace(element.get(), element);
        auto const path = *element->attribute(bindAttribute);
        if (auto check = validate_binding_path(path); check.code != PathValidationError::Code::None) {
            pb_warn("skipping binding '" + path + "': " + describe_path_error(check), "BindingSyntax");
            continue;
        }

        if (element->isControl())
            record.bindings.push_back(this->bindTwoWay(element, state, path));
        else
            record.bindings.push_back(this->bindOneWay(element, state, path));
    }
}

auto DataBinder::bindTwoWay(std::shared_ptr<UI::Element> const& control, std::shared_ptr<State> const& state, std::string const& path)
        -> Binding {
    auto const rules      = control->attribute(this->binderOptions.ruleAttribute).value_or(std::string{});
    auto const errorsRoot = this->binderOptions.errorsRoot;
    auto const errorsPath = errorsRoot.empty() ? std::string{} : join_path(errorsRoot, path);
    bool const validating = !rules.empty() && !errorsPath.empty();

    if (auto current = state->lookup(path)) {
        Detail::writeControl(*control, *current);
        if (validating)
            write_error(*state, errorsPath, validate(*current, rules));
    }

    // Set while the control's own handler writes, so the subscription does
    // not echo the value back into the control.
    auto updating = std::make_shared<bool>(false);

    std::weak_ptr<State>       weakState   = state;
    std::weak_ptr<UI::Element> weakControl = control;

    auto const eventName  = Detail::controlEventName(*control);
    auto const listenerId = control->addEventListener(eventName, [weakState, path, rules, errorsPath, validating, updating](UI::Element& source) {
        auto owner = weakState.lock();
        if (!owner || owner->isDestroyed())
            return;
        *updating   = true;
        Value value = Detail::coerceControlValue(source, Detail::readControl(source));
        if (auto error = owner->set(path, value))
            pb_warn("control write to '" + path + "' failed: " + describeError(*error), "BindingSyntax");
        if (validating)
            write_error(*owner, errorsPath, validate(value, rules));
        *updating = false;
    });

    auto unsubscribe = state->subscribe(path, [weakState, weakControl, rules, errorsPath, validating, updating](Value const& value) {
        auto target = weakControl.lock();
        if (!target || *updating || Detail::controlShows(*target, value))
            return;
        Detail::writeControl(*target, value);
        if (!validating)
            return;
        if (auto owner = weakState.lock())
            write_error(*owner, errorsPath, validate(value, rules));
    });

    return Binding{.element = control,
                   .path    = path,
                   .mode    = BindingMode::TwoWay,
                   .cleanup = [weakControl, listenerId, unsubscribe] {
                       if (auto target = weakControl.lock())
                           target->removeEventListener(listenerId);
                       unsubscribe();
                   }};
}

auto DataBinder::bindOneWay(std::shared_ptr<UI::Element> const& element, std::shared_ptr<State> const& state, std::string const& path)
        -> Binding {
    if (auto current = state->lookup(path))
        element->setTextContent(current->toDisplayString());

    std::weak_ptr<UI::Element> weakElement = element;
    auto unsubscribe = state->subscribe(path, [weakElement](Value const& value) {
        if (auto target = weakElement.lock())
            target->setTextContent(value.toDisplayString());
    });
    return Binding{.element = element, .path = path, .mode = BindingMode::OneWay, .cleanup = std::move(unsubscribe)};
}

auto DataBinder::unbind(UI::Element const& root) -> void {
    auto it = this->roots.find(&root);
    if (it == this->roots.end())
        return;
    auto record = std::move(it->second);
    this->roots.erase(it);

    for (auto& binding : record->bindings)
        if (binding.cleanup)
            binding.cleanup();
    // Destroying a reconciler unbinds the items it rendered.
    for (auto& reconciler : record->reconcilers)
        reconciler->destroy();
    pb_log("unbound root bindings=" + std::to_string(record->bindings.size()), "Bind");
}

auto DataBinder::unbindAll() -> void {
    while (!this->roots.empty()) {
        auto const* root = this->roots.begin()->first;
        this->unbind(*root);
    }
}

auto DataBinder::isBound(UI::Element const& root) const -> bool {
    return this->roots.contains(&root);
}

auto DataBinder::bindingCount(UI::Element const& root) const -> std::size_t {
    auto it = this->roots.find(&root);
    return it == this->roots.end() ? 0 : it->second->bindings.size();
}

auto DataBinder::reconcilers(UI::Element const& root) const -> std::vector<std::shared_ptr<ListReconciler>> {
    auto it = this->roots.find(&root);
    return it == this->roots.end() ? std::vector<std::shared_ptr<ListReconciler>>{} : it->second->reconcilers;
}

auto defaultBinder() -> DataBinder& {
    static DataBinder binder;
    return binder;
}

auto bind(std::shared_ptr<UI::Element> const& root, std::shared_ptr<State> const& state) -> std::optional<Error> {
    return defaultBinder().bind(root, state);
}

auto unbind(UI::Element const& root) -> void {
    defaultBinder().unbind(root);
}

} // namespace PB::Bind
