#include <pathbind/bind/ListReconciler.hpp>
#include <pathbind/log/TaggedLogger.hpp>
#include <pathbind/path/StatePath.hpp>

#include "BindingDetail.hpp"

namespace PB::Bind {

namespace {

auto index_key(Value const&, std::size_t index) -> std::string {
    return std::to_string(index);
}

// Content of a record or list item. Strict equality only sees identity, so
// a field written in place shows up here and nowhere else.
auto content_snapshot(Value const& item) -> std::string {
    return item.isNode() ? item.toJson().dump() : std::string{};
}

// True when node sits in a nested item or an unprocessed nested template
// below owner, so owner's populate pass must leave it alone.
auto belongs_to_nested(UI::Element const& node, UI::Element const& owner, std::string const& forAttribute) -> bool {
    for (auto current = node.shared_from_this(); current && current.get() != &owner; current = current->parent()) {
        if (current->scope() || current->hasAttribute(forAttribute))
            return true;
    }
    return false;
}

} // namespace

ListReconciler::ListReconciler(Config config)
    : config(std::move(config)) {
    this->state = this->config.state;
    this->config.state.reset();
    if (!this->config.key)
        this->config.key = index_key;
}

ListReconciler::~ListReconciler() {
    if (this->unsubscribe)
        this->unsubscribe();
}

auto ListReconciler::keyFromExpression(std::string_view expression, std::string const& varName) -> KeyFunction {
    if (expression.empty())
        return index_key;
    if (expression == varName)
        return [](Value const& item, std::size_t) { return item.toDisplayString(); };

    auto const sub = std::string(strip_path_prefix(expression, varName).value_or(expression));
    return [sub](Value const& item, std::size_t index) {
        if (auto value = resolve_path(item, sub))
            return value->toDisplayString();
        return std::to_string(index);
    };
}

auto ListReconciler::outermostScope() const -> UI::ItemScope const* {
    UI::ItemScope const* outermost = nullptr;
    for (auto node = this->config.anchor->parent(); node; node = node->parent())
        if (auto const* scope = node->scope())
            outermost = scope;
    return outermost;
}

auto ListReconciler::start() -> void {
    if (this->destroyed)
        return;
    auto owner = this->state.lock();
    if (!owner)
        return;

    auto const* outer    = this->outermostScope();
    this->rootSourcePath = outer ? outer->rootSourcePath : this->config.sourcePath;
    this->watchedPath    = this->rootSourcePath;

    std::weak_ptr<ListReconciler> weak = this->weak_from_this();
    this->unsubscribe                  = owner->subscribe(this->watchedPath, [weak](Value const&) {
        if (auto self = weak.lock())
            self->render();
    });
    this->render();
}

auto ListReconciler::resolveSource() const -> std::optional<Value> {
    for (auto node = this->config.anchor->parent(); node; node = node->parent()) {
        auto const* scope = node->scope();
        if (!scope)
            continue;
        auto relative = strip_path_prefix(this->config.sourcePath, scope->varName).value_or(this->config.sourcePath);
        if (auto value = resolve_path(scope->item, relative); value && value->isList())
            return value;
    }
    auto owner = this->state.lock();
    if (!owner)
        return std::nullopt;
    return owner->lookup(this->config.sourcePath);
}

auto ListReconciler::render() -> void {
    if (this->destroyed)
        return;

    auto source = this->resolveSource();
    if (!source || !source->isList()) {
        pb_warn("collection source '" + this->config.sourcePath + "' is not a list", "BindingSyntax");
        this->clear();
        return;
    }

    // Copy; unbindNested hooks may mutate the source list.
    auto const items = source->asList()->items;

    std::vector<std::string>                       keys;
    std::vector<std::size_t>                       positions;
    phmap::flat_hash_map<std::string, std::size_t> next;
    keys.reserve(items.size());
    positions.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto key = this->config.key(items[i], i);
        if (!next.emplace(key, i).second) {
            pb_warn("duplicate key '" + key + "' in '" + this->config.sourcePath + "'; item " + std::to_string(i) + " skipped",
                    "BindingSyntax");
            continue;
        }
        keys.push_back(std::move(key));
        positions.push_back(i);
    }

    for (auto it = this->entries.begin(); it != this->entries.end();) {
        if (next.contains(it->first)) {
            ++it;
            continue;
        }
        auto node = it->second.node;
        node->remove();
        if (this->config.unbindNested)
            this->config.unbindNested(node);
        ++this->counters.removed;
        this->entries.erase(it++);
    }

    if (!this->config.anchor->parent()) {
        pb_warn("anchor for '" + this->config.sourcePath + "' is detached", "BindingSyntax");
        return;
    }

    auto cursor = this->config.anchor;
    for (std::size_t n = 0; n < keys.size(); ++n) {
        auto const& key   = keys[n];
        auto const  index = positions[n];
        auto const& item  = items[index];

        std::shared_ptr<UI::Element> node;
        auto                         snapshot = content_snapshot(item);
        if (auto it = this->entries.find(key); it != this->entries.end()) {
            auto& entry = it->second;
            node        = entry.node;
            if (!(entry.item == item) || entry.index != index || entry.snapshot != snapshot) {
                node->setScope(this->makeScope(item, index));
                this->populate(*node, item, index);
                entry.item     = item;
                entry.index    = index;
                entry.snapshot = std::move(snapshot);
                ++this->counters.updated;
            }
            if (node->previousSibling() != cursor) {
                cursor->after(node);
                ++this->counters.moved;
            }
        } else {
            node = this->createNode(item, index);
            cursor->after(node);
            this->entries.emplace(key, Entry{.node = node, .item = item, .index = index, .snapshot = std::move(snapshot)});
            ++this->counters.created;
            this->scheduleNestedBind(node);
        }
        cursor = node;
    }

    this->order = std::move(keys);
    pb_log("rendered '" + this->config.sourcePath + "' items=" + std::to_string(this->order.size()), "Reconcile");
}

auto ListReconciler::makeScope(Value const& item, std::size_t index) const -> UI::ItemScope {
    return UI::ItemScope{.item           = item,
                         .varName        = this->config.varName,
                         .index          = index,
                         .indexName      = this->config.indexName,
                         .rootSourcePath = this->rootSourcePath.empty() ? this->config.sourcePath : this->rootSourcePath};
}

auto ListReconciler::createNode(Value const& item, std::size_t index) -> std::shared_ptr<UI::Element> {
    auto node = this->config.templateNode->cloneDeep();
    this->populate(*node, item, index);
    node->setScope(this->makeScope(item, index));
    return node;
}

auto ListReconciler::scheduleNestedBind(std::shared_ptr<UI::Element> const& node) -> void {
    if (!this->config.bindNested || node->querySelectorAll(this->config.options.forAttribute).empty())
        return;
    auto owner = this->state.lock();
    if (!owner)
        return;

    std::weak_ptr<ListReconciler> weakSelf = this->weak_from_this();
    std::weak_ptr<UI::Element>    weakNode = node;
    auto refused = owner->executor().post([weakSelf, weakNode] {
        auto self = weakSelf.lock();
        auto item = weakNode.lock();
        if (!self || !item || self->destroyed || !item->parent())
            return;
        self->config.bindNested(item);
    });
    if (refused)
        pb_warn("nested collections of '" + this->config.sourcePath + "' not bound: " + describeError(*refused), "BindingSyntax");
}

auto ListReconciler::populate(UI::Element& node, Value const& item, std::size_t index) -> void {
    auto const& bindAttribute = this->config.options.bindAttribute;
    auto const& forAttribute  = this->config.options.forAttribute;

    for (auto const& bound : node.querySelectorAll(bindAttribute)) {
        if (belongs_to_nested(*bound, node, forAttribute))
            continue;
        if (auto value = this->resolveBinding(*bound->attribute(bindAttribute), item, index))
            Detail::writeNode(*bound, *value);
    }

    auto selfPath = node.attribute(bindAttribute);
    if (!selfPath || node.hasElementChildren())
        return;
    if (auto value = this->resolveBinding(*selfPath, item, index))
        Detail::writeNode(node, *value);
}

auto ListReconciler::resolveBinding(std::string_view path, Value const& item, std::size_t index) const -> std::optional<Value> {
    if (path == this->config.varName)
        return item;
    if (!this->config.indexName.empty() && path == this->config.indexName)
        return Value{index};
    if (auto sub = strip_path_prefix(path, this->config.varName))
        return resolve_path(item, *sub);

    if (item.isNode()) {
        if (auto value = resolve_path(item, path))
            return value;
    }

    // Variables of enclosing collections.
    for (auto node = this->config.anchor->parent(); node; node = node->parent()) {
        auto const* scope = node->scope();
        if (!scope)
            continue;
        if (path == scope->varName)
            return scope->item;
        if (!scope->indexName.empty() && path == scope->indexName)
            return Value{scope->index};
        if (auto sub = strip_path_prefix(path, scope->varName))
            return resolve_path(scope->item, *sub);
    }

    auto owner = this->state.lock();
    if (!owner)
        return std::nullopt;
    return owner->lookup(path);
}

auto ListReconciler::renderedNode(std::string const& key) const -> std::shared_ptr<UI::Element> {
    auto it = this->entries.find(key);
    return it == this->entries.end() ? nullptr : it->second.node;
}

auto ListReconciler::clear() -> void {
    auto removed = std::move(this->entries);
    this->entries.clear();
    this->order.clear();
    for (auto& [key, entry] : removed) {
        entry.node->remove();
        if (this->config.unbindNested)
            this->config.unbindNested(entry.node);
        ++this->counters.removed;
    }
}

auto ListReconciler::destroy() -> void {
    if (this->destroyed)
        return;
    this->destroyed = true;
    if (this->unsubscribe) {
        auto release = std::move(this->unsubscribe);
        this->unsubscribe = nullptr;
        release();
    }
    this->clear();
}

} // namespace PB::Bind
