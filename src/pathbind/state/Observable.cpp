#include <pathbind/state/Observable.hpp>
#include <pathbind/state/State.hpp>
#include <pathbind/log/TaggedLogger.hpp>
#include <pathbind/path/StatePath.hpp>

#include <algorithm>
#include <iterator>

namespace PB {

namespace {

auto index_key(std::size_t index) -> std::string {
    return std::to_string(index);
}

} // namespace

Observable::Observable(std::weak_ptr<State>      owner,
                       Value                     node,
                       std::string               path,
                       std::vector<void const*>  lineage,
                       std::weak_ptr<Observable> parent,
                       std::string               key)
    : owner(std::move(owner)),
      node(std::move(node)),
      nodePath(std::move(path)),
      lineage(std::move(lineage)),
      parent(std::move(parent)),
      parentKey(std::move(key)) {}

auto Observable::path() const -> std::string {
    return this->currentPath().value_or(this->nodePath);
}

auto Observable::currentPath() const -> std::optional<std::string> {
    auto up = this->parent.lock();
    if (!up)
        return this->nodePath;
    auto base = up->currentPath();
    if (!base)
        return std::nullopt;

    auto const id = this->node.identity();
    if (up->node.isList()) {
        auto const& items = up->node.asList()->items;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (items[i].isNode() && items[i].identity() == id)
                return join_path(*base, index_key(i));
        }
        return std::nullopt;
    }
    auto const* field = up->node.asRecord()->find(this->parentKey);
    if (!field || !field->isNode() || field->identity() != id)
        return std::nullopt;
    return join_path(*base, this->parentKey);
}

auto Observable::get(std::string_view key) const -> Value {
    if (this->node.isRecord()) {
        if (auto const* field = this->node.asRecord()->find(key))
            return *field;
        return Value{};
    }
    if (auto index = parse_index_segment(key))
        return this->at(*index);
    return Value{};
}

auto Observable::has(std::string_view key) const -> bool {
    if (this->node.isRecord())
        return this->node.asRecord()->contains(key);
    auto index = parse_index_segment(key);
    return index && *index < this->node.asList()->items.size();
}

auto Observable::keys() const -> std::vector<std::string> {
    std::vector<std::string> result;
    if (this->node.isRecord()) {
        auto const& fields = this->node.asRecord()->fields;
        result.reserve(fields.size());
        for (auto const& [key, _] : fields)
            result.push_back(key);
        return result;
    }
    auto const count = this->node.asList()->items.size();
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        result.push_back(index_key(i));
    return result;
}

auto Observable::size() const -> std::size_t {
    if (this->node.isRecord())
        return this->node.asRecord()->fields.size();
    return this->node.asList()->items.size();
}

auto Observable::child(std::string_view key) -> std::shared_ptr<Observable> {
    if (this->node.isList()) {
        auto index = parse_index_segment(key);
        return index ? this->childAt(*index) : nullptr;
    }
    return this->wrapChild(this->get(key), std::string(key));
}

auto Observable::wrapChild(Value const& value, std::string key) -> std::shared_ptr<Observable> {
    if (!value.isNode())
        return nullptr;
    auto state = this->owner.lock();
    if (!state || state->isDestroyed())
        return nullptr;

    auto       childPath = join_path(this->path(), key);
    auto const id        = value.identity();
    if (std::find(this->lineage.begin(), this->lineage.end(), id) != this->lineage.end()) {
        state->reportCycle(childPath);
        return nullptr;
    }

    auto childLineage = this->lineage;
    childLineage.push_back(id);
    if (this->node.isList())
        key.clear();
    return state->wrap(value, std::move(childPath), std::move(childLineage), this->weak_from_this(), std::move(key));
}

auto Observable::set(std::string_view key, Value value) -> std::optional<Error> {
    if (this->node.isList()) {
        auto index = parse_index_segment(key);
        if (!index)
            return Error{Error::Code::InvalidPath, "list key '" + std::string(key) + "' is not an index"};
        return this->setAt(*index, std::move(value));
    }
    if (key.empty())
        return Error{Error::Code::InvalidPath, "empty key"};

    auto& record = *this->node.asRecord();
    if (auto const* current = record.find(key); current && *current == value)
        return std::nullopt;

    record.set(key, value);
    this->reportChange(key, std::move(value));
    return std::nullopt;
}

auto Observable::at(std::size_t index) const -> Value {
    if (!this->node.isList())
        return Value{};
    auto const& items = this->node.asList()->items;
    return index < items.size() ? items[index] : Value{};
}

auto Observable::childAt(std::size_t index) -> std::shared_ptr<Observable> {
    if (!this->node.isList())
        return nullptr;
    return this->wrapChild(this->at(index), index_key(index));
}

auto Observable::setAt(std::size_t index, Value value) -> std::optional<Error> {
    if (!this->node.isList())
        return Error{Error::Code::InvalidType, "setAt on a record at '" + this->path() + "'"};

    auto& items = this->node.asList()->items;
    if (index > items.size())
        return Error{Error::Code::InvalidPath,
                     "index " + index_key(index) + " is past the end of '" + this->path() + "' (size " + index_key(items.size()) + ")"};
    if (index < items.size()) {
        if (items[index] == value)
            return std::nullopt;
        items[index] = value;
    } else {
        items.push_back(value);
    }
    this->reportChange(index_key(index), std::move(value));
    return std::nullopt;
}

auto Observable::sequence(char const* operation) -> Expected<ListPtr> {
    if (!this->node.isList())
        return std::unexpected(Error{Error::Code::InvalidType,
                                     std::string(operation) + " requires a list at '" + this->path() + "'"});
    return this->node.asList();
}

auto Observable::push(Value value) -> Expected<std::size_t> {
    auto list = this->sequence("push");
    if (!list)
        return std::unexpected(list.error());
    (*list)->items.push_back(std::move(value));
    this->reportSequenceChange();
    return (*list)->items.size();
}

auto Observable::pop() -> Expected<Value> {
    auto list = this->sequence("pop");
    if (!list)
        return std::unexpected(list.error());
    auto& items = (*list)->items;
    Value removed;
    if (!items.empty()) {
        removed = std::move(items.back());
        items.pop_back();
    }
    this->reportSequenceChange();
    return removed;
}

auto Observable::shift() -> Expected<Value> {
    auto list = this->sequence("shift");
    if (!list)
        return std::unexpected(list.error());
    auto& items = (*list)->items;
    Value removed;
    if (!items.empty()) {
        removed = std::move(items.front());
        items.erase(items.begin());
    }
    this->reportSequenceChange();
    return removed;
}

auto Observable::unshift(Value value) -> Expected<std::size_t> {
    auto list = this->sequence("unshift");
    if (!list)
        return std::unexpected(list.error());
    auto& items = (*list)->items;
    items.insert(items.begin(), std::move(value));
    this->reportSequenceChange();
    return items.size();
}

auto Observable::insert(std::size_t index, Value value) -> Expected<void> {
    auto list = this->sequence("insert");
    if (!list)
        return std::unexpected(list.error());
    auto& items = (*list)->items;
    index       = std::min(index, items.size());
    items.insert(items.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
    this->reportSequenceChange();
    return {};
}

auto Observable::splice(std::size_t start, std::size_t deleteCount, std::vector<Value> inserted)
        -> Expected<std::vector<Value>> {
    auto list = this->sequence("splice");
    if (!list)
        return std::unexpected(list.error());
    auto& items = (*list)->items;
    start       = std::min(start, items.size());
    deleteCount = std::min(deleteCount, items.size() - start);

    auto first = items.begin() + static_cast<std::ptrdiff_t>(start);
    auto last  = first + static_cast<std::ptrdiff_t>(deleteCount);
    std::vector<Value> removed(std::make_move_iterator(first), std::make_move_iterator(last));
    first = items.erase(first, last);
    items.insert(first, std::make_move_iterator(inserted.begin()), std::make_move_iterator(inserted.end()));

    this->reportSequenceChange();
    return removed;
}

auto Observable::sort(Comparator comparator) -> Expected<void> {
    auto list = this->sequence("sort");
    if (!list)
        return std::unexpected(list.error());
    auto& items = (*list)->items;
    if (comparator) {
        std::stable_sort(items.begin(), items.end(), comparator);
    } else {
        std::stable_sort(items.begin(), items.end(), [](Value const& lhs, Value const& rhs) {
            return lhs.toDisplayString() < rhs.toDisplayString();
        });
    }
    this->reportSequenceChange();
    return {};
}

auto Observable::reverse() -> Expected<void> {
    auto list = this->sequence("reverse");
    if (!list)
        return std::unexpected(list.error());
    std::reverse((*list)->items.begin(), (*list)->items.end());
    this->reportSequenceChange();
    return {};
}

auto Observable::reportChange(std::string_view key, Value value) -> void {
    auto state = this->owner.lock();
    if (!state)
        return;
    auto base = this->currentPath();
    if (!base) {
        pb_log("write below detached node '" + this->nodePath + "' not reported", "State");
        return;
    }
    state->queueChange(key.empty() ? *base : join_path(*base, key), std::move(value));
}

auto Observable::reportSequenceChange() -> void {
    this->reportChange({}, this->node);
}

} // namespace PB
