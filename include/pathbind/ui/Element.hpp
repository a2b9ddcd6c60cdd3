#pragma once

#include <pathbind/core/Value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace PB::UI {

enum class NodeKind {
    Element,
    Text,
    Comment,
};

// Data bound to a node rendered for one collection item.
struct ItemScope {
    Value       item;
    std::string varName;
    std::size_t index = 0;
    std::string indexName;
    // Source path of the outermost collection this item belongs to.
    std::string rootSourcePath;
};

/**
 * Element: a minimal retained node tree standing in for the host document.
 *
 * Purpose:
 * - Give the binder and reconciler the primitive operations they need:
 *   attribute access, text content, sibling navigation, insertion after a
 *   node, removal, deep cloning, and named event listeners.
 * - Model form-control state (value, checked, option selection) separately
 *   from attributes, the way an interactive document does.
 *
 * Notes:
 * - Parents own their children; a child only keeps a weak link upwards.
 * - cloneDeep() copies structure, attributes and control state, never
 *   listeners or item scopes.
 * - Single-threaded.
 */
class Element : public std::enable_shared_from_this<Element> {
public:
    using Handler    = std::function<void(Element&)>;
    using ListenerId = std::uint64_t;
    using Visitor    = std::function<void(Element&)>;

    Element(NodeKind kind, std::string tagOrData);

    Element(Element const&)            = delete;
    Element& operator=(Element const&) = delete;

    static auto create(std::string tag) -> std::shared_ptr<Element>;
    static auto createText(std::string text) -> std::shared_ptr<Element>;
    static auto createComment(std::string text) -> std::shared_ptr<Element>;

    [[nodiscard]] auto kind() const -> NodeKind { return nodeKind; }
    [[nodiscard]] auto isElement() const -> bool { return nodeKind == NodeKind::Element; }
    [[nodiscard]] auto tag() const -> std::string const& { return tagName; }

    // Attributes
    [[nodiscard]] auto attribute(std::string_view name) const -> std::optional<std::string>;
    [[nodiscard]] auto hasAttribute(std::string_view name) const -> bool;
    auto               setAttribute(std::string_view name, std::string value) -> void;
    auto               removeAttribute(std::string_view name) -> bool;
    [[nodiscard]] auto attributes() const -> std::vector<std::pair<std::string, std::string>> const& { return attributeList; }

    // Text of all descendant text nodes for elements, the node data otherwise.
    [[nodiscard]] auto textContent() const -> std::string;
    // Replaces every child of an element with a single text node.
    auto setTextContent(std::string text) -> void;

    // Control state
    [[nodiscard]] auto isControl() const -> bool;
    // Lower-cased "type" attribute of an input; "text" when absent.
    [[nodiscard]] auto inputType() const -> std::string;
    [[nodiscard]] auto isMultiple() const -> bool { return hasAttribute("multiple"); }
    [[nodiscard]] auto value() const -> std::string;
    auto               setValue(std::string value) -> void;
    [[nodiscard]] auto checked() const -> bool;
    auto               setChecked(bool checked) -> void;
    [[nodiscard]] auto selected() const -> bool { return optionSelected; }
    auto               setSelected(bool selected) -> void { optionSelected = selected; }
    [[nodiscard]] auto options() -> std::vector<std::shared_ptr<Element>>;
    [[nodiscard]] auto selectedValues() -> std::vector<std::string>;
    auto               setSelectedValues(std::vector<std::string> const& values) -> void;

    // Tree
    [[nodiscard]] auto parent() const -> std::shared_ptr<Element> { return parentNode.lock(); }
    [[nodiscard]] auto children() const -> std::vector<std::shared_ptr<Element>> const& { return childNodes; }
    [[nodiscard]] auto previousSibling() const -> std::shared_ptr<Element>;
    [[nodiscard]] auto nextSibling() const -> std::shared_ptr<Element>;
    [[nodiscard]] auto hasElementChildren() const -> bool;
    [[nodiscard]] auto contains(Element const* node) const -> bool;

    auto appendChild(std::shared_ptr<Element> child) -> std::shared_ptr<Element>;
    // Moves node so it immediately follows this one; no-op without a parent.
    auto after(std::shared_ptr<Element> node) -> void;
    auto remove() -> void;
    [[nodiscard]] auto cloneDeep() const -> std::shared_ptr<Element>;

    // Events
    auto               addEventListener(std::string name, Handler handler) -> ListenerId;
    auto               removeEventListener(ListenerId id) -> bool;
    // Invokes the listeners registered for name; returns how many ran.
    auto               dispatchEvent(std::string_view name) -> std::size_t;
    [[nodiscard]] auto listenerCount(std::string_view name) const -> std::size_t;
    [[nodiscard]] auto listenerCount() const -> std::size_t { return listeners.size(); }

    // Queries; element nodes only, pre-order
    auto               forEachDescendant(Visitor const& visitor) -> void;
    [[nodiscard]] auto querySelectorAll(std::string_view attributeName) -> std::vector<std::shared_ptr<Element>>;
    [[nodiscard]] auto closest(std::string_view attributeName) -> std::shared_ptr<Element>;

    // Item scope
    [[nodiscard]] auto scope() const -> ItemScope const* { return itemScope ? &*itemScope : nullptr; }
    auto               setScope(ItemScope scope) -> void { itemScope = std::move(scope); }
    auto               clearScope() -> void { itemScope.reset(); }

private:
    struct Listener {
        ListenerId  id;
        std::string name;
        Handler     handler;
    };

    auto indexInParent() const -> std::optional<std::size_t>;
    auto collectOptions(std::vector<std::shared_ptr<Element>>& out) -> void;

    NodeKind                                         nodeKind;
    std::string                                      tagName;
    std::string                                      data;
    std::vector<std::pair<std::string, std::string>> attributeList;
    std::weak_ptr<Element>                           parentNode;
    std::vector<std::shared_ptr<Element>>            childNodes;
    std::optional<std::string>                       controlValue;
    std::optional<bool>                              checkedState;
    bool                                             optionSelected = false;
    std::vector<Listener>                            listeners;
    ListenerId                                       nextListenerId = 1;
    std::optional<ItemScope>                         itemScope;
};

} // namespace PB::UI
