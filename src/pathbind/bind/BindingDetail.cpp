#include "BindingDetail.hpp"

#include <cmath>

namespace PB::Bind::Detail {

namespace {

auto is_multi_select(UI::Element const& control) -> bool {
    return control.tag() == "select" && control.isMultiple();
}

auto radio_matches(UI::Element const& control, Value const& value) -> bool {
    return !value.isNull() && !value.isNode() && value.toDisplayString() == control.value();
}

} // namespace

auto controlEventName(UI::Element const& control) -> std::string {
    if (control.tag() == "select")
        return "change";
    auto const type = control.inputType();
    if (type == "checkbox" || type == "radio")
        return "change";
    return "input";
}

auto readControl(UI::Element& control) -> Value {
    auto const type = control.inputType();
    if (type == "checkbox")
        return Value{control.checked()};
    if (is_multi_select(control)) {
        std::vector<Value> selected;
        for (auto& text : control.selectedValues())
            selected.emplace_back(std::move(text));
        return Value::list(std::move(selected));
    }
    return Value{control.value()};
}

auto coerceControlValue(UI::Element const& control, Value raw) -> Value {
    auto const type = control.inputType();
    if (type == "number") {
        double const parsed = raw.isNumber() ? raw.asNumber() : parseLeadingNumber(raw.toDisplayString());
        return Value{std::isnan(parsed) ? 0.0 : parsed};
    }
    if (type == "checkbox")
        return Value{raw.isTruthy()};
    return raw;
}

auto writeControl(UI::Element& control, Value const& value) -> void {
    auto const type = control.inputType();
    if (type == "checkbox") {
        control.setChecked(value.isTruthy());
        return;
    }
    if (type == "radio") {
        control.setChecked(radio_matches(control, value));
        return;
    }
    if (is_multi_select(control)) {
        std::vector<std::string> wanted;
        if (value.isList())
            for (auto const& item : value.asList()->items)
                wanted.push_back(item.toDisplayString());
        control.setSelectedValues(wanted);
        return;
    }
    control.setValue(value.toDisplayString());
}

auto controlShows(UI::Element& control, Value const& value) -> bool {
    if (control.inputType() == "radio")
        return control.checked() == radio_matches(control, value);
    return deepEquals(coerceControlValue(control, readControl(control)), value);
}

auto writeNode(UI::Element& node, Value const& value) -> void {
    if (node.isControl())
        writeControl(node, value);
    else
        node.setTextContent(value.toDisplayString());
}

} // namespace PB::Bind::Detail
