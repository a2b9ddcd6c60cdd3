#pragma once

#include <pathbind/core/Value.hpp>
#include <pathbind/ui/Element.hpp>

#include <string>

// Control read/write helpers shared by the binder and the list reconciler.
namespace PB::Bind::Detail {

// "change" for checkboxes, radios and selects; "input" for free text.
[[nodiscard]] auto controlEventName(UI::Element const& control) -> std::string;

// Raw control value: checked state for checkboxes, the list of selected
// values for multi-selects, the text value otherwise.
[[nodiscard]] auto readControl(UI::Element& control) -> Value;

// Number inputs parse the leading number (unparsable text becomes 0) and
// checkboxes become booleans. Date inputs and everything else keep text.
[[nodiscard]] auto coerceControlValue(UI::Element const& control, Value raw) -> Value;

auto writeControl(UI::Element& control, Value const& value) -> void;

// True when the control already shows value, so writing it back would be
// redundant.
[[nodiscard]] auto controlShows(UI::Element& control, Value const& value) -> bool;

// Control-aware write: controls get their value set, other nodes their text.
auto writeNode(UI::Element& node, Value const& value) -> void;

} // namespace PB::Bind::Detail
