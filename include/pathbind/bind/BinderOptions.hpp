#pragma once

#include <string>

namespace PB::Bind {

// Marker attribute names and the root of the validation error mirror.
struct BinderOptions {
    std::string bindAttribute = "data-bind";
    std::string forAttribute  = "data-for";
    std::string keyAttribute  = "data-key";
    std::string ruleAttribute = "data-rule";
    std::string errorsRoot    = "errors";
};

} // namespace PB::Bind
