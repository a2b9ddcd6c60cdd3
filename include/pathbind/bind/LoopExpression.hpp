#pragma once

#include <pathbind/core/Error.hpp>

#include <string>
#include <string_view>

namespace PB::Bind {

// Parsed collection marker: "item in items" or "(item, index) in items".
struct LoopExpression {
    std::string varName;
    std::string indexName; // empty when the marker names no index variable
    std::string sourcePath;
};

// Fails with Error::Code::MalformedInput for grammar errors and
// Error::Code::InvalidPath when the source is not a binding path.
[[nodiscard]] auto parseLoopExpression(std::string_view expression) -> Expected<LoopExpression>;

} // namespace PB::Bind
