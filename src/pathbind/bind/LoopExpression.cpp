#include <pathbind/bind/LoopExpression.hpp>
#include <pathbind/path/StatePath.hpp>

namespace PB::Bind {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && is_space(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && is_space(text.back()))
        text.remove_suffix(1);
    return text;
}

// Position of the standalone word "in", or npos.
auto find_in_keyword(std::string_view text) -> std::size_t {
    for (std::size_t pos = text.find("in"); pos != std::string_view::npos; pos = text.find("in", pos + 1)) {
        bool const spaceBefore = pos > 0 && is_space(text[pos - 1]);
        bool const spaceAfter  = pos + 2 < text.size() && is_space(text[pos + 2]);
        if (spaceBefore && spaceAfter)
            return pos;
    }
    return std::string_view::npos;
}

auto malformed(std::string_view expression, std::string_view reason) -> Error {
    return Error{Error::Code::MalformedInput, "loop expression '" + std::string(expression) + "': " + std::string(reason)};
}

} // namespace

auto parseLoopExpression(std::string_view expression) -> Expected<LoopExpression> {
    auto const text = trim(expression);
    auto const pos  = find_in_keyword(text);
    if (pos == std::string_view::npos)
        return std::unexpected(malformed(expression, "expected '<item> in <path>'"));

    auto head   = trim(text.substr(0, pos));
    auto source = trim(text.substr(pos + 2));

    LoopExpression loop;
    if (!head.empty() && head.front() == '(') {
        if (head.back() != ')')
            return std::unexpected(malformed(expression, "unbalanced parenthesis"));
        head             = head.substr(1, head.size() - 2);
        auto const comma = head.find(',');
        if (comma == std::string_view::npos)
            return std::unexpected(malformed(expression, "expected '(item, index)'"));
        loop.varName   = std::string(trim(head.substr(0, comma)));
        loop.indexName = std::string(trim(head.substr(comma + 1)));
        if (!is_identifier(loop.indexName))
            return std::unexpected(malformed(expression, "index variable is not an identifier"));
    } else {
        loop.varName = std::string(head);
    }

    if (!is_identifier(loop.varName))
        return std::unexpected(malformed(expression, "loop variable is not an identifier"));
    if (loop.varName == loop.indexName)
        return std::unexpected(malformed(expression, "loop and index variables share a name"));

    if (auto check = validate_binding_path(source); check.code != PathValidationError::Code::None)
        return std::unexpected(Error{Error::Code::InvalidPath,
                                     "loop source '" + std::string(source) + "': " + describe_path_error(check)});
    loop.sourcePath = std::string(source);
    return loop;
}

} // namespace PB::Bind
