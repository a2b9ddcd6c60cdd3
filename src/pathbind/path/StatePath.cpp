#include <pathbind/path/StatePath.hpp>

#include <charconv>

namespace PB {

auto describe_path_error(PathValidationError const& error) -> std::string {
    switch (error.code) {
    case PathValidationError::Code::None:
        return "valid";
    case PathValidationError::Code::EmptyPath:
        return "path is empty";
    case PathValidationError::Code::EmptySegment:
        return "empty segment at " + std::to_string(error.position);
    case PathValidationError::Code::LeadingDot:
        return "path starts with '.'";
    case PathValidationError::Code::TrailingDot:
        return "path ends with '.'";
    case PathValidationError::Code::InvalidSegmentStart:
        return "segment must start with a letter, '_' or '$' at " + std::to_string(error.position);
    case PathValidationError::Code::InvalidCharacter:
        return "invalid character at " + std::to_string(error.position);
    }
    return "unknown path error";
}

auto split_path(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> out;
    if (path.empty())
        return out;
    std::size_t start = 0;
    while (true) {
        auto end = path.find('.', start);
        if (end == std::string_view::npos) {
            out.push_back(path.substr(start));
            break;
        }
        out.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

auto join_path(std::string_view prefix, std::string_view key) -> std::string {
    if (prefix.empty())
        return std::string(key);
    std::string out;
    out.reserve(prefix.size() + 1 + key.size());
    out.append(prefix);
    out.push_back('.');
    out.append(key);
    return out;
}

auto parent_path(std::string_view path) -> std::optional<std::string_view> {
    auto dot = path.rfind('.');
    if (dot == std::string_view::npos)
        return std::nullopt;
    return path.substr(0, dot);
}

auto ancestor_paths(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> out;
    auto                     current = parent_path(path);
    while (current) {
        out.emplace_back(*current);
        current = parent_path(*current);
    }
    return out;
}

auto strip_path_prefix(std::string_view path, std::string_view head) -> std::optional<std::string_view> {
    if (path == head)
        return std::string_view{};
    if (path.size() > head.size() && path.starts_with(head) && path[head.size()] == '.')
        return path.substr(head.size() + 1);
    return std::nullopt;
}

auto parse_index_segment(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty())
        return std::nullopt;
    std::size_t index = 0;
    auto [ptr, ec]    = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (ec != std::errc{} || ptr != segment.data() + segment.size())
        return std::nullopt;
    return index;
}

auto resolve_path(Value const& root, std::string_view path) -> std::optional<Value> {
    Value current = root;
    for (auto segment : split_path(path)) {
        if (current.isRecord()) {
            auto const* field = current.asRecord()->find(segment);
            if (!field)
                return std::nullopt;
            current = *field;
        } else if (current.isList()) {
            auto const& items = current.asList()->items;
            auto        index = parse_index_segment(segment);
            if (!index || *index >= items.size())
                return std::nullopt;
            current = items[*index];
        } else {
            return std::nullopt;
        }
    }
    return current;
}

} // namespace PB
