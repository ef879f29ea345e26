// field_path.cpp - FieldPath rendering, parsing and ignore matching

#include <diffit/field_path.h>

#include <charconv>
#include <stdexcept>

namespace diffit {

namespace {

constexpr std::string_view placeholder_prefix = "$[elem";

void append_segment(std::string& out, std::string_view segment)
{
    if (!out.empty()) {
        out += '.';
    }
    out += segment;
}

} // anonymous namespace

std::string placeholder_name(std::size_t id)
{
    return "elem" + std::to_string(id);
}

FieldPath::FieldPath(std::initializer_list<std::string> fields)
{
    segments_.reserve(fields.size());
    for (const auto& field : fields) {
        segments_.emplace_back(field);
    }
}

std::string FieldPath::to_string() const
{
    std::string result;
    for (const auto& segment : segments_) {
        if (auto* field = std::get_if<std::string>(&segment)) {
            append_segment(result, *field);
        } else if (auto* placeholder = std::get_if<FilterPlaceholder>(&segment)) {
            append_segment(result, "$[" + placeholder_name(placeholder->id) + "]");
        } else {
            append_segment(result, std::to_string(std::get<ElementIndex>(segment).index));
        }
    }
    return result;
}

std::string FieldPath::logical_string() const
{
    std::string result;
    for (const auto& segment : segments_) {
        if (auto* field = std::get_if<std::string>(&segment)) {
            append_segment(result, *field);
        }
    }
    return result;
}

bool FieldPath::starts_with(const FieldPath& prefix) const
{
    if (prefix.segments_.size() > segments_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.segments_.size(); ++i) {
        if (!(segments_[i] == prefix.segments_[i])) {
            return false;
        }
    }
    return true;
}

FieldPath FieldPath::parse(std::string_view text)
{
    FieldPath result;
    if (text.empty()) {
        return result;
    }

    std::size_t start = 0;
    while (start <= text.size()) {
        auto dot = text.find('.', start);
        if (dot == std::string_view::npos) {
            dot = text.size();
        }
        auto segment = text.substr(start, dot - start);
        if (segment.empty()) {
            throw std::runtime_error("empty segment in field path '" + std::string{text} + "'");
        }

        if (segment.starts_with("$[")) {
            if (!segment.starts_with(placeholder_prefix) || !segment.ends_with("]")) {
                throw std::runtime_error("malformed placeholder '" + std::string{segment} + "'");
            }
            auto digits = segment.substr(placeholder_prefix.size(),
                                         segment.size() - placeholder_prefix.size() - 1);
            std::size_t id = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
            if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
                throw std::runtime_error("malformed placeholder '" + std::string{segment} + "'");
            }
            result.push_back(FilterPlaceholder{id});
        } else {
            result.push_back(std::string{segment});
        }
        start = dot + 1;
    }
    return result;
}

bool path_is_under(std::string_view path, std::string_view prefix) noexcept
{
    if (prefix.empty()) {
        return true;
    }
    if (!path.starts_with(prefix)) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '.';
}

// ============================================================
// IgnoreSet
// ============================================================

IgnoreSet::IgnoreSet(const std::vector<std::string>& entries)
    : entries_(entries.begin(), entries.end())
{
}

bool IgnoreSet::matches(std::string_view logical_path) const
{
    if (entries_.empty()) {
        return false;
    }
    // Check every dotted prefix of the path, shortest first
    std::size_t pos = 0;
    while (true) {
        auto dot = logical_path.find('.', pos);
        auto prefix = logical_path.substr(0, dot);
        if (entries_.count(std::string{prefix}) > 0) {
            return true;
        }
        if (dot == std::string_view::npos) {
            return false;
        }
        pos = dot + 1;
    }
}

} // namespace diffit
