// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file field_path.h
/// @brief Dotted field paths with array-filter placeholders.
///
/// A FieldPath is the address of a patch entry: a sequence of field names
/// (external names or map keys) and filter placeholders. It renders as
/// "items.$[elem0].name". The logical form drops placeholders
/// ("items.name") and is what ignore entries are matched against.
///
/// Scans that report a concrete element use ElementIndex segments instead,
/// rendered "items.3.name". The logical form drops those too.

#pragma once

#include <diffit/api.h>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

namespace diffit {

/// Array-filter placeholder, rendered "$[elemN]" in paths and "elemN" in filters
struct FilterPlaceholder {
    std::size_t id = 0;

    bool operator==(const FilterPlaceholder& other) const noexcept { return id == other.id; }
};

[[nodiscard]] DIFFIT_API std::string placeholder_name(std::size_t id);

/// Position of a concrete sequence element, rendered as the bare number
struct ElementIndex {
    std::size_t index = 0;

    bool operator==(const ElementIndex& other) const noexcept { return index == other.index; }
};

using PathSegment = std::variant<std::string, FilterPlaceholder, ElementIndex>;

class DIFFIT_API FieldPath {
public:
    FieldPath() = default;
    FieldPath(std::initializer_list<std::string> fields);

    void push_back(std::string field) { segments_.emplace_back(std::move(field)); }
    void push_back(FilterPlaceholder placeholder) { segments_.emplace_back(placeholder); }
    void push_back(ElementIndex element) { segments_.emplace_back(element); }
    void pop_back() { segments_.pop_back(); }

    [[nodiscard]] FieldPath child(std::string field) const {
        FieldPath result = *this;
        result.push_back(std::move(field));
        return result;
    }

    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] const std::vector<PathSegment>& segments() const noexcept { return segments_; }
    [[nodiscard]] const PathSegment& back() const { return segments_.back(); }

    /// "a.$[elem0].b"
    [[nodiscard]] std::string to_string() const;

    /// Rendered path without placeholder or index segments: "a.b"
    [[nodiscard]] std::string logical_string() const;

    [[nodiscard]] bool starts_with(const FieldPath& prefix) const;

    /// Parse a rendered path. Segments of the form "$[elemN]" become placeholders.
    /// @throws std::runtime_error on an empty segment or a malformed placeholder
    [[nodiscard]] static FieldPath parse(std::string_view text);

    bool operator==(const FieldPath& other) const { return segments_ == other.segments_; }

private:
    std::vector<PathSegment> segments_;
};

/// True when `path` equals `prefix` or lies under it ("a.b.c" is under "a.b", "a.bc" is not).
/// The empty prefix contains every path.
[[nodiscard]] DIFFIT_API bool path_is_under(std::string_view path, std::string_view prefix) noexcept;

/// Set of ignored logical paths. A path is ignored when it matches an entry
/// or is nested under one.
class DIFFIT_API IgnoreSet {
public:
    IgnoreSet() = default;
    explicit IgnoreSet(const std::vector<std::string>& entries);

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] bool matches(std::string_view logical_path) const;
    [[nodiscard]] bool matches(const FieldPath& path) const { return matches(path.logical_string()); }

private:
    std::unordered_set<std::string> entries_;
};

} // namespace diffit
