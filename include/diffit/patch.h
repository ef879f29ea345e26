// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief Update patch: operations by operator, array filters and change metadata.
///
/// A Patch is what diff() produces. Paths are rendered field paths, so one
/// patch maps directly onto a document-database update:
///
/// @code
///   {
///     "$set":   { "name": "Ann", "items.$[elem0].qty": 3 },
///     "$unset": { "nickname": true },
///     "$push":  { "tags": { "$each": ["new"] } }
///   }
///   arrayFilters: [ { "elem0._index": 1 } ]
/// @endcode
///
/// A path appears under at most one operator. Adding an entry for a path that
/// another operator already holds moves the path to the new operator.

#pragma once

#include <diffit/api.h>
#include <diffit/field_path.h>
#include <diffit/value.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace diffit {

enum class Operator : std::uint8_t {
    set,
    unset,
    push,
    inc
};

/// "$set", "$unset", "$push", "$inc"
[[nodiscard]] DIFFIT_API std::string_view operator_name(Operator op) noexcept;

// ============================================================
// ArrayFilter
// ============================================================

/// Match condition bound to a placeholder
struct DIFFIT_API ArrayFilter {
    enum class Kind : std::uint8_t { position, identity };

    std::size_t placeholder = 0;
    Kind kind = Kind::position;
    std::size_t index = 0;   ///< position filters
    std::string field;       ///< identity filters
    Value value;             ///< identity filters

    [[nodiscard]] static ArrayFilter at_position(std::size_t placeholder, std::size_t index);
    [[nodiscard]] static ArrayFilter by_identity(std::size_t placeholder, std::string field, Value value);

    /// "elemN"
    [[nodiscard]] std::string identifier() const { return placeholder_name(placeholder); }

    /// {"elemN._index": i} or {"elemN.field": value}
    [[nodiscard]] Value to_document() const;

    /// "elemN._index == i" or "elemN.field == value"
    [[nodiscard]] std::string to_display_string() const;
};

// ============================================================
// ChangeMetadata
// ============================================================

class DIFFIT_API ChangeMetadata {
public:
    [[nodiscard]] std::size_t total_changes() const noexcept { return fields_changed_.size(); }

    /// Distinct changed paths, in emission order
    [[nodiscard]] const std::vector<std::string>& fields_changed() const noexcept { return fields_changed_; }

    /// Operator recorded per changed path
    [[nodiscard]] const std::map<std::string, Operator>& operation_types() const noexcept { return operation_types_; }

    /// Record or update the operator for `path`
    void record(const std::string& path, Operator op);

    /// Forget `path` and every path nested under it
    void discard_under(std::string_view path);

    /// {"fieldsChanged": [...], "operationTypes": {...}, "totalChanges": N}
    [[nodiscard]] Value to_value() const;
    [[nodiscard]] std::string to_json(bool compact = false) const;

private:
    std::vector<std::string> fields_changed_;
    std::map<std::string, Operator> operation_types_;
};

// ============================================================
// Patch
// ============================================================

class DIFFIT_API Patch {
public:
    using Entries    = std::map<std::string, Value>;
    using Operations = std::map<Operator, Entries>;

    [[nodiscard]] bool is_empty() const noexcept { return operations_.empty(); }

    [[nodiscard]] const Operations& operations() const noexcept { return operations_; }

    /// Entries recorded under `op`; empty when there are none
    [[nodiscard]] const Entries& operation(Operator op) const;

    [[nodiscard]] bool has_array_filters() const noexcept { return !array_filters_.empty(); }
    [[nodiscard]] const std::vector<ArrayFilter>& array_filters() const noexcept { return array_filters_; }

    [[nodiscard]] const ChangeMetadata& metadata() const noexcept { return metadata_; }

    /// Stable multi-line rendering, sorted by operator then path
    [[nodiscard]] std::string to_display_string() const;

    /// Map in native update syntax; $push entries are wrapped in {"$each": [...]}
    [[nodiscard]] Value to_update_document() const;

    /// Vector of filter documents, in placeholder order
    [[nodiscard]] Value array_filters_document() const;

    /// {"update": ..., "arrayFilters": [...], "metadata": ...}
    [[nodiscard]] std::string to_json(bool compact = false) const;

    // ------------------------------------------------------------
    // Building (used by the walker and the array engine)
    // ------------------------------------------------------------

    /// Record `value` under `op` for `path`, removing `path` from every other operator
    void add_operation(Operator op, const std::string& path, Value value);

    [[nodiscard]] FilterPlaceholder next_placeholder() { return FilterPlaceholder{next_placeholder_++}; }

    /// Number of placeholders handed out so far
    [[nodiscard]] std::size_t placeholder_mark() const noexcept { return next_placeholder_; }

    /// Hand placeholders from `mark` onwards out again
    void rewind_placeholders(std::size_t mark) noexcept;

    /// Filters are kept in placeholder order
    void add_array_filter(ArrayFilter filter);

    /// Drop every operation and metadata entry at or under `path`, and every
    /// array filter no remaining operation refers to
    void discard_under(std::string_view path);

    /// Bumped on every add_operation
    [[nodiscard]] std::size_t revision() const noexcept { return revision_; }

private:
    Operations operations_;
    std::vector<ArrayFilter> array_filters_;
    ChangeMetadata metadata_;
    std::size_t next_placeholder_ = 0;
    std::size_t revision_ = 0;
};

} // namespace diffit
