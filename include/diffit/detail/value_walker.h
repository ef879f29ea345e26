// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file detail/value_walker.h
/// @brief Recursive comparison of two values into a Patch (internal).
///
/// The walker dispatches on the value kind of the old side and recurses
/// through records, maps and references. Sequences are handed to the
/// ArrayReconciler, which calls back into walk() for element pairs.
///
/// Paths are passed by reference and extended with push_back/pop_back
/// rather than copied at every level.

#pragma once

#include <diffit/field_path.h>
#include <diffit/options.h>
#include <diffit/patch.h>
#include <diffit/value.h>

#include <vector>

namespace diffit {
namespace detail {

class ValueWalker {
public:
    ValueWalker(Patch& patch, const DiffOptions& options, const IgnoreSet& ignored)
        : patch_(patch), options_(options), ignored_(ignored) {}

    ValueWalker(const ValueWalker&) = delete;
    ValueWalker& operator=(const ValueWalker&) = delete;

    /// Compare two present values
    void walk(const Value& old_val, const Value& new_val, FieldPath& path);

    /// Old side absent: compare against the zero value of new_val's type
    void walk_added(const Value& new_val, FieldPath& path);

    /// New side absent: unset every non-zero leaf of old_val
    void walk_removed(const Value& old_val, FieldPath& path);

    /// Scan every field, key, element and referent reachable from `root`
    /// outside ignored and omitted fields. Shared subtrees are scanned too,
    /// so the result does not depend on immer node sharing.
    /// @throws UnsupportedLeafTypeError at the first callable found
    void reject_callables(const Value& root);

    /// $set of a whole sequence, bypassing the zero-value policy
    void emit_replace(const Value& new_sequence, const FieldPath& path);

    /// $push of `items` onto the sequence at `path`
    void emit_push(const ValueVector& items, const FieldPath& path);

    [[nodiscard]] Patch& patch() noexcept { return patch_; }
    [[nodiscard]] const DiffOptions& options() const noexcept { return options_; }

private:
    void walk_record(const ValueRecord& old_rec, const ValueRecord& new_rec, FieldPath& path);
    void walk_map(const ValueMap& old_map, const ValueMap& new_map, FieldPath& path);
    void walk_ref(const ValueRef& old_ref, const ValueRef& new_ref, FieldPath& path);

    void scan_callables(const Value& val, FieldPath& path, std::vector<const void*>& branch);

    /// Changed scalar: $inc when enabled and smaller, otherwise emit_leaf
    void emit_change(const Value& old_val, const Value& new_val, const FieldPath& path);

    /// $set of `new_val`, subject to the zero-value policy
    void emit_leaf(const Value& new_val, const FieldPath& path);

    void emit_unset(const FieldPath& path);

    /// Record the operation unless the path is ignored
    void emit(Operator op, const FieldPath& path, Value value);

    [[nodiscard]] bool is_ignored(const FieldPath& path) const {
        return !path.empty() && ignored_.matches(path);
    }

    /// Push `identity` on a branch stack
    /// @throws CyclicStructureError if it is already there
    void enter(std::vector<const void*>& branch, const void* identity, const FieldPath& path);

    Patch& patch_;
    const DiffOptions& options_;
    const IgnoreSet& ignored_;
    std::vector<const void*> old_branch_;
    std::vector<const void*> new_branch_;
};

} // namespace detail
} // namespace diffit
