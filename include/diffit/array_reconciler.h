// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_reconciler.h
/// @brief Sequence reconciliation strategies: Replace, Smart, Append and Merge.
///
/// - Replace: one $set of the whole new sequence
/// - Smart:   same length, one position filter per changed index
/// - Append:  old is a prefix of new, one $push of the suffix
/// - Merge:   elements matched by identity; $push of trailing additions, or
///            identity filters for changed elements
///
/// Every strategy other than Replace falls back to Replace when it cannot
/// express the change, discarding whatever it had emitted under the path.

#pragma once

#include <diffit/api.h>
#include <diffit/field_path.h>
#include <diffit/options.h>
#include <diffit/value.h>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace diffit {

/// Identity of a sequence element: the extractor's answer, else the record
/// type's identity field, else the whole element
[[nodiscard]] DIFFIT_API Identity resolve_identity(const Value& element, const IdentityExtractor& extractor);

/// Result of one-to-one identity matching between two sequences.
/// Index lists are in ascending order.
struct MergePartition {
    std::vector<std::size_t> matched_unchanged;  ///< new indices
    std::vector<std::size_t> matched_changed;    ///< new indices
    std::vector<std::size_t> new_only;           ///< new indices
    std::vector<std::size_t> matched_old;        ///< old indices
    std::vector<std::size_t> old_only;           ///< old indices
    std::vector<std::optional<std::size_t>> new_to_old;

    /// Every matched element kept its position
    [[nodiscard]] bool order_preserved() const noexcept {
        for (std::size_t i = 0; i < new_to_old.size(); ++i) {
            if (new_to_old[i] && *new_to_old[i] != i) return false;
        }
        return true;
    }
};

/// Match new elements to old ones by identity. Duplicate identities pair in
/// order of appearance.
[[nodiscard]] DIFFIT_API MergePartition merge_partition(const ValueVector& old_vec,
                                                        const ValueVector& new_vec,
                                                        const IdentityExtractor& extractor = {});

namespace detail {

class ValueWalker;

class ArrayReconciler {
public:
    explicit ArrayReconciler(ValueWalker& walker) : walker_(walker) {}

    void reconcile(const ValueVector& old_vec, const ValueVector& new_vec, FieldPath& path);

private:
    void replace(const ValueVector& new_vec, const FieldPath& path);
    void smart(const ValueVector& old_vec, const ValueVector& new_vec, FieldPath& path);
    void append(const ValueVector& old_vec, const ValueVector& new_vec, FieldPath& path);
    void merge(const ValueVector& old_vec, const ValueVector& new_vec, FieldPath& path);

    void fall_back(std::string_view reason, const ValueVector& new_vec, const FieldPath& path);

    ValueWalker& walker_;
    std::size_t placeholder_mark_ = 0;
};

} // namespace detail

} // namespace diffit
