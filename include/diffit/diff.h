// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Entry point: compute the update patch turning one value into another.
///
/// Usage:
/// @code
///   #include <diffit/diff.h>
///
///   auto result = diffit::diff(old_user, new_user);
///   if (!result.patch.is_empty()) {
///       std::cout << result.patch.to_display_string() << "\n";
///   }
///
///   // Insert: every non-zero field of the new value becomes a $set
///   auto created = diffit::diff(Operand::absent(), new_user);
///
///   // Delete: every non-zero leaf of the old value becomes an $unset
///   auto removed = diffit::diff(old_user, Operand::absent());
/// @endcode
///
/// diff() is pure and reentrant. Errors are thrown as DiffError subclasses
/// (see errors.h); a thrown call produces no patch.

#pragma once

#include <diffit/api.h>
#include <diffit/errors.h>
#include <diffit/options.h>
#include <diffit/patch.h>
#include <diffit/sharing_tracker.h>
#include <diffit/value.h>

#include <concepts>
#include <cstdint>
#include <utility>
#include <vector>

namespace diffit {

/// How an operand takes part in a diff
enum class Presence : std::uint8_t {
    absent,   ///< No value on this side (insert or delete)
    zero,     ///< Synthetic zero value of a known type
    present   ///< A real value
};

/// One side of a diff
class Operand {
public:
    /// Any value is a present operand
    template <typename T>
        requires std::constructible_from<Value, T>
    Operand(T&& value)
        : presence_(Presence::present), value_(std::forward<T>(value)) {}

    [[nodiscard]] static Operand absent() { return Operand{Presence::absent, Value{}}; }

    /// The zero value of `shape`'s type
    [[nodiscard]] static Operand zero_of(const Value& shape) {
        return Operand{Presence::zero, diffit::zero_of(shape)};
    }

    [[nodiscard]] Presence presence() const noexcept { return presence_; }
    [[nodiscard]] bool is_absent() const noexcept { return presence_ == Presence::absent; }

    /// The value to compare; null when absent
    [[nodiscard]] const Value& value() const noexcept { return value_; }

private:
    Operand(Presence presence, Value value) : presence_(presence), value_(std::move(value)) {}

    Presence presence_;
    Value value_;
};

struct DiffResult {
    Patch patch;
    std::vector<Diagnostic> diagnostics;

    [[nodiscard]] bool has_diagnostics() const noexcept { return !diagnostics.empty(); }
};

/// Compute the patch turning `old_operand` into `new_operand`.
///
/// @throws std::invalid_argument if `options` are invalid
/// @throws BothAbsentError, IncompatibleTypesError, UnsupportedLeafTypeError,
///         CyclicStructureError
[[nodiscard]] DIFFIT_API DiffResult diff(const Operand& old_operand,
                                         const Operand& new_operand,
                                         const DiffOptions& options = {});

/// Quick check whether a diff of two present values could be non-empty.
/// Returns as soon as one difference is found. Ignore lists and the zero
/// policy are not consulted.
[[nodiscard]] DIFFIT_API bool has_any_difference(const Value& old_val, const Value& new_val);

} // namespace diffit
