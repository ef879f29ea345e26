// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file numeric.h
/// @brief $inc detection for numeric leaves.
///
/// Sizes follow the BSON numeric encodings: 4 bytes for an int32, 8 bytes for
/// an int64 or a double. An integer of any C++ type is sized by magnitude, so
/// an int64 holding 7 costs 4 bytes.

#pragma once

#include <diffit/api.h>
#include <diffit/value.h>

#include <cstddef>
#include <optional>

namespace diffit {

/// Encoded size of a numeric value; 0 for non-numeric values
[[nodiscard]] DIFFIT_API std::size_t encoded_numeric_size(const Value& number) noexcept;

/// Exact delta turning `old_val` into `new_val`.
///
/// Both values must share a numeric kind. Signed kinds produce a delta of the
/// same kind; unsigned kinds an int64 delta; doubles an int32 delta when the
/// difference is integral and fits, otherwise a double. Returns nullopt when
/// the delta overflows or does not reproduce `new_val` exactly.
[[nodiscard]] DIFFIT_API std::optional<Value> increment_delta(const Value& old_val, const Value& new_val);

/// The delta to emit as $inc, or nullopt when a $set of `new_val` is no larger
[[nodiscard]] DIFFIT_API std::optional<Value> choose_increment(const Value& old_val, const Value& new_val);

} // namespace diffit
