// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON rendering of Values.
///
/// Usage:
/// @code
///   #include <diffit/serialization.h>
///
///   Value data = Value::map({{"key", "value"}});
///   std::string json = to_json(data, false);  // pretty-printed
///   Value parsed = from_json(json);
/// @endcode
///
/// Mapping of value kinds to JSON:
///   - map keys are written in sorted order
///   - records become objects keyed by external field name, in declaration
///     order; omitted fields are not written
///   - timestamps become ISO-8601 UTC strings ("2024-03-01T12:00:00Z")
///   - durations become integer nanosecond counts
///   - references write their target, or null
///   - dynamic leaves write their inner value; callables write null
///
/// Note: This header must be included separately from value.h if you need serialization.

#pragma once

#include <diffit/api.h>
#include <diffit/value.h>

#include <string>

namespace diffit {

/// Convert Value to a JSON string
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @throws CyclicStructureError if a reference cycle is reachable
[[nodiscard]] DIFFIT_API std::string to_json(const Value& val, bool compact = false);

/// Parse a JSON string into a Value (objects become maps, arrays vectors,
/// integers int32 when they fit and int64 otherwise)
/// @param error_out If provided, receives the error message on failure
/// @return Parsed Value, or null Value on parse error
[[nodiscard]] DIFFIT_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

/// `s` as a quoted JSON string literal
[[nodiscard]] DIFFIT_API std::string json_quote(const std::string& s);

/// "2024-03-01T12:00:00Z"; a sub-second part is written only when non-zero
[[nodiscard]] DIFFIT_API std::string format_timestamp(Timestamp ts);

/// Double with up to 15 significant digits: 26, 0.5, 1e+20
[[nodiscard]] DIFFIT_API std::string format_number(double value);

} // namespace diffit
