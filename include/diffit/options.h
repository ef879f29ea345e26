// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief Per-call diff options.
///
/// Usage:
/// @code
///   auto options = DiffOptions{}
///       .with_array_strategy(ArrayStrategy::merge)
///       .with_zero_value_policy(ZeroValuePolicy::as_unset)
///       .with_ignore_fields({"updated_at", "audit"});
///   auto result = diff(old_user, new_user, options);
/// @endcode

#pragma once

#include <diffit/api.h>
#include <diffit/value.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diffit {

enum class ArrayStrategy : std::uint8_t {
    replace,  ///< Set the whole new sequence
    smart,    ///< Positional filters for same-length sequences
    append,   ///< $push a suffix when old is a prefix of new
    merge     ///< Identity matching
};

enum class ZeroValuePolicy : std::uint8_t {
    as_set,    ///< Emit the zero value with $set
    as_unset,  ///< Emit $unset for the path
    ignore     ///< Emit nothing
};

[[nodiscard]] DIFFIT_API std::string_view to_string(ArrayStrategy strategy) noexcept;
[[nodiscard]] DIFFIT_API std::string_view to_string(ZeroValuePolicy policy) noexcept;

/// Identity of a sequence element. An empty `field` means the identity is the
/// element's whole value, which cannot be expressed as an array filter.
struct Identity {
    std::string field;
    Value value;
};

/// Returns the identity of a sequence element, or nullopt to defer to the
/// record type's identity field
using IdentityExtractor = std::function<std::optional<Identity>(const Value&)>;

struct DIFFIT_API DiffOptions {
    std::vector<std::string> ignore_fields;
    ArrayStrategy array_strategy = ArrayStrategy::smart;
    ZeroValuePolicy zero_value_policy = ZeroValuePolicy::as_set;
    bool numeric_optimization = false;
    bool detect_pointer_sharing = false;
    IdentityExtractor identity_extractor;
    /// Smart falls back to Replace when more than ratio * length indices changed
    double smart_max_changed_ratio = 1.0;

    DiffOptions& with_ignore_fields(std::vector<std::string> fields) {
        ignore_fields = std::move(fields);
        return *this;
    }
    DiffOptions& with_ignored_field(std::string field) {
        ignore_fields.push_back(std::move(field));
        return *this;
    }
    DiffOptions& with_array_strategy(ArrayStrategy strategy) {
        array_strategy = strategy;
        return *this;
    }
    DiffOptions& with_zero_value_policy(ZeroValuePolicy policy) {
        zero_value_policy = policy;
        return *this;
    }
    DiffOptions& with_numeric_optimization(bool enabled = true) {
        numeric_optimization = enabled;
        return *this;
    }
    DiffOptions& with_pointer_sharing_detection(bool enabled = true) {
        detect_pointer_sharing = enabled;
        return *this;
    }
    DiffOptions& with_identity_extractor(IdentityExtractor extractor) {
        identity_extractor = std::move(extractor);
        return *this;
    }
    DiffOptions& with_smart_max_changed_ratio(double ratio) {
        smart_max_changed_ratio = ratio;
        return *this;
    }

    /// @throws std::invalid_argument if smart_max_changed_ratio is outside [0, 1]
    void validate() const;
};

/// Extractor reading a record field (declared or external name) or a map entry
/// as the identity
[[nodiscard]] DIFFIT_API IdentityExtractor identity_field(std::string name);

} // namespace diffit
