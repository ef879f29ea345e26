// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exceptions raised by diff().
///
/// Every error is terminal for the call that raised it: no partial patch is
/// returned. Catch DiffError to handle all of them, or a subclass to handle
/// one condition. Pointer sharing is not an error, see DiffResult::diagnostics.

#pragma once

#include <diffit/api.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace diffit {

enum class DiffErrorKind : std::uint8_t {
    both_absent,
    incompatible_types,
    unsupported_leaf_type,
    cyclic_structure
};

[[nodiscard]] DIFFIT_API std::string_view to_string(DiffErrorKind kind) noexcept;

class DIFFIT_API DiffError : public std::runtime_error {
public:
    DiffError(DiffErrorKind kind, std::string path, const std::string& message)
        : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

    [[nodiscard]] DiffErrorKind kind() const noexcept { return kind_; }

    /// Dotted path where the error was detected; empty at the root
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    DiffErrorKind kind_;
    std::string path_;
};

/// Neither side supplied a value to compare
class DIFFIT_API BothAbsentError : public DiffError {
public:
    BothAbsentError();
};

/// Old and new do not share a comparable shape
class DIFFIT_API IncompatibleTypesError : public DiffError {
public:
    IncompatibleTypesError(std::string path, std::string_view old_type, std::string_view new_type);

    [[nodiscard]] const std::string& old_type() const noexcept { return old_type_; }
    [[nodiscard]] const std::string& new_type() const noexcept { return new_type_; }

private:
    std::string old_type_;
    std::string new_type_;
};

/// A value kind with no comparison rule (callables)
class DIFFIT_API UnsupportedLeafTypeError : public DiffError {
public:
    UnsupportedLeafTypeError(std::string path, std::string_view type_name);
};

/// A reference leads back to a value already on the current branch
class DIFFIT_API CyclicStructureError : public DiffError {
public:
    explicit CyclicStructureError(std::string path);
};

} // namespace diffit
