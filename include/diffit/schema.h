// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file schema.h
/// @brief Record schemas: declared fields, external names and identity fields.
///
/// A RecordType is resolved once, when it is built, and then shared immutably
/// by every record value of that type. The walker never inspects field names
/// at diff time beyond what the RecordType already computed.
///
/// Usage:
/// @code
///   auto user_type = RecordTypeBuilder("User")
///       .identity("ID", "_id")
///       .field("Name")               // external name "name"
///       .field("CreatedAt")          // external name "created_at"
///       .field("Secret", "-")        // omitted from diffs
///       .finish();
/// @endcode

#pragma once

#include <diffit/api.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace diffit {

struct FieldDescriptor {
    std::string name;           ///< Declared field name
    std::string external_name;  ///< Name used in field paths (serialization alias)
    bool omitted = false;       ///< Alias "-": never visited by the diff
};

class DIFFIT_API RecordType {
public:
    RecordType(std::string name,
               std::vector<FieldDescriptor> fields,
               std::optional<std::size_t> identity_field = std::nullopt);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<FieldDescriptor>& fields() const noexcept { return fields_; }
    [[nodiscard]] std::size_t field_count() const noexcept { return fields_.size(); }
    [[nodiscard]] const FieldDescriptor& field(std::size_t index) const { return fields_.at(index); }

    /// Index of the field whose declared or external name is `name`
    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const;

    [[nodiscard]] std::optional<std::size_t> identity_index() const noexcept { return identity_; }
    [[nodiscard]] const FieldDescriptor* identity_field() const noexcept {
        return identity_ ? &fields_[*identity_] : nullptr;
    }

    /// Same type name and same external field layout
    [[nodiscard]] bool same_shape(const RecordType& other) const noexcept;

private:
    std::string name_;
    std::vector<FieldDescriptor> fields_;
    std::optional<std::size_t> identity_;
    std::unordered_map<std::string, std::size_t> lookup_;
};

using RecordTypePtr = std::shared_ptr<const RecordType>;

/// Shape check that also accepts two null pointers
[[nodiscard]] DIFFIT_API bool same_shape(const RecordTypePtr& a, const RecordTypePtr& b) noexcept;

// ============================================================
// RecordTypeBuilder
// ============================================================

class DIFFIT_API RecordTypeBuilder {
public:
    explicit RecordTypeBuilder(std::string name) : name_(std::move(name)) {}

    /// Add a field. An empty alias derives the external name with to_snake_case();
    /// alias "-" marks the field as omitted.
    RecordTypeBuilder& field(std::string name, std::string alias = "");

    /// Add the field that identifies records of this type inside sequences
    RecordTypeBuilder& identity(std::string name, std::string alias = "");

    /// @throws std::invalid_argument on duplicate external names or an omitted identity field
    [[nodiscard]] RecordTypePtr finish();

private:
    std::string name_;
    std::vector<FieldDescriptor> fields_;
    std::optional<std::size_t> identity_;
};

/// "CreatedAt" -> "created_at"
[[nodiscard]] DIFFIT_API std::string to_snake_case(std::string_view name);

} // namespace diffit
