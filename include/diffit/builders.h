// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of immutable Value containers.
///
/// - MapBuilder: build a ValueMap
/// - VectorBuilder: build a ValueVector
/// - RecordBuilder: build a ValueRecord of a given RecordType
///
/// Usage:
/// @code
///   #include <diffit/builders.h>
///
///   Value tags = VectorBuilder()
///       .push_back("a")
///       .push_back("b")
///       .finish();
///
///   Value user = RecordBuilder(user_type)
///       .set("ID", "u1")
///       .set("Name", "Ann")
///       .set("Tags", tags)
///       .set("Secret", "")
///       .finish();
/// @endcode

#pragma once

#include <diffit/value.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace diffit {

/// Builder for a ValueMap - O(n)
class MapBuilder {
public:
    using transient_type = ValueMap::transient_type;

    MapBuilder() : transient_(ValueMap{}.transient()) {}
    explicit MapBuilder(const ValueMap& existing) : transient_(existing.transient()) {}

    MapBuilder(MapBuilder&&) noexcept = default;
    MapBuilder& operator=(MapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    MapBuilder(const MapBuilder&) = delete;
    MapBuilder& operator=(const MapBuilder&) = delete;

    MapBuilder& set(const std::string& key, Value val) {
        transient_.set(key, ValueBox{std::move(val)});
        return *this;
    }

    MapBuilder& erase(const std::string& key) {
        transient_.erase(key);
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    /// Finish building and return the Value. The builder should not be used afterwards.
    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

    [[nodiscard]] ValueMap finish_map() { return transient_.persistent(); }

private:
    transient_type transient_;
};

/// Builder for a ValueVector - O(n)
class VectorBuilder {
public:
    using transient_type = ValueVector::transient_type;

    VectorBuilder() : transient_(ValueVector{}.transient()) {}
    explicit VectorBuilder(const ValueVector& existing) : transient_(existing.transient()) {}

    VectorBuilder(VectorBuilder&&) noexcept = default;
    VectorBuilder& operator=(VectorBuilder&&) noexcept = default;

    VectorBuilder(const VectorBuilder&) = delete;
    VectorBuilder& operator=(const VectorBuilder&) = delete;

    VectorBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    /// Replace the element at `index`
    /// @throws std::out_of_range if index >= size()
    VectorBuilder& set(std::size_t index, Value val) {
        if (index >= transient_.size()) {
            throw std::out_of_range("VectorBuilder::set index out of range");
        }
        transient_.set(index, ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

    [[nodiscard]] ValueVector finish_vector() { return transient_.persistent(); }

private:
    transient_type transient_;
};

/// Builder for a record value. Fields may be set in any order, by declared or
/// external name, but every field of the type must be set before finish().
class RecordBuilder {
public:
    explicit RecordBuilder(RecordTypePtr type)
        : type_(std::move(type))
        , fields_(type_ ? type_->field_count() : 0)
        , assigned_(fields_.size(), false)
    {
        if (!type_) {
            throw std::invalid_argument("RecordBuilder requires a record type");
        }
    }

    /// Start from an existing record, every field already assigned
    explicit RecordBuilder(const ValueRecord& existing)
        : RecordBuilder(existing.type)
    {
        for (std::size_t i = 0; i < existing.fields.size() && i < fields_.size(); ++i) {
            fields_[i] = *existing.fields[i];
            assigned_[i] = true;
        }
    }

    /// @throws std::invalid_argument if the type has no such field
    RecordBuilder& set(std::string_view field, Value val) {
        auto index = type_->index_of(field);
        if (!index) {
            throw std::invalid_argument("record type '" + type_->name() + "' has no field '" +
                                        std::string{field} + "'");
        }
        fields_[*index] = std::move(val);
        assigned_[*index] = true;
        return *this;
    }

    /// @throws std::invalid_argument naming the first field that was never set
    [[nodiscard]] Value finish() {
        auto t = ValueVector{}.transient();
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            if (!assigned_[i]) {
                throw std::invalid_argument("record '" + type_->name() + "' is missing field '" +
                                            type_->field(i).name + "'");
            }
            t.push_back(ValueBox{std::move(fields_[i])});
        }
        return Value{ValueRecord{type_, t.persistent()}};
    }

private:
    RecordTypePtr type_;
    std::vector<Value> fields_;
    std::vector<bool> assigned_;
};

} // namespace diffit
