// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value type: the closed set of value kinds the diff engine compares.
///
/// This file defines the Value type that can represent:
/// - Leaf scalars: bool, int32/int64, uint32/uint64, double, string,
///   timestamps and durations
/// - Records: schema-typed field tuples (see schema.h)
/// - Mappings and ordered sequences (immer's immutable containers)
/// - Optional references: nullable shared targets with address identity
/// - Dynamically-typed leaves: a boxed Value compared by (kind, value)
/// - Callables: carried along but never comparable
/// - Null (std::monostate)
///
/// Each alternative maps to exactly one visitor branch in the walker, so the
/// dispatch is resolved by the variant index rather than by inspecting types
/// at runtime.

#pragma once

#include <diffit/diffit_config.h>
#include <diffit/api.h>
#include <diffit/schema.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace diffit {

// ============================================================
// Memory Policy
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

#if DIFFIT_THREAD_SAFE_VALUES
using memory_policy = thread_safe_memory_policy;
#else
using memory_policy = unsafe_memory_policy;
#endif

// ============================================================
// Leaf and container types
// ============================================================

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;
using Duration  = std::chrono::nanoseconds;

struct Value;

using ValueBox    = immer::box<Value, memory_policy>;
using ValueMap    = immer::map<std::string,
                               ValueBox,
                               std::hash<std::string>,
                               std::equal_to<std::string>,
                               memory_policy>;
using ValueVector = immer::vector<ValueBox, memory_policy>;

/// Record value: field boxes aligned with type->fields()
struct ValueRecord {
    RecordTypePtr type;
    ValueVector fields;
};

/// Optional reference. Unlike the immutable containers, the target may be
/// mutated through the shared pointer, which is what makes aliasing between
/// an old and a new snapshot observable.
struct ValueRef {
    std::shared_ptr<Value> target;

    [[nodiscard]] bool is_null() const noexcept { return !target; }
    [[nodiscard]] const void* identity() const noexcept { return target.get(); }
};

/// Dynamically-typed leaf ("any"): compared by (kind, value), never recursed
struct ValueDynamic {
    ValueBox value;
};

using CallableFn = std::function<Value(const Value&)>;

/// Executable value. The diff has no comparison rule for it.
struct ValueCallable {
    std::string name;
    std::shared_ptr<const CallableFn> fn;
};

/// Value kinds, in variant order
enum class ValueKind : std::uint8_t {
    boolean,
    int32,
    int64,
    uint32,
    uint64,
    real,
    text,
    timestamp,
    duration,
    record,
    map,
    vector,
    reference,
    dynamic,
    callable,
    null
};

[[nodiscard]] DIFFIT_API std::string_view kind_name(ValueKind kind) noexcept;

// ============================================================
// Value
// ============================================================

struct DIFFIT_API Value
{
    using value_box    = ValueBox;
    using value_map    = ValueMap;
    using value_vector = ValueVector;

    std::variant<bool,
                 int32_t,
                 int64_t,
                 uint32_t,
                 uint64_t,
                 double,
                 std::string,
                 Timestamp,
                 Duration,
                 ValueRecord,
                 ValueMap,
                 ValueVector,
                 ValueRef,
                 ValueDynamic,
                 ValueCallable,
                 std::monostate>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(int32_t v) noexcept : data(v) {}
    Value(int64_t v) noexcept : data(v) {}
    Value(uint32_t v) noexcept : data(v) {}
    Value(uint64_t v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(Timestamp v) noexcept : data(v) {}
    Value(Duration v) noexcept : data(v) {}
    Value(ValueRecord v) : data(std::move(v)) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueRef v) : data(std::move(v)) {}
    Value(ValueDynamic v) : data(std::move(v)) {}
    Value(ValueCallable v) : data(std::move(v)) {}

    // Factory functions for container and wrapper kinds
    static Value map(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value vector(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    /// Reference to a fresh allocation holding `target`
    static Value ref(Value target) {
        return Value{ValueRef{std::make_shared<Value>(std::move(target))}};
    }

    /// Reference sharing an existing allocation
    static Value ref(std::shared_ptr<Value> target) {
        return Value{ValueRef{std::move(target)}};
    }

    static Value null_ref() { return Value{ValueRef{}}; }

    static Value dynamic(Value inner) {
        return Value{ValueDynamic{ValueBox{std::move(inner)}}};
    }

    static Value callable(std::string name, CallableFn fn) {
        return Value{ValueCallable{std::move(name), std::make_shared<const CallableFn>(std::move(fn))}};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_record() const noexcept { return is<ValueRecord>(); }
    [[nodiscard]] bool is_numeric() const noexcept {
        return is<int32_t>() || is<int64_t>() || is<uint32_t>() || is<uint64_t>() || is<double>();
    }

    /// Field of a record (declared or external name) or entry of a map.
    /// References are followed. Returns null when absent.
    [[nodiscard]] Value at(std::string_view key) const;

    /// Element of a sequence; null when out of range
    [[nodiscard]] Value at(std::size_t index) const;

    [[nodiscard]] std::size_t size() const noexcept;

    template <typename T>
    [[nodiscard]] T get_or(T default_val = T{}) const {
        if (auto* ptr = get_if<T>()) return *ptr;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] ValueVector as_vector(ValueVector default_val = {}) const {
        if (auto* p = get_if<ValueVector>()) return *p;
        return default_val;
    }
};

// ============================================================
// Comparison
// ============================================================

/// Deep structural equality.
///
/// References compare by target; a pair of references already being compared
/// further up the same branch is taken as equal, so cyclic structures terminate.
[[nodiscard]] DIFFIT_API bool values_equal(const Value& a, const Value& b);

inline bool operator==(const Value& a, const Value& b) { return values_equal(a, b); }

[[nodiscard]] DIFFIT_API bool operator==(const ValueRecord& a, const ValueRecord& b);
[[nodiscard]] DIFFIT_API bool operator==(const ValueRef& a, const ValueRef& b);
[[nodiscard]] DIFFIT_API bool operator==(const ValueDynamic& a, const ValueDynamic& b);
[[nodiscard]] DIFFIT_API bool operator==(const ValueCallable& a, const ValueCallable& b);

/// Same kind, and for records the same shape. Dynamic leaves only need to
/// both be dynamic.
[[nodiscard]] DIFFIT_API bool same_shape(const Value& a, const Value& b) noexcept;

// ============================================================
// Zero values
// ============================================================

/// The zero value of `val`'s type: false, 0, "", epoch, 0ns, empty
/// containers, null reference, and for records every field zeroed.
[[nodiscard]] DIFFIT_API Value zero_of(const Value& val);

[[nodiscard]] DIFFIT_API bool is_zero(const Value& val);

// ============================================================
// Detached copies
// ============================================================

/// Copy of `val` sharing no mutable storage with it: every reference target
/// reachable from `val` is cloned into a fresh allocation. Immutable immer
/// nodes without references inside are shared as-is.
///
/// @throws CyclicStructureError if a reference cycle is reachable
[[nodiscard]] DIFFIT_API Value detach(const Value& val);

/// Same as detach(val); `path` is reported in the error when a cycle is found
[[nodiscard]] DIFFIT_API Value detach(const Value& val, std::string_view path);

// ============================================================
// Utility functions
// ============================================================

// Convert Value to a short human-readable string
[[nodiscard]] DIFFIT_API std::string value_to_string(const Value& val);

// Print Value with indentation
DIFFIT_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

} // namespace diffit
