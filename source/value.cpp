// value.cpp - Value equality, zero values, detached copies and printing

#include <diffit/value.h>
#include <diffit/errors.h>
#include <diffit/serialization.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include <vector>

namespace diffit {

namespace {

using RefPair  = std::pair<const void*, const void*>;
using RefStack = std::vector<RefPair>;

bool equal_impl(const Value& a, const Value& b, RefStack& stack);

bool maps_equal(const ValueMap& a, const ValueMap& b, RefStack& stack)
{
    // immer container identity check - O(1)
    if (a.impl().root == b.impl().root && a.impl().size == b.impl().size) {
        return true;
    }
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, box] : a) {
        const auto* other = b.find(key);
        if (!other) {
            return false;
        }
        if (!equal_impl(*box, **other, stack)) {
            return false;
        }
    }
    return true;
}

bool vectors_equal(const ValueVector& a, const ValueVector& b, RefStack& stack)
{
    if (a.impl().root == b.impl().root &&
        a.impl().tail == b.impl().tail &&
        a.impl().size == b.impl().size) {
        return true;
    }
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!equal_impl(*a[i], *b[i], stack)) {
            return false;
        }
    }
    return true;
}

bool equal_impl(const Value& a, const Value& b, RefStack& stack)
{
    if (&a == &b) {
        return true;
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }

    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, ValueRecord>) {
            if (!same_shape(lhs.type, rhs.type)) {
                return false;
            }
            return vectors_equal(lhs.fields, rhs.fields, stack);
        }
        else if constexpr (std::is_same_v<T, ValueMap>) {
            return maps_equal(lhs, rhs, stack);
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            return vectors_equal(lhs, rhs, stack);
        }
        else if constexpr (std::is_same_v<T, ValueRef>) {
            if (lhs.is_null() || rhs.is_null()) {
                return lhs.is_null() && rhs.is_null();
            }
            if (lhs.identity() == rhs.identity()) {
                return true;
            }
            const RefPair pair{lhs.identity(), rhs.identity()};
            // Already comparing this pair higher up: assume equal (cycles terminate)
            if (std::find(stack.begin(), stack.end(), pair) != stack.end()) {
                return true;
            }
            stack.push_back(pair);
            const bool result = equal_impl(*lhs.target, *rhs.target, stack);
            stack.pop_back();
            return result;
        }
        else if constexpr (std::is_same_v<T, ValueDynamic>) {
            return equal_impl(*lhs.value, *rhs.value, stack);
        }
        else if constexpr (std::is_same_v<T, ValueCallable>) {
            return lhs.fn == rhs.fn;
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        }
        else if constexpr (std::is_same_v<T, double>) {
            // NaN equals NaN
            return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
        }
        else {
            return lhs == rhs;
        }
    }, a.data);
}

std::optional<Value> detach_impl(const Value& val, std::vector<const void*>& branch, std::string_view path);

std::optional<ValueVector> detach_boxes(const ValueVector& vec, std::vector<const void*>& branch,
                                        std::string_view path)
{
    std::optional<ValueVector::transient_type> rebuilt;
    for (std::size_t i = 0; i < vec.size(); ++i) {
        auto copy = detach_impl(*vec[i], branch, path);
        if (copy && !rebuilt) {
            // First element that needs copying: start from the untouched prefix
            rebuilt = ValueVector{}.transient();
            for (std::size_t j = 0; j < i; ++j) {
                rebuilt->push_back(vec[j]);
            }
        }
        if (rebuilt) {
            rebuilt->push_back(copy ? ValueBox{std::move(*copy)} : vec[i]);
        }
    }
    if (!rebuilt) {
        return std::nullopt;
    }
    return rebuilt->persistent();
}

// Returns nullopt when `val` holds no reference and can be shared as-is
std::optional<Value> detach_impl(const Value& val, std::vector<const void*>& branch, std::string_view path)
{
    return std::visit([&](const auto& arg) -> std::optional<Value> {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueRecord>) {
            auto fields = detach_boxes(arg.fields, branch, path);
            if (!fields) return std::nullopt;
            return Value{ValueRecord{arg.type, std::move(*fields)}};
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            auto items = detach_boxes(arg, branch, path);
            if (!items) return std::nullopt;
            return Value{std::move(*items)};
        }
        else if constexpr (std::is_same_v<T, ValueMap>) {
            std::optional<ValueMap> rebuilt;
            for (const auto& [key, box] : arg) {
                if (auto copy = detach_impl(*box, branch, path)) {
                    rebuilt = (rebuilt ? *rebuilt : arg).set(key, ValueBox{std::move(*copy)});
                }
            }
            if (!rebuilt) return std::nullopt;
            return Value{std::move(*rebuilt)};
        }
        else if constexpr (std::is_same_v<T, ValueRef>) {
            if (arg.is_null()) {
                return Value::null_ref();
            }
            if (std::find(branch.begin(), branch.end(), arg.identity()) != branch.end()) {
                throw CyclicStructureError(std::string{path});
            }
            branch.push_back(arg.identity());
            auto inner = detach_impl(*arg.target, branch, path);
            branch.pop_back();
            return Value::ref(inner ? std::move(*inner) : *arg.target);
        }
        else if constexpr (std::is_same_v<T, ValueDynamic>) {
            auto inner = detach_impl(*arg.value, branch, path);
            if (!inner) return std::nullopt;
            return Value::dynamic(std::move(*inner));
        }
        else {
            return std::nullopt;
        }
    }, val.data);
}

void print_value_impl(const Value& val, const std::string& prefix, std::size_t depth,
                      std::vector<const void*>& branch)
{
    const std::string indent(depth * 2, ' ');

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueRecord>) {
            std::cout << indent << prefix << (arg.type ? arg.type->name() : "record") << ":\n";
            for (std::size_t i = 0; i < arg.fields.size(); ++i) {
                const auto name = arg.type ? arg.type->field(i).external_name : std::to_string(i);
                std::cout << std::string((depth + 1) * 2, ' ') << name << ":\n";
                print_value_impl(*arg.fields[i], "", depth + 2, branch);
            }
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            std::vector<std::string> keys;
            for (const auto& [k, v] : arg) keys.push_back(k);
            std::sort(keys.begin(), keys.end());
            for (const auto& k : keys) {
                std::cout << indent << prefix << k << ":\n";
                print_value_impl(*arg[k], "", depth + 1, branch);
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            for (std::size_t i = 0; i < arg.size(); ++i) {
                std::cout << indent << prefix << "[" << i << "]:\n";
                print_value_impl(*arg[i], "", depth + 1, branch);
            }
        } else if constexpr (std::is_same_v<T, ValueRef>) {
            if (arg.is_null()) {
                std::cout << indent << prefix << "&null\n";
            } else if (std::find(branch.begin(), branch.end(), arg.identity()) != branch.end()) {
                std::cout << indent << prefix << "&<cycle>\n";
            } else {
                branch.push_back(arg.identity());
                print_value_impl(*arg.target, prefix + "&", depth, branch);
                branch.pop_back();
            }
        } else if constexpr (std::is_same_v<T, ValueDynamic>) {
            print_value_impl(*arg.value, prefix + "any ", depth, branch);
        } else {
            std::cout << indent << prefix << value_to_string(val) << "\n";
        }
    }, val.data);
}

} // anonymous namespace

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::boolean:   return "bool";
        case ValueKind::int32:     return "int32";
        case ValueKind::int64:     return "int64";
        case ValueKind::uint32:    return "uint32";
        case ValueKind::uint64:    return "uint64";
        case ValueKind::real:      return "double";
        case ValueKind::text:      return "string";
        case ValueKind::timestamp: return "timestamp";
        case ValueKind::duration:  return "duration";
        case ValueKind::record:    return "record";
        case ValueKind::map:       return "map";
        case ValueKind::vector:    return "vector";
        case ValueKind::reference: return "reference";
        case ValueKind::dynamic:   return "dynamic";
        case ValueKind::callable:  return "callable";
        case ValueKind::null:      return "null";
    }
    return "unknown";
}

// ============================================================
// Value accessors
// ============================================================

Value Value::at(std::string_view key) const
{
    if (auto* r = get_if<ValueRecord>()) {
        if (r->type) {
            if (auto index = r->type->index_of(key); index && *index < r->fields.size()) {
                return *r->fields[*index];
            }
        }
        return Value{};
    }
    if (auto* m = get_if<ValueMap>()) {
        if (auto* found = m->find(std::string{key})) return found->get();
        return Value{};
    }
    if (auto* ref = get_if<ValueRef>()) {
        if (!ref->is_null()) return ref->target->at(key);
    }
    return Value{};
}

Value Value::at(std::size_t index) const
{
    if (auto* v = get_if<ValueVector>()) {
        if (index < v->size()) return (*v)[index].get();
    }
    return Value{};
}

std::size_t Value::size() const noexcept
{
    if (auto* r = get_if<ValueRecord>()) return r->fields.size();
    if (auto* m = get_if<ValueMap>()) return m->size();
    if (auto* v = get_if<ValueVector>()) return v->size();
    return 0;
}

// ============================================================
// Comparison
// ============================================================

bool values_equal(const Value& a, const Value& b)
{
    RefStack stack;
    return equal_impl(a, b, stack);
}

bool operator==(const ValueRecord& a, const ValueRecord& b)
{
    return values_equal(Value{a}, Value{b});
}

bool operator==(const ValueRef& a, const ValueRef& b)
{
    return values_equal(Value{a}, Value{b});
}

bool operator==(const ValueDynamic& a, const ValueDynamic& b)
{
    return values_equal(*a.value, *b.value);
}

bool operator==(const ValueCallable& a, const ValueCallable& b)
{
    return a.fn == b.fn;
}

bool same_shape(const Value& a, const Value& b) noexcept
{
    if (a.data.index() != b.data.index()) {
        return false;
    }
    if (auto* ra = a.get_if<ValueRecord>()) {
        return same_shape(ra->type, b.get_if<ValueRecord>()->type);
    }
    return true;
}

// ============================================================
// Zero values
// ============================================================

Value zero_of(const Value& val)
{
    return std::visit([&](const auto& arg) -> Value {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueRecord>) {
            auto t = ValueVector{}.transient();
            for (const auto& field : arg.fields) {
                t.push_back(ValueBox{zero_of(*field)});
            }
            return Value{ValueRecord{arg.type, t.persistent()}};
        }
        else if constexpr (std::is_same_v<T, ValueRef>) {
            return Value::null_ref();
        }
        else if constexpr (std::is_same_v<T, ValueDynamic>) {
            return Value::dynamic(Value{});
        }
        else if constexpr (std::is_same_v<T, ValueCallable>) {
            return Value{ValueCallable{arg.name, nullptr}};
        }
        else {
            // Value-initialized alternative: false, 0, "", epoch, 0ns, empty containers
            return Value{T{}};
        }
    }, val.data);
}

bool is_zero(const Value& val)
{
    return std::visit([&](const auto& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueRecord>) {
            return std::all_of(arg.fields.begin(), arg.fields.end(),
                               [](const ValueBox& field) { return is_zero(*field); });
        }
        else if constexpr (std::is_same_v<T, ValueMap> || std::is_same_v<T, ValueVector>) {
            return arg.size() == 0;
        }
        else if constexpr (std::is_same_v<T, ValueRef>) {
            return arg.is_null();
        }
        else if constexpr (std::is_same_v<T, ValueDynamic>) {
            return is_zero(*arg.value);
        }
        else if constexpr (std::is_same_v<T, ValueCallable>) {
            return !arg.fn;
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        }
        else {
            return arg == T{};
        }
    }, val.data);
}

// ============================================================
// Detached copies
// ============================================================

Value detach(const Value& val)
{
    return detach(val, {});
}

Value detach(const Value& val, std::string_view path)
{
    std::vector<const void*> branch;
    auto copy = detach_impl(val, branch, path);
    return copy ? std::move(*copy) : val;
}

// ============================================================
// Printing
// ============================================================

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, uint32_t>) {
            return std::to_string(arg) + "u";
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return std::to_string(arg) + "uL";
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return format_timestamp(arg);
        } else if constexpr (std::is_same_v<T, Duration>) {
            return std::to_string(arg.count()) + "ns";
        } else if constexpr (std::is_same_v<T, ValueRecord>) {
            return (arg.type ? arg.type->name() : std::string{"record"}) +
                   "{" + std::to_string(arg.fields.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, ValueRef>) {
            if (arg.is_null()) return "&null";
            return "&" + std::string{kind_name(arg.target->kind())};
        } else if constexpr (std::is_same_v<T, ValueDynamic>) {
            return "any(" + value_to_string(*arg.value) + ")";
        } else if constexpr (std::is_same_v<T, ValueCallable>) {
            return "fn:" + arg.name;
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::vector<const void*> branch;
    print_value_impl(val, prefix, depth, branch);
}

} // namespace diffit
