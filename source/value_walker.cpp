// value_walker.cpp - recursive comparison dispatch

#include <diffit/detail/value_walker.h>
#include <diffit/array_reconciler.h>
#include <diffit/errors.h>
#include <diffit/numeric.h>

#include <algorithm>

namespace diffit {
namespace detail {

namespace {

/// Scope guard popping a branch stack
class BranchScope {
public:
    explicit BranchScope(std::vector<const void*>& branch) : branch_(branch) {}
    ~BranchScope() { branch_.pop_back(); }

    BranchScope(const BranchScope&) = delete;
    BranchScope& operator=(const BranchScope&) = delete;

private:
    std::vector<const void*>& branch_;
};

std::string field_segment(const ValueRecord& rec, std::size_t index)
{
    return rec.type ? rec.type->field(index).external_name : std::to_string(index);
}

bool field_omitted(const ValueRecord& rec, std::size_t index)
{
    return rec.type && rec.type->field(index).omitted;
}

std::string type_label(const Value& val)
{
    if (auto* rec = val.get_if<ValueRecord>(); rec && rec->type) {
        return "record " + rec->type->name();
    }
    return std::string{kind_name(val.kind())};
}

} // anonymous namespace

// ============================================================
// Entry points
// ============================================================

void ValueWalker::walk(const Value& old_val, const Value& new_val, FieldPath& path)
{
    if (is_ignored(path)) {
        return;
    }
    if (old_val.type_index() != new_val.type_index()) [[unlikely]] {
        throw IncompatibleTypesError(path.to_string(), type_label(old_val), type_label(new_val));
    }

    std::visit([&](const auto& old_arg) {
        using T = std::decay_t<decltype(old_arg)>;
        const auto& new_arg = std::get<T>(new_val.data);

        if constexpr (std::is_same_v<T, ValueRecord>) {
            if (!same_shape(old_arg.type, new_arg.type)) {
                throw IncompatibleTypesError(path.to_string(), type_label(old_val), type_label(new_val));
            }
            walk_record(old_arg, new_arg, path);
        }
        else if constexpr (std::is_same_v<T, ValueMap>) {
            walk_map(old_arg, new_arg, path);
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            ArrayReconciler{*this}.reconcile(old_arg, new_arg, path);
        }
        else if constexpr (std::is_same_v<T, ValueRef>) {
            walk_ref(old_arg, new_arg, path);
        }
        else if constexpr (std::is_same_v<T, ValueDynamic>) {
            // Compared by (kind, value); a change is one $set, never recursed
            if (!values_equal(*old_arg.value, *new_arg.value)) {
                emit_leaf(*new_arg.value, path);
            }
        }
        else if constexpr (std::is_same_v<T, ValueCallable>) {
            throw UnsupportedLeafTypeError(path.to_string(), kind_name(ValueKind::callable));
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            // Both null, no change
        }
        else {
            if (!values_equal(old_val, new_val)) {
                emit_change(old_val, new_val, path);
            }
        }
    }, old_val.data);
}

void ValueWalker::walk_added(const Value& new_val, FieldPath& path)
{
    walk(zero_of(new_val), new_val, path);
}

void ValueWalker::walk_removed(const Value& old_val, FieldPath& path)
{
    if (is_ignored(path)) {
        return;
    }
    if (old_val.kind() == ValueKind::callable) {
        throw UnsupportedLeafTypeError(path.to_string(), kind_name(ValueKind::callable));
    }
    if (auto* rec = old_val.get_if<ValueRecord>()) {
        for (std::size_t i = 0; i < rec->fields.size(); ++i) {
            if (field_omitted(*rec, i)) {
                continue;
            }
            path.push_back(field_segment(*rec, i));
            walk_removed(*rec->fields[i], path);
            path.pop_back();
        }
        return;
    }
    if (is_zero(old_val)) {
        return;
    }
    emit_unset(path);
}

void ValueWalker::reject_callables(const Value& root)
{
    FieldPath path;
    std::vector<const void*> branch;
    scan_callables(root, path, branch);
}

void ValueWalker::scan_callables(const Value& val, FieldPath& path, std::vector<const void*>& branch)
{
    if (is_ignored(path)) {
        return;
    }

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueCallable>) {
            throw UnsupportedLeafTypeError(path.to_string(), kind_name(ValueKind::callable));
        }
        else if constexpr (std::is_same_v<T, ValueRecord>) {
            for (std::size_t i = 0; i < arg.fields.size(); ++i) {
                if (field_omitted(arg, i)) {
                    continue;
                }
                path.push_back(field_segment(arg, i));
                scan_callables(*arg.fields[i], path, branch);
                path.pop_back();
            }
        }
        else if constexpr (std::is_same_v<T, ValueMap>) {
            std::vector<std::string> keys;
            keys.reserve(arg.size());
            for (const auto& [key, box] : arg) {
                keys.push_back(key);
            }
            std::sort(keys.begin(), keys.end());
            for (const auto& key : keys) {
                path.push_back(key);
                scan_callables(*arg[key], path, branch);
                path.pop_back();
            }
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            for (std::size_t i = 0; i < arg.size(); ++i) {
                path.push_back(ElementIndex{i});
                scan_callables(*arg[i], path, branch);
                path.pop_back();
            }
        }
        else if constexpr (std::is_same_v<T, ValueRef>) {
            // A cycle ends this branch; walk() reports it where it is compared
            if (arg.is_null() ||
                std::find(branch.begin(), branch.end(), arg.identity()) != branch.end()) {
                return;
            }
            branch.push_back(arg.identity());
            BranchScope scope{branch};
            scan_callables(*arg.target, path, branch);
        }
        else if constexpr (std::is_same_v<T, ValueDynamic>) {
            scan_callables(*arg.value, path, branch);
        }
    }, val.data);
}

// ============================================================
// Composite kinds
// ============================================================

void ValueWalker::walk_record(const ValueRecord& old_rec, const ValueRecord& new_rec, FieldPath& path)
{
    const auto count = std::min(old_rec.fields.size(), new_rec.fields.size());
    for (std::size_t i = 0; i < count; ++i) {
        if (field_omitted(old_rec, i)) {
            continue;
        }
        const auto& old_box = old_rec.fields[i];
        const auto& new_box = new_rec.fields[i];
        // Same box: identical subtree - O(1)
        if (&old_box.get() == &new_box.get()) [[likely]] {
            continue;
        }
        path.push_back(field_segment(old_rec, i));
        walk(*old_box, *new_box, path);
        path.pop_back();
    }
}

void ValueWalker::walk_map(const ValueMap& old_map, const ValueMap& new_map, FieldPath& path)
{
    // immer container identity check - O(1)
    if (old_map.impl().root == new_map.impl().root &&
        old_map.impl().size == new_map.impl().size) [[likely]] {
        return;
    }

    std::vector<std::string> keys;
    keys.reserve(old_map.size() + new_map.size());
    for (const auto& [key, box] : old_map) keys.push_back(key);
    for (const auto& [key, box] : new_map) keys.push_back(key);
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    for (const auto& key : keys) {
        const auto* old_box = old_map.find(key);
        const auto* new_box = new_map.find(key);
        if (old_box && new_box && &old_box->get() == &new_box->get()) {
            continue;
        }

        path.push_back(key);
        if (!is_ignored(path)) {
            if (old_box && new_box) {
                walk(**old_box, **new_box, path);
            } else if (new_box) {
                if ((*new_box)->is_record()) {
                    walk_added(**new_box, path);
                } else {
                    emit_leaf(**new_box, path);
                }
            } else {
                // Removed keys are always unset, whatever the zero policy
                emit_unset(path);
            }
        }
        path.pop_back();
    }
}

void ValueWalker::walk_ref(const ValueRef& old_ref, const ValueRef& new_ref, FieldPath& path)
{
    if (old_ref.is_null() && new_ref.is_null()) {
        return;
    }

    if (old_ref.is_null()) {
        const Value& target = *new_ref.target;
        enter(new_branch_, new_ref.identity(), path);
        BranchScope scope{new_branch_};
        if (target.is_record()) {
            walk_added(target, path);
        } else {
            emit_leaf(target, path);
        }
        return;
    }

    if (new_ref.is_null()) {
        const Value& target = *old_ref.target;
        enter(old_branch_, old_ref.identity(), path);
        BranchScope scope{old_branch_};
        if (target.is_record()) {
            walk_removed(target, path);
        } else {
            emit_unset(path);
        }
        return;
    }

    enter(old_branch_, old_ref.identity(), path);
    BranchScope old_scope{old_branch_};
    enter(new_branch_, new_ref.identity(), path);
    BranchScope new_scope{new_branch_};
    walk(*old_ref.target, *new_ref.target, path);
}

void ValueWalker::enter(std::vector<const void*>& branch, const void* identity, const FieldPath& path)
{
    if (std::find(branch.begin(), branch.end(), identity) != branch.end()) {
        throw CyclicStructureError(path.to_string());
    }
    branch.push_back(identity);
}

// ============================================================
// Emission
// ============================================================

void ValueWalker::emit_change(const Value& old_val, const Value& new_val, const FieldPath& path)
{
    if (options_.numeric_optimization && new_val.is_numeric() && !is_zero(new_val)) {
        if (auto delta = choose_increment(old_val, new_val)) {
            emit(Operator::inc, path, std::move(*delta));
            return;
        }
    }
    emit_leaf(new_val, path);
}

void ValueWalker::emit_leaf(const Value& new_val, const FieldPath& path)
{
    if (is_zero(new_val)) {
        switch (options_.zero_value_policy) {
            case ZeroValuePolicy::as_set:
                break;
            case ZeroValuePolicy::as_unset:
                emit_unset(path);
                return;
            case ZeroValuePolicy::ignore:
                return;
        }
    }
    const auto rendered = path.to_string();
    emit(Operator::set, path, detach(new_val, rendered));
}

void ValueWalker::emit_unset(const FieldPath& path)
{
    emit(Operator::unset, path, Value{true});
}

void ValueWalker::emit_replace(const Value& new_sequence, const FieldPath& path)
{
    const auto rendered = path.to_string();
    emit(Operator::set, path, detach(new_sequence, rendered));
}

void ValueWalker::emit_push(const ValueVector& items, const FieldPath& path)
{
    const auto rendered = path.to_string();
    emit(Operator::push, path, detach(Value{items}, rendered));
}

void ValueWalker::emit(Operator op, const FieldPath& path, Value value)
{
    if (is_ignored(path)) {
        return;
    }
    patch_.add_operation(op, path.to_string(), std::move(value));
}

} // namespace detail
} // namespace diffit
