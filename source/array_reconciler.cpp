// array_reconciler.cpp - Replace / Smart / Append / Merge sequence strategies

#include <diffit/array_reconciler.h>
#include <diffit/detail/value_walker.h>
#include <diffit/log.h>

namespace diffit {

namespace {

bool sequences_equal(const ValueVector& a, const ValueVector& b)
{
    return values_equal(Value{a}, Value{b});
}

bool identities_equal(const Identity& a, const Identity& b)
{
    return a.field == b.field && values_equal(a.value, b.value);
}

ValueVector suffix(const ValueVector& vec, std::size_t from)
{
    auto t = ValueVector{}.transient();
    for (std::size_t i = from; i < vec.size(); ++i) {
        t.push_back(vec[i]);
    }
    return t.persistent();
}

const ValueRecord* as_record(const Value& element)
{
    if (auto* ref = element.get_if<ValueRef>()) {
        return ref->is_null() ? nullptr : ref->target->get_if<ValueRecord>();
    }
    return element.get_if<ValueRecord>();
}

} // anonymous namespace

Identity resolve_identity(const Value& element, const IdentityExtractor& extractor)
{
    if (extractor) {
        if (auto identity = extractor(element)) {
            return std::move(*identity);
        }
    }
    if (auto* rec = as_record(element); rec && rec->type) {
        if (auto index = rec->type->identity_index(); index && *index < rec->fields.size()) {
            return Identity{rec->type->field(*index).external_name, *rec->fields[*index]};
        }
    }
    return Identity{"", element};
}

namespace {

std::size_t count_identity(const ValueVector& vec, const Identity& identity,
                           const IdentityExtractor& extractor)
{
    std::size_t count = 0;
    for (const auto& box : vec) {
        if (identities_equal(resolve_identity(*box, extractor), identity)) {
            ++count;
        }
    }
    return count;
}

} // anonymous namespace

MergePartition merge_partition(const ValueVector& old_vec,
                               const ValueVector& new_vec,
                               const IdentityExtractor& extractor)
{
    MergePartition result;
    result.new_to_old.resize(new_vec.size());

    std::vector<Identity> old_ids;
    old_ids.reserve(old_vec.size());
    for (const auto& box : old_vec) {
        old_ids.push_back(resolve_identity(*box, extractor));
    }

    std::vector<bool> old_taken(old_vec.size(), false);
    for (std::size_t i = 0; i < new_vec.size(); ++i) {
        const auto id = resolve_identity(*new_vec[i], extractor);

        // First unmatched old element with the same identity
        for (std::size_t j = 0; j < old_vec.size(); ++j) {
            if (!old_taken[j] && identities_equal(old_ids[j], id)) {
                old_taken[j] = true;
                result.new_to_old[i] = j;
                break;
            }
        }

        if (!result.new_to_old[i]) {
            result.new_only.push_back(i);
        } else if (values_equal(*old_vec[*result.new_to_old[i]], *new_vec[i])) {
            result.matched_unchanged.push_back(i);
        } else {
            result.matched_changed.push_back(i);
        }
    }

    for (std::size_t j = 0; j < old_vec.size(); ++j) {
        (old_taken[j] ? result.matched_old : result.old_only).push_back(j);
    }
    return result;
}

namespace detail {

void ArrayReconciler::reconcile(const ValueVector& old_vec, const ValueVector& new_vec, FieldPath& path)
{
    if (sequences_equal(old_vec, new_vec)) {
        return;
    }
    placeholder_mark_ = walker_.patch().placeholder_mark();

    switch (walker_.options().array_strategy) {
        case ArrayStrategy::replace:
            replace(new_vec, path);
            break;
        case ArrayStrategy::smart:
            smart(old_vec, new_vec, path);
            break;
        case ArrayStrategy::append:
            append(old_vec, new_vec, path);
            break;
        case ArrayStrategy::merge:
            merge(old_vec, new_vec, path);
            break;
    }
}

void ArrayReconciler::replace(const ValueVector& new_vec, const FieldPath& path)
{
    auto& patch = walker_.patch();
    patch.discard_under(path.to_string());
    patch.rewind_placeholders(placeholder_mark_);
    walker_.emit_replace(Value{new_vec}, path);
}

void ArrayReconciler::fall_back(std::string_view reason, const ValueVector& new_vec, const FieldPath& path)
{
    detail::log_fallback(to_string(walker_.options().array_strategy), path.to_string(), reason);
    replace(new_vec, path);
}

void ArrayReconciler::smart(const ValueVector& old_vec, const ValueVector& new_vec, FieldPath& path)
{
    if (old_vec.size() != new_vec.size()) {
        fall_back("lengths differ", new_vec, path);
        return;
    }

    std::vector<std::size_t> changed;
    for (std::size_t i = 0; i < old_vec.size(); ++i) {
        if (!values_equal(*old_vec[i], *new_vec[i])) {
            changed.push_back(i);
        }
    }

    const double limit = walker_.options().smart_max_changed_ratio * static_cast<double>(old_vec.size());
    if (static_cast<double>(changed.size()) > limit) {
        fall_back("too many changed elements", new_vec, path);
        return;
    }

    auto& patch = walker_.patch();
    for (auto index : changed) {
        const auto placeholder = patch.next_placeholder();
        const auto revision = patch.revision();

        path.push_back(placeholder);
        walker_.walk(*old_vec[index], *new_vec[index], path);
        path.pop_back();

        if (patch.revision() == revision) {
            patch.rewind_placeholders(placeholder.id);
        } else {
            patch.add_array_filter(ArrayFilter::at_position(placeholder.id, index));
        }
    }
}

void ArrayReconciler::append(const ValueVector& old_vec, const ValueVector& new_vec, FieldPath& path)
{
    if (new_vec.size() <= old_vec.size()) {
        fall_back("new sequence is not longer", new_vec, path);
        return;
    }
    for (std::size_t i = 0; i < old_vec.size(); ++i) {
        if (!values_equal(*old_vec[i], *new_vec[i])) {
            fall_back("old sequence is not a prefix", new_vec, path);
            return;
        }
    }
    walker_.emit_push(suffix(new_vec, old_vec.size()), path);
}

void ArrayReconciler::merge(const ValueVector& old_vec, const ValueVector& new_vec, FieldPath& path)
{
    const auto& extractor = walker_.options().identity_extractor;
    const auto partition = merge_partition(old_vec, new_vec, extractor);

    if (!partition.old_only.empty()) {
        fall_back("elements were removed", new_vec, path);
        return;
    }
    if (!partition.order_preserved()) {
        fall_back("matched elements changed order", new_vec, path);
        return;
    }

    // Pure append: additions form a suffix behind unchanged elements
    if (partition.matched_changed.empty() && !partition.new_only.empty()) {
        const auto first_added = new_vec.size() - partition.new_only.size();
        if (partition.new_only.front() != first_added) {
            fall_back("additions are interleaved", new_vec, path);
            return;
        }
        walker_.emit_push(suffix(new_vec, first_added), path);
        return;
    }

    if (!partition.new_only.empty()) {
        fall_back("additions mixed with changes", new_vec, path);
        return;
    }

    // Only matched elements changed: one identity filter each
    std::vector<Identity> identities;
    identities.reserve(partition.matched_changed.size());
    for (auto index : partition.matched_changed) {
        auto identity = resolve_identity(*new_vec[index], extractor);
        if (identity.field.empty()) {
            fall_back("element has no identity field", new_vec, path);
            return;
        }
        identities.push_back(std::move(identity));
    }

    // A filter matches every element carrying its identity
    for (const auto& identity : identities) {
        if (count_identity(old_vec, identity, extractor) != 1 ||
            count_identity(new_vec, identity, extractor) != 1) {
            fall_back("identity is not unique", new_vec, path);
            return;
        }
    }

    auto& patch = walker_.patch();
    for (std::size_t k = 0; k < partition.matched_changed.size(); ++k) {
        const auto index = partition.matched_changed[k];
        const auto placeholder = patch.next_placeholder();
        const auto revision = patch.revision();

        path.push_back(placeholder);
        walker_.walk(*old_vec[*partition.new_to_old[index]], *new_vec[index], path);
        path.pop_back();

        if (patch.revision() == revision) {
            patch.rewind_placeholders(placeholder.id);
        } else {
            auto& identity = identities[k];
            patch.add_array_filter(ArrayFilter::by_identity(
                placeholder.id, std::move(identity.field), detach(identity.value, path.to_string())));
        }
    }
}

} // namespace detail

} // namespace diffit
