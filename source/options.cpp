// options.cpp - DiffOptions validation and identity helpers

#include <diffit/options.h>

#include <stdexcept>

namespace diffit {

std::string_view to_string(ArrayStrategy strategy) noexcept
{
    switch (strategy) {
        case ArrayStrategy::replace: return "replace";
        case ArrayStrategy::smart:   return "smart";
        case ArrayStrategy::append:  return "append";
        case ArrayStrategy::merge:   return "merge";
    }
    return "unknown";
}

std::string_view to_string(ZeroValuePolicy policy) noexcept
{
    switch (policy) {
        case ZeroValuePolicy::as_set:   return "as_set";
        case ZeroValuePolicy::as_unset: return "as_unset";
        case ZeroValuePolicy::ignore:   return "ignore";
    }
    return "unknown";
}

void DiffOptions::validate() const
{
    // Written so that NaN is rejected too
    if (!(smart_max_changed_ratio >= 0.0 && smart_max_changed_ratio <= 1.0)) {
        throw std::invalid_argument("smart_max_changed_ratio must be within [0, 1], got " +
                                    std::to_string(smart_max_changed_ratio));
    }
}

IdentityExtractor identity_field(std::string name)
{
    return [name = std::move(name)](const Value& element) -> std::optional<Identity> {
        const Value* target = &element;
        if (auto* ref = element.get_if<ValueRef>()) {
            if (ref->is_null()) return std::nullopt;
            target = ref->target.get();
        }
        if (auto* map = target->get_if<ValueMap>()) {
            auto* found = map->find(name);
            if (!found) return std::nullopt;
            return Identity{name, found->get()};
        }
        auto* record = target->get_if<ValueRecord>();
        if (!record || !record->type) {
            return std::nullopt;
        }
        auto index = record->type->index_of(name);
        if (!index || *index >= record->fields.size()) {
            return std::nullopt;
        }
        return Identity{record->type->field(*index).external_name, *record->fields[*index]};
    };
}

} // namespace diffit
