// patch.cpp - Patch accumulation and rendering

#include <diffit/patch.h>
#include <diffit/builders.h>
#include <diffit/serialization.h>

#include <algorithm>
#include <sstream>

namespace diffit {

namespace {

const Patch::Entries empty_entries;

bool references_placeholder(const Patch::Operations& operations, std::size_t placeholder)
{
    const std::string token = "$[" + placeholder_name(placeholder) + "]";
    for (const auto& [op, entries] : operations) {
        for (const auto& [path, value] : entries) {
            if (path.find(token) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

} // anonymous namespace

std::string_view operator_name(Operator op) noexcept
{
    switch (op) {
        case Operator::set:   return "$set";
        case Operator::unset: return "$unset";
        case Operator::push:  return "$push";
        case Operator::inc:   return "$inc";
    }
    return "$unknown";
}

// ============================================================
// ArrayFilter
// ============================================================

ArrayFilter ArrayFilter::at_position(std::size_t placeholder, std::size_t index)
{
    ArrayFilter filter;
    filter.placeholder = placeholder;
    filter.kind = Kind::position;
    filter.index = index;
    return filter;
}

ArrayFilter ArrayFilter::by_identity(std::size_t placeholder, std::string field, Value value)
{
    ArrayFilter filter;
    filter.placeholder = placeholder;
    filter.kind = Kind::identity;
    filter.field = std::move(field);
    filter.value = std::move(value);
    return filter;
}

Value ArrayFilter::to_document() const
{
    if (kind == Kind::position) {
        return MapBuilder()
            .set(identifier() + "._index", static_cast<int64_t>(index))
            .finish();
    }
    return MapBuilder()
        .set(identifier() + "." + field, value)
        .finish();
}

std::string ArrayFilter::to_display_string() const
{
    if (kind == Kind::position) {
        return identifier() + "._index == " + std::to_string(index);
    }
    return identifier() + "." + field + " == " + diffit::to_json(value, true);
}

// ============================================================
// ChangeMetadata
// ============================================================

void ChangeMetadata::record(const std::string& path, Operator op)
{
    auto [it, inserted] = operation_types_.insert_or_assign(path, op);
    if (inserted) {
        fields_changed_.push_back(path);
    }
}

void ChangeMetadata::discard_under(std::string_view path)
{
    std::erase_if(fields_changed_, [&](const std::string& p) { return path_is_under(p, path); });
    std::erase_if(operation_types_, [&](const auto& entry) { return path_is_under(entry.first, path); });
}

Value ChangeMetadata::to_value() const
{
    VectorBuilder fields;
    for (const auto& path : fields_changed_) {
        fields.push_back(path);
    }
    MapBuilder types;
    for (const auto& [path, op] : operation_types_) {
        types.set(path, std::string{operator_name(op)});
    }
    return MapBuilder()
        .set("fieldsChanged", fields.finish())
        .set("operationTypes", types.finish())
        .set("totalChanges", static_cast<int64_t>(total_changes()))
        .finish();
}

std::string ChangeMetadata::to_json(bool compact) const
{
    return diffit::to_json(to_value(), compact);
}

// ============================================================
// Patch
// ============================================================

const Patch::Entries& Patch::operation(Operator op) const
{
    auto it = operations_.find(op);
    return it == operations_.end() ? empty_entries : it->second;
}

void Patch::add_operation(Operator op, const std::string& path, Value value)
{
    for (auto it = operations_.begin(); it != operations_.end();) {
        if (it->first != op && it->second.erase(path) > 0 && it->second.empty()) {
            it = operations_.erase(it);
        } else {
            ++it;
        }
    }
    operations_[op].insert_or_assign(path, std::move(value));
    metadata_.record(path, op);
    ++revision_;
}

void Patch::rewind_placeholders(std::size_t mark) noexcept
{
    if (mark < next_placeholder_) {
        next_placeholder_ = mark;
    }
}

void Patch::add_array_filter(ArrayFilter filter)
{
    auto pos = std::upper_bound(array_filters_.begin(), array_filters_.end(), filter.placeholder,
                                [](std::size_t id, const ArrayFilter& f) { return id < f.placeholder; });
    array_filters_.insert(pos, std::move(filter));
}

void Patch::discard_under(std::string_view path)
{
    for (auto it = operations_.begin(); it != operations_.end();) {
        std::erase_if(it->second, [&](const auto& entry) { return path_is_under(entry.first, path); });
        it = it->second.empty() ? operations_.erase(it) : std::next(it);
    }
    metadata_.discard_under(path);
    std::erase_if(array_filters_, [&](const ArrayFilter& filter) {
        return !references_placeholder(operations_, filter.placeholder);
    });
}

// ============================================================
// Rendering
// ============================================================

std::string Patch::to_display_string() const
{
    if (is_empty()) {
        return "Patch: <empty>";
    }

    std::ostringstream oss;
    oss << "Patch:\n";
    oss << "  Operations:\n";
    for (const auto& [op, entries] : operations_) {
        oss << "    " << operator_name(op) << ":\n";
        for (const auto& [path, value] : entries) {
            oss << "      " << path << ": " << diffit::to_json(value, true) << "\n";
        }
    }
    if (has_array_filters()) {
        oss << "  ArrayFilters:\n";
        for (const auto& filter : array_filters_) {
            oss << "    " << filter.to_display_string() << "\n";
        }
    }
    oss << "  Changes: " << metadata_.total_changes() << " fields modified";
    return oss.str();
}

Value Patch::to_update_document() const
{
    MapBuilder document;
    for (const auto& [op, entries] : operations_) {
        MapBuilder body;
        for (const auto& [path, value] : entries) {
            if (op == Operator::push) {
                body.set(path, MapBuilder().set("$each", value).finish());
            } else {
                body.set(path, value);
            }
        }
        document.set(std::string{operator_name(op)}, body.finish());
    }
    return document.finish();
}

Value Patch::array_filters_document() const
{
    VectorBuilder filters;
    for (const auto& filter : array_filters_) {
        filters.push_back(filter.to_document());
    }
    return filters.finish();
}

std::string Patch::to_json(bool compact) const
{
    MapBuilder root;
    root.set("update", to_update_document());
    if (has_array_filters()) {
        root.set("arrayFilters", array_filters_document());
    }
    root.set("metadata", metadata_.to_value());
    return diffit::to_json(root.finish(), compact);
}

} // namespace diffit
