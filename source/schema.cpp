// schema.cpp - RecordType construction and field lookup

#include <diffit/schema.h>

#include <cctype>
#include <stdexcept>

namespace diffit {

RecordType::RecordType(std::string name,
                       std::vector<FieldDescriptor> fields,
                       std::optional<std::size_t> identity_field)
    : name_(std::move(name))
    , fields_(std::move(fields))
    , identity_(identity_field)
{
    lookup_.reserve(fields_.size() * 2);
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        lookup_.emplace(fields_[i].external_name, i);
        lookup_.emplace(fields_[i].name, i);
    }
}

std::optional<std::size_t> RecordType::index_of(std::string_view name) const
{
    auto it = lookup_.find(std::string{name});
    if (it == lookup_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RecordType::same_shape(const RecordType& other) const noexcept
{
    if (this == &other) {
        return true;
    }
    if (name_ != other.name_ || fields_.size() != other.fields_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].external_name != other.fields_[i].external_name ||
            fields_[i].omitted != other.fields_[i].omitted) {
            return false;
        }
    }
    return true;
}

bool same_shape(const RecordTypePtr& a, const RecordTypePtr& b) noexcept
{
    if (a == b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    return a->same_shape(*b);
}

// ============================================================
// RecordTypeBuilder
// ============================================================

RecordTypeBuilder& RecordTypeBuilder::field(std::string name, std::string alias)
{
    FieldDescriptor desc;
    if (alias == "-") {
        desc.external_name = name;
        desc.omitted = true;
    } else if (alias.empty()) {
        desc.external_name = to_snake_case(name);
    } else {
        desc.external_name = std::move(alias);
    }
    desc.name = std::move(name);
    fields_.push_back(std::move(desc));
    return *this;
}

RecordTypeBuilder& RecordTypeBuilder::identity(std::string name, std::string alias)
{
    identity_ = fields_.size();
    return field(std::move(name), std::move(alias));
}

RecordTypePtr RecordTypeBuilder::finish()
{
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        for (std::size_t j = i + 1; j < fields_.size(); ++j) {
            if (fields_[i].external_name == fields_[j].external_name) {
                throw std::invalid_argument("record type '" + name_ + "' declares field '" +
                                            fields_[i].external_name + "' twice");
            }
        }
    }
    if (identity_ && fields_[*identity_].omitted) {
        throw std::invalid_argument("record type '" + name_ + "' uses omitted field '" +
                                    fields_[*identity_].name + "' as identity");
    }
    return std::make_shared<const RecordType>(std::move(name_), std::move(fields_), identity_);
}

std::string to_snake_case(std::string_view name)
{
    std::string result;
    result.reserve(name.size() + 4);

    for (std::size_t i = 0; i < name.size(); ++i) {
        const auto c = static_cast<unsigned char>(name[i]);
        if (std::isupper(c)) {
            if (i > 0) {
                const auto prev = static_cast<unsigned char>(name[i - 1]);
                const bool next_lower = i + 1 < name.size() &&
                                        std::islower(static_cast<unsigned char>(name[i + 1]));
                // "userID" -> "user_id", "HTTPServer" -> "http_server"
                if (std::islower(prev) || std::isdigit(prev) || (std::isupper(prev) && next_lower)) {
                    result += '_';
                }
            }
            result += static_cast<char>(std::tolower(c));
        } else {
            result += static_cast<char>(c);
        }
    }
    return result;
}

} // namespace diffit
