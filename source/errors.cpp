// errors.cpp - DiffError hierarchy

#include <diffit/errors.h>

namespace diffit {

namespace {

std::string describe_path(const std::string& path)
{
    return path.empty() ? std::string{"<root>"} : "'" + path + "'";
}

} // anonymous namespace

std::string_view to_string(DiffErrorKind kind) noexcept
{
    switch (kind) {
        case DiffErrorKind::both_absent:           return "both_absent";
        case DiffErrorKind::incompatible_types:    return "incompatible_types";
        case DiffErrorKind::unsupported_leaf_type: return "unsupported_leaf_type";
        case DiffErrorKind::cyclic_structure:      return "cyclic_structure";
    }
    return "unknown";
}

BothAbsentError::BothAbsentError()
    : DiffError(DiffErrorKind::both_absent, "", "both values are absent")
{
}

IncompatibleTypesError::IncompatibleTypesError(std::string path,
                                               std::string_view old_type,
                                               std::string_view new_type)
    : DiffError(DiffErrorKind::incompatible_types, path,
                "incompatible types for comparison at " + describe_path(path) + ": " +
                    std::string(old_type) + " vs " + std::string(new_type))
    , old_type_(old_type)
    , new_type_(new_type)
{
}

UnsupportedLeafTypeError::UnsupportedLeafTypeError(std::string path, std::string_view type_name)
    : DiffError(DiffErrorKind::unsupported_leaf_type, path,
                "no comparison rule for " + std::string(type_name) + " at " + describe_path(path))
{
}

CyclicStructureError::CyclicStructureError(std::string path)
    : DiffError(DiffErrorKind::cyclic_structure, path,
                "cyclic structure detected at " + describe_path(path))
{
}

} // namespace diffit
