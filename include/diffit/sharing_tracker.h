// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sharing_tracker.h
/// @brief Detection of reference targets shared between an old and a new value.
///
/// When the new value reuses an allocation of the old one, mutating that
/// allocation changes both snapshots and the diff sees no change. The tracker
/// records the address and path of every non-null reference reachable from
/// each side and reports the addresses found in both. Only reference targets
/// are tracked; immer containers are immutable and share nodes freely.

#pragma once

#include <diffit/api.h>
#include <diffit/field_path.h>
#include <diffit/value.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace diffit {

enum class DiagnosticKind : std::uint8_t {
    pointer_sharing
};

[[nodiscard]] DIFFIT_API std::string_view to_string(DiagnosticKind kind) noexcept;

/// Advisory finding attached to a DiffResult
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::pointer_sharing;
    std::string old_path;
    std::string new_path;
    const void* address = nullptr;
    std::string message;
};

class DIFFIT_API SharingTracker {
public:
    /// Paths matching `ignored` are not scanned
    explicit SharingTracker(IgnoreSet ignored = {}) : ignored_(std::move(ignored)) {}

    void track_old(const Value& root) { scan_root(root, old_addresses_); }
    void track_new(const Value& root) { scan_root(root, new_addresses_); }

    /// One diagnostic per address reachable from both sides, sorted by new path
    [[nodiscard]] std::vector<Diagnostic> shared() const;

private:
    using AddressMap = std::unordered_map<const void*, std::string>;

    void scan_root(const Value& root, AddressMap& addresses);
    void scan(const Value& val, FieldPath& path, AddressMap& addresses,
              std::vector<const void*>& branch);

    IgnoreSet ignored_;
    AddressMap old_addresses_;
    AddressMap new_addresses_;
};

} // namespace diffit
