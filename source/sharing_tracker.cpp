// sharing_tracker.cpp - reference address scan for pointer-sharing diagnostics

#include <diffit/sharing_tracker.h>
#include <diffit/log.h>

#include <algorithm>
#include <sstream>

namespace diffit {

std::string_view to_string(DiagnosticKind kind) noexcept
{
    switch (kind) {
        case DiagnosticKind::pointer_sharing: return "pointer_sharing";
    }
    return "unknown";
}

void SharingTracker::scan_root(const Value& root, AddressMap& addresses)
{
    FieldPath path;
    std::vector<const void*> branch;
    scan(root, path, addresses, branch);
}

void SharingTracker::scan(const Value& val, FieldPath& path, AddressMap& addresses,
                          std::vector<const void*>& branch)
{
    if (!path.empty() && ignored_.matches(path)) {
        return;
    }

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueRef>) {
            if (arg.is_null()) {
                return;
            }
            // A cycle ends the scan of this branch; the walker reports it
            if (std::find(branch.begin(), branch.end(), arg.identity()) != branch.end()) {
                return;
            }
            addresses.try_emplace(arg.identity(), path.to_string());
            branch.push_back(arg.identity());
            scan(*arg.target, path, addresses, branch);
            branch.pop_back();
        }
        else if constexpr (std::is_same_v<T, ValueRecord>) {
            for (std::size_t i = 0; i < arg.fields.size(); ++i) {
                if (arg.type && arg.type->field(i).omitted) {
                    continue;
                }
                path.push_back(arg.type ? arg.type->field(i).external_name : std::to_string(i));
                scan(*arg.fields[i], path, addresses, branch);
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
                scan(*arg[key], path, addresses, branch);
                path.pop_back();
            }
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            for (std::size_t i = 0; i < arg.size(); ++i) {
                path.push_back(ElementIndex{i});
                scan(*arg[i], path, addresses, branch);
                path.pop_back();
            }
        }
        else if constexpr (std::is_same_v<T, ValueDynamic>) {
            scan(*arg.value, path, addresses, branch);
        }
    }, val.data);
}

std::vector<Diagnostic> SharingTracker::shared() const
{
    std::vector<Diagnostic> result;
    for (const auto& [address, new_path] : new_addresses_) {
        auto it = old_addresses_.find(address);
        if (it == old_addresses_.end()) {
            continue;
        }
        std::ostringstream message;
        message << "pointer sharing detected: old '" << it->second << "' and new '" << new_path
                << "' share address " << address;

        Diagnostic diagnostic;
        diagnostic.kind = DiagnosticKind::pointer_sharing;
        diagnostic.old_path = it->second;
        diagnostic.new_path = new_path;
        diagnostic.address = address;
        diagnostic.message = message.str();
        result.push_back(std::move(diagnostic));
    }

    std::sort(result.begin(), result.end(), [](const Diagnostic& a, const Diagnostic& b) {
        return a.new_path != b.new_path ? a.new_path < b.new_path : a.old_path < b.old_path;
    });

    for (const auto& diagnostic : result) {
        detail::log_path_event("SharingTracker", diagnostic.new_path, diagnostic.message);
    }
    return result;
}

} // namespace diffit
