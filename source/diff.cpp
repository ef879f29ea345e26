// diff.cpp - diff() entry point

#include <diffit/diff.h>
#include <diffit/detail/value_walker.h>
#include <diffit/log.h>

namespace diffit {

DiffResult diff(const Operand& old_operand, const Operand& new_operand, const DiffOptions& options)
{
    options.validate();

    if (old_operand.is_absent() && new_operand.is_absent()) {
        detail::log_event("diff", "both operands are absent");
        throw BothAbsentError();
    }

    const IgnoreSet ignored{options.ignore_fields};
    DiffResult result;

    try {
        if (options.detect_pointer_sharing) {
            SharingTracker tracker{ignored};
            if (!old_operand.is_absent()) tracker.track_old(old_operand.value());
            if (!new_operand.is_absent()) tracker.track_new(new_operand.value());
            result.diagnostics = tracker.shared();
        }

        detail::ValueWalker walker{result.patch, options, ignored};
        if (!old_operand.is_absent()) walker.reject_callables(old_operand.value());
        if (!new_operand.is_absent()) walker.reject_callables(new_operand.value());

        FieldPath path;
        if (old_operand.is_absent()) {
            walker.walk_added(new_operand.value(), path);
        } else if (new_operand.is_absent()) {
            walker.walk_removed(old_operand.value(), path);
        } else {
            walker.walk(old_operand.value(), new_operand.value(), path);
        }
    } catch (const DiffError& e) {
        detail::log_path_event("diff", e.path(), e.what());
        throw;
    }

    return result;
}

bool has_any_difference(const Value& old_val, const Value& new_val)
{
    return !values_equal(old_val, new_val);
}

} // namespace diffit
