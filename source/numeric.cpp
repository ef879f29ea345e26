// numeric.cpp - $inc delta computation

#include <diffit/numeric.h>

#include <cmath>
#include <cstdint>
#include <limits>

namespace diffit {

namespace {

constexpr std::size_t int32_size = 4;
constexpr std::size_t wide_size  = 8;

template <typename T>
bool fits_int32(T v) noexcept
{
    if constexpr (std::is_signed_v<T>) {
        return v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
    } else {
        return v <= static_cast<T>(std::numeric_limits<int32_t>::max());
    }
}

template <typename T>
std::optional<Value> signed_delta(T old_val, T new_val)
{
    using limits = std::numeric_limits<T>;
    // new - old overflows exactly when new lies outside [min + old, max + old]
    if ((old_val < 0 && new_val > limits::max() + old_val) ||
        (old_val > 0 && new_val < limits::min() + old_val)) {
        return std::nullopt;
    }
    return Value{static_cast<T>(new_val - old_val)};
}

template <typename T>
std::optional<Value> unsigned_delta(T old_val, T new_val)
{
    constexpr auto max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (new_val >= old_val) {
        const uint64_t diff = static_cast<uint64_t>(new_val) - static_cast<uint64_t>(old_val);
        if (diff > max) return std::nullopt;
        return Value{static_cast<int64_t>(diff)};
    }
    const uint64_t diff = static_cast<uint64_t>(old_val) - static_cast<uint64_t>(new_val);
    if (diff > max) return std::nullopt;
    return Value{-static_cast<int64_t>(diff)};
}

std::optional<Value> double_delta(double old_val, double new_val)
{
    if (!std::isfinite(old_val) || !std::isfinite(new_val)) {
        return std::nullopt;
    }
    const double delta = new_val - old_val;
    if (!std::isfinite(delta) || old_val + delta != new_val) {
        return std::nullopt;
    }
    if (std::trunc(delta) == delta &&
        delta >= std::numeric_limits<int32_t>::min() &&
        delta <= std::numeric_limits<int32_t>::max()) {
        return Value{static_cast<int32_t>(delta)};
    }
    return Value{delta};
}

} // anonymous namespace

std::size_t encoded_numeric_size(const Value& number) noexcept
{
    return std::visit([](const auto& arg) -> std::size_t {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, int32_t>) {
            return int32_size;
        } else if constexpr (std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, uint32_t> ||
                             std::is_same_v<T, uint64_t>) {
            return fits_int32(arg) ? int32_size : wide_size;
        } else if constexpr (std::is_same_v<T, double>) {
            return wide_size;
        } else {
            return 0;
        }
    }, number.data);
}

std::optional<Value> increment_delta(const Value& old_val, const Value& new_val)
{
    if (old_val.type_index() != new_val.type_index()) {
        return std::nullopt;
    }

    return std::visit([&](const auto& lhs) -> std::optional<Value> {
        using T = std::decay_t<decltype(lhs)>;
        const auto* rhs = new_val.get_if<T>();

        if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
            return signed_delta(lhs, *rhs);
        } else if constexpr (std::is_same_v<T, uint32_t> || std::is_same_v<T, uint64_t>) {
            return unsigned_delta(lhs, *rhs);
        } else if constexpr (std::is_same_v<T, double>) {
            return double_delta(lhs, *rhs);
        } else {
            return std::nullopt;
        }
    }, old_val.data);
}

std::optional<Value> choose_increment(const Value& old_val, const Value& new_val)
{
    auto delta = increment_delta(old_val, new_val);
    if (!delta) {
        return std::nullopt;
    }
    // Ties go to $set
    if (encoded_numeric_size(*delta) < encoded_numeric_size(new_val)) {
        return delta;
    }
    return std::nullopt;
}

} // namespace diffit
