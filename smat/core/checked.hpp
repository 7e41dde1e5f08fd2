#pragma once

#include "smat/core/macros.hpp"
#include "smat/core/type.hpp"

#include <limits>
#include <type_traits>

// =============================================================================
// FILE: smat/core/checked.hpp
// BRIEF: Overflow-aware integer arithmetic for matrix kernels
//
// Every helper computes a op b into `out` and returns false only when the
// exact result is not representable AND the policy is Reject. Under Saturate
// the result is clamped to the Value range; under Wrap it is the two's
// complement result modulo 2^N.
// =============================================================================

namespace smat {

enum class OverflowPolicy {
    Reject,     // throw OverflowError (default)
    Saturate,   // clamp to numeric_limits<Value>::min/max
    Wrap        // modular two's complement
};

[[nodiscard]] constexpr auto overflow_policy_name(OverflowPolicy p) noexcept -> const char* {
    switch (p) {
        case OverflowPolicy::Reject:   return "reject";
        case OverflowPolicy::Saturate: return "saturate";
        case OverflowPolicy::Wrap:     return "wrap";
    }
    return "unknown";
}

namespace checked {

namespace detail {

using UValue = std::make_unsigned_t<Value>;

constexpr Value VALUE_MAX = std::numeric_limits<Value>::max();
constexpr Value VALUE_MIN = std::numeric_limits<Value>::min();

SMAT_FORCE_INLINE constexpr Value wrap(UValue u) noexcept {
    return static_cast<Value>(u);
}

SMAT_FORCE_INLINE bool resolve(bool overflowed, Value saturated, OverflowPolicy policy,
                               Value& out) noexcept {
    if (SMAT_LIKELY(!overflowed)) {
        return true;
    }
    switch (policy) {
        case OverflowPolicy::Saturate:
            out = saturated;
            return true;
        case OverflowPolicy::Wrap:
            // out already holds the wrapped result
            return true;
        case OverflowPolicy::Reject:
            break;
    }
    return false;
}

} // namespace detail

[[nodiscard]] SMAT_FORCE_INLINE bool add(Value a, Value b, OverflowPolicy policy, Value& out) noexcept {
#if SMAT_HAS_BUILTIN_OVERFLOW
    const bool of = SMAT_ADD_OVERFLOW(a, b, &out);
#else
    const bool of = (b > 0 && a > detail::VALUE_MAX - b) || (b < 0 && a < detail::VALUE_MIN - b);
    out = detail::wrap(static_cast<detail::UValue>(a) + static_cast<detail::UValue>(b));
#endif
    return detail::resolve(of, b > 0 ? detail::VALUE_MAX : detail::VALUE_MIN, policy, out);
}

[[nodiscard]] SMAT_FORCE_INLINE bool sub(Value a, Value b, OverflowPolicy policy, Value& out) noexcept {
#if SMAT_HAS_BUILTIN_OVERFLOW
    const bool of = SMAT_SUB_OVERFLOW(a, b, &out);
#else
    const bool of = (b < 0 && a > detail::VALUE_MAX + b) || (b > 0 && a < detail::VALUE_MIN + b);
    out = detail::wrap(static_cast<detail::UValue>(a) - static_cast<detail::UValue>(b));
#endif
    return detail::resolve(of, b < 0 ? detail::VALUE_MAX : detail::VALUE_MIN, policy, out);
}

[[nodiscard]] SMAT_FORCE_INLINE bool mul(Value a, Value b, OverflowPolicy policy, Value& out) noexcept {
#if SMAT_HAS_BUILTIN_OVERFLOW
    const bool of = SMAT_MUL_OVERFLOW(a, b, &out);
#else
    bool of = false;
    if (a != 0 && b != 0) {
        if (a > 0) {
            of = (b > 0) ? (a > detail::VALUE_MAX / b) : (b < detail::VALUE_MIN / a);
        } else {
            of = (b > 0) ? (a < detail::VALUE_MIN / b) : (b < detail::VALUE_MAX / a);
        }
    }
    out = detail::wrap(static_cast<detail::UValue>(a) * static_cast<detail::UValue>(b));
#endif
    const bool negative = (a < 0) != (b < 0);
    return detail::resolve(of, negative ? detail::VALUE_MIN : detail::VALUE_MAX, policy, out);
}

} // namespace checked

} // namespace smat
