#pragma once

#include "pmf/pmf.hpp"

#include <type_traits>

namespace bayeskit {

// ─── Pmf Combinators ───────────────────────────────────────────

/// Distribution of X + Y for independent X ~ a and Y ~ b.
/// Zero-weight entries of either side are ignored, so they never
/// create composite events. Inputs are used as-is (no normalization).
template <typename H>
Pmf<H> addIndependent(const Pmf<H>& a, const Pmf<H>& b) {
    if constexpr (std::is_arithmetic<H>::value) {
        Pmf<H> result;
        for (const auto& x : a) {
            if (!(x.second > 0.0)) continue;
            for (const auto& y : b) {
                if (!(y.second > 0.0)) continue;
                result.incr(static_cast<H>(x.first + y.first), x.second * y.second);
            }
        }
        return result;
    } else {
        (void)a;
        (void)b;
        throw HypothesisTypeError("addIndependent needs numeric hypotheses");
    }
}

/// Distribution of the sum of n independent draws from pmf (n >= 1).
template <typename H>
Pmf<H> sumOfDraws(const Pmf<H>& pmf, int n) {
    if (n < 1) {
        throw RangeError("sumOfDraws needs at least one draw, got " + std::to_string(n));
    }
    Pmf<H> result = pmf.copy();
    for (int i = 1; i < n; i++) {
        result = addIndependent(result, pmf);
    }
    return result;
}

} // namespace bayeskit
