#pragma once

#include <cstdint>
#include <random>

namespace bayeskit {

// ─── Shared Random Source ──────────────────────────────────────
// Process-wide engine used by Pmf::sample() when the caller does not
// pass one. Seeded with 42 so runs are reproducible by default.

constexpr uint32_t DEFAULT_RANDOM_SEED = 42;

/// Reseed the shared engine.
void seedRandom(uint32_t seed);

/// Uniform double in [lo, hi) drawn from the shared engine.
double uniformReal(double lo, double hi);

} // namespace bayeskit
