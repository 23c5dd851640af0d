#pragma once

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/random.hpp"

#include <cstdint>

namespace bayeskit {

// ─── Settings ──────────────────────────────────────────────────
// Library-wide knobs. Defaults match the behaviour of an
// unconfigured process; configure() applies a validated copy.

struct Settings {
    LogLevel log_level = LogLevel::WARN;
    uint32_t random_seed = DEFAULT_RANDOM_SEED;
    double power_law_alpha = 1.0;           // default exponent for powerLawDist
    double normalization_tolerance = 1e-9;  // used by Pmf::isNormalized

    void validateOrThrow() const;
};

/// Validate and apply: sets the log level and reseeds the shared engine.
void configure(const Settings& settings);

/// Settings most recently applied by configure() (defaults otherwise).
const Settings& currentSettings();

} // namespace bayeskit
