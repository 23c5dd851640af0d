#include "common/settings.hpp"

#include <cmath>
#include <string>

namespace bayeskit {

namespace {

Settings& activeSettings() {
    static Settings settings;
    return settings;
}

} // namespace

void Settings::validateOrThrow() const {
    if (!std::isfinite(power_law_alpha)) {
        throw ValidationError("Settings: power_law_alpha must be finite");
    }
    if (!(normalization_tolerance > 0.0) || !std::isfinite(normalization_tolerance)) {
        throw ValidationError("Settings: normalization_tolerance must be positive and finite, got " +
                              std::to_string(normalization_tolerance));
    }
    int lvl = static_cast<int>(log_level);
    if (lvl < static_cast<int>(LogLevel::DEBUG) || lvl > static_cast<int>(LogLevel::ERROR)) {
        throw ValidationError("Settings: unknown log level " + std::to_string(lvl));
    }
}

void configure(const Settings& settings) {
    settings.validateOrThrow();
    activeSettings() = settings;
    setLogLevel(settings.log_level);
    seedRandom(settings.random_seed);
    log(LogLevel::DEBUG, std::string("configured: seed=") +
        std::to_string(settings.random_seed) + " level=" + levelTag(settings.log_level));
}

const Settings& currentSettings() {
    return activeSettings();
}

} // namespace bayeskit
