#include "common/random.hpp"

#include <mutex>

namespace bayeskit {

namespace {

std::mutex g_rng_mutex;

std::mt19937& sharedEngine() {
    static std::mt19937 engine{DEFAULT_RANDOM_SEED};
    return engine;
}

} // namespace

void seedRandom(uint32_t seed) {
    std::lock_guard<std::mutex> lock(g_rng_mutex);
    sharedEngine().seed(seed);
}

double uniformReal(double lo, double hi) {
    std::lock_guard<std::mutex> lock(g_rng_mutex);
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(sharedEngine());
}

} // namespace bayeskit
