#pragma once

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/random.hpp"
#include "common/settings.hpp"

#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <map>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace bayeskit {

// ─── Pmf ───────────────────────────────────────────────────────
// Probability mass function: an ordered mapping from hypothesis to a
// non-negative weight. Weights only sum to one right after normalize().
//
// H needs a strict weak ordering (operator<). Iteration follows that
// order, so every pass over the map is deterministic.

template <typename H>
class Pmf {
public:
    using Hypothesis = H;
    using Map = std::map<H, double>;
    using const_iterator = typename Map::const_iterator;

    Pmf() = default;
    Pmf(std::initializer_list<std::pair<const H, double>> entries) : weights_(entries) {}
    virtual ~Pmf() = default;

    Pmf(const Pmf&) = default;
    Pmf& operator=(const Pmf&) = default;
    Pmf(Pmf&&) = default;
    Pmf& operator=(Pmf&&) = default;

    /// Build a map giving every key the same weight.
    static Pmf fromKeys(const std::vector<H>& keys, double weight = 1.0);

    /// Independent copy; mutating either side leaves the other alone.
    Pmf copy() const { return *this; }

    // ── Entries ──
    void set(const H& hypothesis, double weight) { weights_[hypothesis] = weight; }
    void incr(const H& hypothesis, double amount = 1.0) { weights_[hypothesis] += amount; }

    /// Multiply one weight. Absent hypotheses are left absent.
    void mult(const H& hypothesis, double factor);

    /// Weight of a hypothesis, 0 if absent.
    double prob(const H& hypothesis) const;

    bool contains(const H& hypothesis) const { return weights_.count(hypothesis) > 0; }
    bool remove(const H& hypothesis) { return weights_.erase(hypothesis) > 0; }
    size_t size() const { return weights_.size(); }
    bool empty() const { return weights_.empty(); }
    void clear() { weights_.clear(); }

    const_iterator begin() const { return weights_.begin(); }
    const_iterator end() const { return weights_.end(); }

    /// Hypotheses in map order.
    std::vector<H> hypotheses() const;

    // ── Mass ──

    /// Sum of all weights; 0 when empty.
    double total() const;

    /// 1/total(), or +inf when total() is 0.
    double normalizer() const;

    void scale(double factor);

    /// scale(normalizer()). An all-zero map turns into all-NaN.
    void normalize();

    bool isNormalized(double tolerance) const;
    bool isNormalized() const { return isNormalized(currentSettings().normalization_tolerance); }

    /// Sum of hypothesis * weight over the current weights.
    /// Throws HypothesisTypeError for non-arithmetic hypotheses.
    double expectation() const;
    double mean() const { return expectation(); }

    /// Hypothesis carrying the largest weight (first in order on ties).
    H maxLikelihood() const;

    // ── Sampling ──

    /// Draw one hypothesis with probability weight/total() using rng.
    template <typename Rng>
    H sample(Rng& rng) const;

    /// Same as sample(rng) but draws from the shared engine.
    H sample() const;

    // ── Priors ──

    /// Replace contents with equal weights over events, normalized.
    void uniformDist(const std::vector<H>& events);

    /// Replace contents with event^(-alpha) per event, normalized.
    void powerLawDist(const std::vector<H>& events, double alpha);
    void powerLawDist(const std::vector<H>& events) {
        powerLawDist(events, currentSettings().power_law_alpha);
    }

protected:
    Map weights_;

private:
    H pickAt(double threshold) const;
};

// ─── Implementation ────────────────────────────────────────────

template <typename H>
Pmf<H> Pmf<H>::fromKeys(const std::vector<H>& keys, double weight) {
    Pmf<H> pmf;
    for (const auto& key : keys) {
        pmf.weights_[key] = weight;
    }
    return pmf;
}

template <typename H>
void Pmf<H>::mult(const H& hypothesis, double factor) {
    auto it = weights_.find(hypothesis);
    if (it != weights_.end()) {
        it->second *= factor;
    }
}

template <typename H>
double Pmf<H>::prob(const H& hypothesis) const {
    auto it = weights_.find(hypothesis);
    return it != weights_.end() ? it->second : 0.0;
}

template <typename H>
std::vector<H> Pmf<H>::hypotheses() const {
    std::vector<H> result;
    result.reserve(weights_.size());
    for (const auto& entry : weights_) {
        result.push_back(entry.first);
    }
    return result;
}

template <typename H>
double Pmf<H>::total() const {
    double sum = 0.0;
    for (const auto& entry : weights_) {
        sum += entry.second;
    }
    return sum;
}

template <typename H>
double Pmf<H>::normalizer() const {
    double t = total();
    return t > 0.0 ? 1.0 / t : std::numeric_limits<double>::infinity();
}

template <typename H>
void Pmf<H>::scale(double factor) {
    for (auto& entry : weights_) {
        entry.second *= factor;
    }
}

template <typename H>
void Pmf<H>::normalize() {
    double factor = normalizer();
    if (std::isinf(factor) && !weights_.empty()) {
        // 0 * inf: every weight becomes NaN
        log(LogLevel::WARN, "Pmf::normalize without positive mass over " +
            std::to_string(weights_.size()) + " hypotheses");
    }
    scale(factor);
}

template <typename H>
bool Pmf<H>::isNormalized(double tolerance) const {
    return std::abs(total() - 1.0) <= tolerance;
}

template <typename H>
double Pmf<H>::expectation() const {
    if constexpr (std::is_arithmetic<H>::value) {
        double sum = 0.0;
        for (const auto& entry : weights_) {
            sum += static_cast<double>(entry.first) * entry.second;
        }
        return sum;
    } else {
        throw HypothesisTypeError("Can't compute expectation of non-numeric hypotheses");
    }
}

template <typename H>
H Pmf<H>::maxLikelihood() const {
    if (weights_.empty()) {
        throw RangeError("Pmf::maxLikelihood on an empty distribution");
    }
    auto best = weights_.begin();
    for (auto it = weights_.begin(); it != weights_.end(); ++it) {
        if (it->second > best->second) best = it;
    }
    return best->first;
}

template <typename H>
H Pmf<H>::pickAt(double threshold) const {
    double running = 0.0;
    const H* last_positive = nullptr;
    for (const auto& entry : weights_) {
        running += entry.second;
        if (entry.second > 0.0) {
            last_positive = &entry.first;
            if (running >= threshold) return entry.first;
        }
    }
    // Rounding can leave the running sum a hair below threshold.
    return *last_positive;
}

template <typename H>
template <typename Rng>
H Pmf<H>::sample(Rng& rng) const {
    double t = total();
    if (!(t > 0.0) || !std::isfinite(t)) {
        throw RangeError("Pmf::sample needs positive finite total mass, got " + std::to_string(t));
    }
    std::uniform_real_distribution<double> dist(0.0, t);
    return pickAt(dist(rng));
}

template <typename H>
H Pmf<H>::sample() const {
    double t = total();
    if (!(t > 0.0) || !std::isfinite(t)) {
        throw RangeError("Pmf::sample needs positive finite total mass, got " + std::to_string(t));
    }
    return pickAt(uniformReal(0.0, t));
}

template <typename H>
void Pmf<H>::uniformDist(const std::vector<H>& events) {
    weights_.clear();
    for (const auto& event : events) {
        weights_[event] = 1.0;
    }
    normalize();
}

template <typename H>
void Pmf<H>::powerLawDist(const std::vector<H>& events, double alpha) {
    if constexpr (std::is_arithmetic<H>::value) {
        for (const auto& event : events) {
            if (!(event > 0)) {
                throw RangeError("Pmf::powerLawDist needs positive events, got " +
                                 std::to_string(event));
            }
        }
        weights_.clear();
        for (const auto& event : events) {
            weights_[event] = std::pow(static_cast<double>(event), -alpha);
        }
        normalize();
    } else {
        (void)events;
        (void)alpha;
        throw HypothesisTypeError("Pmf::powerLawDist needs numeric hypotheses");
    }
}

extern template class Pmf<std::string>;
extern template class Pmf<int>;
extern template class Pmf<double>;

} // namespace bayeskit
