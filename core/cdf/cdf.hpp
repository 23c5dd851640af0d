#pragma once

#include "pmf/pmf.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace bayeskit {

// ─── Cdf ───────────────────────────────────────────────────────
// Cumulative distribution built once from a Pmf snapshot.
//
// Events are stably sorted by the comparator (default operator<) and
// paired with running sums of weight. Later changes to the source Pmf
// do not reach an existing Cdf, so a Cdf can be shared for reads.
//
// Probabilities are on the scale of the source weights: a normalized
// source gives queries in [0, 1], an unnormalized one in [0, total].

template <typename H>
class Cdf {
public:
    using Comparator = std::function<bool(const H&, const H&)>;

    /// Throws RangeError for an empty source.
    explicit Cdf(const Pmf<H>& pmf, Comparator less = std::less<H>());

    /// Index of the event that bounds probability.
    /// Upper-bound search for the first cumulative value > probability;
    /// a probability landing exactly on the previous cumulative value
    /// resolves to that previous index.
    size_t floorIndex(double probability) const;

    H percentile(double probability) const;

    /// One event per requested probability, in request order.
    std::vector<H> percentiles(const std::vector<double>& probabilities) const;

    /// Central interval holding percentage% of the mass,
    /// e.g. 90 -> (percentile(5%), percentile(95%)).
    std::pair<H, H> credibleInterval(double percentage = 90.0) const;

    /// Cumulative weight of every event ordered at or before event.
    double cumulativeAt(const H& event) const;

    const std::vector<H>& events() const { return events_; }
    const std::vector<double>& cumulative() const { return cumulative_; }
    size_t size() const { return events_.size(); }
    double totalWeight() const { return cumulative_.back(); }

private:
    std::vector<H> events_;
    std::vector<double> cumulative_;
    Comparator less_;

    void checkProbability(double probability) const;
};

// ─── Implementation ────────────────────────────────────────────

template <typename H>
Cdf<H>::Cdf(const Pmf<H>& pmf, Comparator less) : less_(std::move(less)) {
    if (pmf.empty()) {
        throw RangeError("Cdf: cannot build from an empty distribution");
    }

    std::vector<std::pair<H, double>> items(pmf.begin(), pmf.end());
    std::stable_sort(items.begin(), items.end(),
                     [this](const std::pair<H, double>& a, const std::pair<H, double>& b) {
                         return less_(a.first, b.first);
                     });

    events_.reserve(items.size());
    cumulative_.reserve(items.size());
    double running = 0.0;
    for (auto& item : items) {
        running += item.second;
        events_.push_back(std::move(item.first));
        cumulative_.push_back(running);
    }

    if (shouldLog(LogLevel::DEBUG)) {
        log(LogLevel::DEBUG, "Cdf built over " + std::to_string(events_.size()) +
            " events, total=" + std::to_string(running));
    }
}

template <typename H>
void Cdf<H>::checkProbability(double probability) const {
    // A source normalized from zero mass leaves NaN sums behind.
    if (!std::isfinite(totalWeight())) {
        throw RangeError("Cdf: total weight " + std::to_string(totalWeight()) +
                         " is not finite; no percentile is defined");
    }
    if (std::isnan(probability) || probability < 0.0 || probability > totalWeight()) {
        throw RangeError("Cdf: probability " + std::to_string(probability) +
                         " outside [0, " + std::to_string(totalWeight()) + "]");
    }
}

template <typename H>
size_t Cdf<H>::floorIndex(double probability) const {
    checkProbability(probability);
    auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), probability);
    size_t idx = static_cast<size_t>(std::distance(cumulative_.begin(), it));
    if (idx > 0 && cumulative_[idx - 1] == probability) {
        return idx - 1;
    }
    if (idx >= events_.size()) {
        throw RangeError("Cdf: probability " + std::to_string(probability) +
                         " is past the last cumulative value");
    }
    return idx;
}

template <typename H>
H Cdf<H>::percentile(double probability) const {
    return events_[floorIndex(probability)];
}

template <typename H>
std::vector<H> Cdf<H>::percentiles(const std::vector<double>& probabilities) const {
    std::vector<H> result;
    result.reserve(probabilities.size());
    for (double p : probabilities) {
        result.push_back(percentile(p));
    }
    return result;
}

template <typename H>
std::pair<H, H> Cdf<H>::credibleInterval(double percentage) const {
    if (std::isnan(percentage) || percentage < 0.0 || percentage > 100.0) {
        throw RangeError("Cdf::credibleInterval: percentage " + std::to_string(percentage) +
                         " outside [0, 100]");
    }
    double tail = (100.0 - percentage) / 200.0;
    double total = totalWeight();
    return {percentile(tail * total), percentile((1.0 - tail) * total)};
}

template <typename H>
double Cdf<H>::cumulativeAt(const H& event) const {
    auto it = std::upper_bound(events_.begin(), events_.end(), event, less_);
    size_t idx = static_cast<size_t>(std::distance(events_.begin(), it));
    return idx == 0 ? 0.0 : cumulative_[idx - 1];
}

extern template class Cdf<std::string>;
extern template class Cdf<int>;
extern template class Cdf<double>;

} // namespace bayeskit
