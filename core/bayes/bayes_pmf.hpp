#pragma once

#include "pmf/pmf.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace bayeskit {

// ─── Bayes Pmf ─────────────────────────────────────────────────
// A Pmf that revises its weights from observed data.
//
// The likelihood P(data | hypothesis) is a mandatory capability. It is
// either injected as a callable or supplied by overriding likelihood()
// in a subclass. Calling update() with neither throws
// NotImplementedError.
//
// update() evaluates the likelihood exactly once per hypothesis, in map
// order, before any weight changes. Likelihoods that mutate external
// state (sampling without replacement) therefore see every hypothesis
// exactly once per call and never see a half-updated posterior.

template <typename H, typename D>
class BayesPmf : public Pmf<H> {
public:
    using Likelihood = std::function<double(const D& data, const H& hypothesis)>;

    BayesPmf() = default;
    explicit BayesPmf(Likelihood likelihood) : likelihood_(std::move(likelihood)) {}
    BayesPmf(std::initializer_list<std::pair<const H, double>> entries, Likelihood likelihood = nullptr)
        : Pmf<H>(entries), likelihood_(std::move(likelihood)) {}
    BayesPmf(const Pmf<H>& prior, Likelihood likelihood)
        : Pmf<H>(prior), likelihood_(std::move(likelihood)) {}

    /// Value copy of this base. Only an injected likelihood travels
    /// with it; a likelihood() override in a subclass does not.
    BayesPmf copy() const { return *this; }

    /// Polymorphic copy. Subclasses that override likelihood() override
    /// this too so the copy keeps their likelihood.
    virtual std::unique_ptr<BayesPmf> clone() const {
        return std::make_unique<BayesPmf>(*this);
    }

    void setLikelihood(Likelihood likelihood) { likelihood_ = std::move(likelihood); }

    /// True if a likelihood callable was injected.
    bool hasLikelihood() const { return static_cast<bool>(likelihood_); }

    /// P(data | hypothesis). Subclasses may override.
    virtual double likelihood(const D& data, const H& hypothesis);

    /// Multiply every weight by its likelihood and renormalize.
    /// If the likelihood throws, the weights are left untouched.
    void update(const D& data);

    /// update() for each observation in order; each posterior is the
    /// next prior.
    void updateSet(const std::vector<D>& dataset);

private:
    Likelihood likelihood_;
};

template <typename H, typename D>
double BayesPmf<H, D>::likelihood(const D& data, const H& hypothesis) {
    if (!likelihood_) {
        throw NotImplementedError("BayesPmf::likelihood has no implementation; "
                                  "inject one or override it in a subclass");
    }
    return likelihood_(data, hypothesis);
}

template <typename H, typename D>
void BayesPmf<H, D>::update(const D& data) {
    std::vector<double> factors;
    factors.reserve(this->weights_.size());
    for (const auto& entry : this->weights_) {
        factors.push_back(likelihood(data, entry.first));
    }

    size_t i = 0;
    for (auto& entry : this->weights_) {
        entry.second *= factors[i++];
    }

    if (shouldLog(LogLevel::DEBUG)) {
        log(LogLevel::DEBUG, "BayesPmf::update over " + std::to_string(factors.size()) +
            " hypotheses, evidence=" + std::to_string(this->total()));
    }
    this->normalize();
}

template <typename H, typename D>
void BayesPmf<H, D>::updateSet(const std::vector<D>& dataset) {
    for (const auto& data : dataset) {
        update(data);
    }
}

extern template class BayesPmf<std::string, std::string>;
extern template class BayesPmf<int, int>;

} // namespace bayeskit
