#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace bayeskit {

// ─── Error Types ───────────────────────────────────────────────
// All library failures derive from BayesError so callers can catch
// by category. Every error is synchronous and deterministic.

class BayesError : public std::runtime_error {
public:
    explicit BayesError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

/// Thrown when update() runs without a likelihood capability.
class NotImplementedError : public BayesError {
public:
    explicit NotImplementedError(std::string msg) : BayesError(std::move(msg)) {}
};

/// Thrown when an operation needs arithmetic hypotheses and gets something else.
class HypothesisTypeError : public BayesError {
public:
    explicit HypothesisTypeError(std::string msg) : BayesError(std::move(msg)) {}
};

/// Thrown for queries with no well-defined answer (empty source,
/// probability outside the cumulative range, no positive weight).
class RangeError : public BayesError {
public:
    explicit RangeError(std::string msg) : BayesError(std::move(msg)) {}
};

/// Thrown when settings fail validation.
class ValidationError : public BayesError {
public:
    explicit ValidationError(std::string msg) : BayesError(std::move(msg)) {}
};

} // namespace bayeskit
