// PyBind11 bindings for the bayeskit C++ core.
// Exposes Pmf, BayesPmf, Cdf and library settings to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/settings.hpp"
#include "pmf/pmf.hpp"
#include "pmf/pmf_ops.hpp"
#include "bayes/bayes_pmf.hpp"
#include "cdf/cdf.hpp"

#include <string>

namespace py = pybind11;

namespace {

// Shared Pmf surface for every hypothesis type we expose.
template <typename H, typename Class>
void bindPmfMethods(Class& cls) {
    using P = bayeskit::Pmf<H>;
    cls.def("copy", &P::copy)
        .def("set", &P::set)
        .def("incr", &P::incr, py::arg("hypothesis"), py::arg("amount") = 1.0)
        .def("mult", &P::mult)
        .def("prob", &P::prob)
        .def("contains", &P::contains)
        .def("remove", &P::remove)
        .def("clear", &P::clear)
        .def("hypotheses", &P::hypotheses)
        .def("total", &P::total)
        .def("normalizer", &P::normalizer)
        .def("scale", &P::scale)
        .def("normalize", &P::normalize)
        .def("is_normalized", py::overload_cast<double>(&P::isNormalized, py::const_),
             py::arg("tolerance"))
        .def("expectation", &P::expectation)
        .def("mean", &P::mean)
        .def("max_likelihood", &P::maxLikelihood)
        .def("sample", py::overload_cast<>(&P::sample, py::const_))
        .def("uniform_dist", &P::uniformDist)
        .def("power_law_dist",
             py::overload_cast<const std::vector<H>&, double>(&P::powerLawDist),
             py::arg("events"), py::arg("alpha"))
        // Without alpha, the configured Settings::power_law_alpha applies.
        .def("power_law_dist",
             py::overload_cast<const std::vector<H>&>(&P::powerLawDist),
             py::arg("events"))
        .def("__len__", &P::size)
        .def("__contains__", &P::contains)
        .def("__getitem__", &P::prob)
        .def("__setitem__", &P::set)
        .def("items", [](const P& self) {
            std::vector<std::pair<H, double>> out(self.begin(), self.end());
            return out;
        });
}

template <typename H>
void bindCdf(py::module_& m, const char* name) {
    using C = bayeskit::Cdf<H>;
    py::class_<C>(m, name)
        .def(py::init<const bayeskit::Pmf<H>&>(), py::arg("pmf"))
        .def("floor_index", &C::floorIndex)
        .def("percentile", &C::percentile)
        .def("percentiles", &C::percentiles)
        .def("credible_interval", &C::credibleInterval, py::arg("percentage") = 90.0)
        .def("cumulative_at", &C::cumulativeAt)
        .def("events", &C::events)
        .def("cumulative", &C::cumulative)
        .def("total_weight", &C::totalWeight)
        .def("__len__", &C::size);
}

} // namespace

PYBIND11_MODULE(bayeskit_bindings, m) {
    m.doc() = "bayeskit C++ core bindings";

    // ── Errors ──
    auto base_error = py::register_exception<bayeskit::BayesError>(m, "BayesError");
    py::register_exception<bayeskit::NotImplementedError>(m, "NotImplementedError", PyExc_NotImplementedError);
    py::register_exception<bayeskit::HypothesisTypeError>(m, "HypothesisTypeError", PyExc_TypeError);
    py::register_exception<bayeskit::RangeError>(m, "RangeError", PyExc_ValueError);
    py::register_exception<bayeskit::ValidationError>(m, "ValidationError", base_error.ptr());

    // ── Logging / Settings ──
    py::enum_<bayeskit::LogLevel>(m, "LogLevel")
        .value("DEBUG", bayeskit::LogLevel::DEBUG)
        .value("INFO", bayeskit::LogLevel::INFO)
        .value("WARN", bayeskit::LogLevel::WARN)
        .value("ERROR", bayeskit::LogLevel::ERROR);

    py::class_<bayeskit::Settings>(m, "Settings")
        .def(py::init<>())
        .def_readwrite("log_level", &bayeskit::Settings::log_level)
        .def_readwrite("random_seed", &bayeskit::Settings::random_seed)
        .def_readwrite("power_law_alpha", &bayeskit::Settings::power_law_alpha)
        .def_readwrite("normalization_tolerance", &bayeskit::Settings::normalization_tolerance)
        .def("validate", &bayeskit::Settings::validateOrThrow);

    m.def("configure", &bayeskit::configure, py::arg("settings"));
    m.def("set_log_level", &bayeskit::setLogLevel);

    // ── Pmf ──
    py::class_<bayeskit::Pmf<std::string>> pmf_str(m, "Pmf");
    pmf_str.def(py::init<>())
        .def(py::init([](const std::vector<std::pair<std::string, double>>& entries) {
            bayeskit::Pmf<std::string> pmf;
            for (const auto& e : entries) pmf.set(e.first, e.second);
            return pmf;
        }), py::arg("entries"))
        .def_static("from_keys", &bayeskit::Pmf<std::string>::fromKeys,
                    py::arg("keys"), py::arg("weight") = 1.0);
    bindPmfMethods<std::string>(pmf_str);

    py::class_<bayeskit::Pmf<int>> pmf_int(m, "IntPmf");
    pmf_int.def(py::init<>())
        .def(py::init([](const std::vector<std::pair<int, double>>& entries) {
            bayeskit::Pmf<int> pmf;
            for (const auto& e : entries) pmf.set(e.first, e.second);
            return pmf;
        }), py::arg("entries"))
        .def_static("from_keys", &bayeskit::Pmf<int>::fromKeys,
                    py::arg("keys"), py::arg("weight") = 1.0);
    bindPmfMethods<int>(pmf_int);

    m.def("add_independent", &bayeskit::addIndependent<int>, py::arg("a"), py::arg("b"));

    // ── BayesPmf ──
    // The likelihood is a Python callable (data, hypothesis) -> float.
    using StrBayes = bayeskit::BayesPmf<std::string, std::string>;
    py::class_<StrBayes, bayeskit::Pmf<std::string>>(m, "BayesPmf")
        .def(py::init<>())
        .def(py::init<StrBayes::Likelihood>(), py::arg("likelihood"))
        .def(py::init<const bayeskit::Pmf<std::string>&, StrBayes::Likelihood>(),
             py::arg("prior"), py::arg("likelihood"))
        .def("copy", &StrBayes::copy)
        .def("set_likelihood", &StrBayes::setLikelihood)
        .def("has_likelihood", &StrBayes::hasLikelihood)
        .def("likelihood", &StrBayes::likelihood)
        .def("update", &StrBayes::update)
        .def("update_set", &StrBayes::updateSet);

    using IntBayes = bayeskit::BayesPmf<int, int>;
    py::class_<IntBayes, bayeskit::Pmf<int>>(m, "IntBayesPmf")
        .def(py::init<>())
        .def(py::init<IntBayes::Likelihood>(), py::arg("likelihood"))
        .def(py::init<const bayeskit::Pmf<int>&, IntBayes::Likelihood>(),
             py::arg("prior"), py::arg("likelihood"))
        .def("copy", &IntBayes::copy)
        .def("set_likelihood", &IntBayes::setLikelihood)
        .def("has_likelihood", &IntBayes::hasLikelihood)
        .def("likelihood", &IntBayes::likelihood)
        .def("update", &IntBayes::update)
        .def("update_set", &IntBayes::updateSet);

    // ── Cdf ──
    bindCdf<std::string>(m, "Cdf");
    bindCdf<int>(m, "IntCdf");
}
