#include "bayes/bayes_pmf.hpp"

namespace bayeskit {

template class BayesPmf<std::string, std::string>;
template class BayesPmf<int, int>;

} // namespace bayeskit
