#include "cdf/cdf.hpp"

namespace bayeskit {

template class Cdf<std::string>;
template class Cdf<int>;
template class Cdf<double>;

} // namespace bayeskit
