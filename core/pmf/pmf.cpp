#include "pmf/pmf.hpp"

namespace bayeskit {

template class Pmf<std::string>;
template class Pmf<int>;
template class Pmf<double>;

} // namespace bayeskit
