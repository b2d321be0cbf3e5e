#pragma once

#include <vector>

namespace kibitz::vision::core {

double mean(const std::vector<double>& values);     //!< Arithmetic mean. 0 for an empty input.
double variance(const std::vector<double>& values); //!< Population variance. 0 for fewer than two values.
double stddev(const std::vector<double>& values);   //!< Population standard deviation.

} // namespace kibitz::vision::core
