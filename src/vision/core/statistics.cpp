#include "vision/core/statistics.hpp"

#include <cmath>
#include <numeric>

namespace kibitz::vision::core {

double mean(const std::vector<double>& values) {
	if (values.empty()) {
		return 0.0;
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double variance(const std::vector<double>& values) {
	if (values.size() < 2u) {
		return 0.0;
	}

	const double m = mean(values);
	double accum   = 0.0;
	for (double value: values) {
		const double d = value - m;
		accum += d * d;
	}
	return accum / static_cast<double>(values.size());
}

double stddev(const std::vector<double>& values) {
	return std::sqrt(variance(values));
}

} // namespace kibitz::vision::core
