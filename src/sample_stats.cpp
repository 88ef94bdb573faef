#include "benchkit/detail/sample_stats.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace benchkit::detail {

SampleMoments sample_moments(std::span<const double> samples) {
    SampleMoments m;
    m.count = samples.size();
    if (samples.empty())
        return m;

    const auto [lo, hi] = std::minmax_element(samples.begin(), samples.end());
    m.min               = *lo;
    m.max               = *hi;

    double sum = 0.0;
    for (double x : samples)
        sum += x;
    m.mean = sum / static_cast<double>(m.count);

    double squares = 0.0;
    for (double x : samples)
        squares += (x - m.mean) * (x - m.mean);
    m.stddev = std::sqrt(squares / static_cast<double>(m.count));
    return m;
}

double median_of(std::span<const double> samples) {
    if (samples.empty())
        return 0.0;
    std::vector<double> sorted(samples.begin(), samples.end());
    std::sort(sorted.begin(), sorted.end());
    const std::size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1)
        return sorted[mid];
    return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

double geometric_mean(std::span<const double> samples) {
    if (samples.empty())
        return 0.0;
    double log_sum = 0.0;
    for (double x : samples) {
        if (x <= 0.0)
            return 0.0;
        log_sum += std::log(x);
    }
    return std::exp(log_sum / static_cast<double>(samples.size()));
}

double weighted_mean(std::span<const double> values, std::span<const double> weights) {
    double            num = 0.0;
    double            den = 0.0;
    const std::size_t n   = std::min(values.size(), weights.size());
    for (std::size_t i = 0; i < n; ++i) {
        num += values[i] * weights[i];
        den += weights[i];
    }
    if (den == 0.0)
        return 0.0;
    return num / den;
}

} // namespace benchkit::detail
