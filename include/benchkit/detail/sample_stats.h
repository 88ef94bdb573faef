#pragma once

#include <cstddef>
#include <span>

namespace benchkit::detail {

// Moments of a sample; stddev is the population form.
struct SampleMoments {
    std::size_t count  = 0;
    double      mean   = 0.0;
    double      stddev = 0.0;
    double      min    = 0.0;
    double      max    = 0.0;
};

SampleMoments sample_moments(std::span<const double> samples);
// Midpoint of the two central values for even sizes; 0 when empty.
double median_of(std::span<const double> samples);
// exp(mean(log x)); 0 when empty or when any sample is <= 0.
double geometric_mean(std::span<const double> samples);
// Weighted arithmetic mean; 0 when the weights sum to zero.
double weighted_mean(std::span<const double> values, std::span<const double> weights);

} // namespace benchkit::detail
