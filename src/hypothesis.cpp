#include "hypothesis.hpp"

#include <algorithm>

namespace bayes_period {

double
mixture_likelihood(double signal, const NoiseModel &noise, double uniform) {
    return (1.0 - noise.error_rate) * signal + noise.error_rate * uniform;
}

double
gaussian_kernel(double distance, double sigma) {
    if (!(sigma > 0.0)) { throw std::invalid_argument("gaussian_kernel: sigma must be positive."); }
    return std::exp(-(distance * distance) / (2.0 * sigma * sigma));
}

double
circular_distance(double phase_a, double phase_b) {
    double d = std::fabs(phase_a - phase_b);
    d = d - std::floor(d);
    return std::min(d, 1.0 - d);
}

} // namespace bayes_period
