#include "bayes_period/phase_estimation.hpp"
#include "number_theory.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bayes_period {
namespace instances {

namespace {

constexpr std::size_t kMaxRichnessDepth = 10;

void
check_phase_bits(int phase_bits) {
    if (phase_bits < 1 || phase_bits > kMaxPhaseBits) {
        throw std::invalid_argument("Phase register width must lie in [1, " + std::to_string(kMaxPhaseBits) +
                                    "], got " + std::to_string(phase_bits));
    }
}

PhaseEstimate
to_estimate(const InferenceResult<std::int64_t> &result, int phase_bits) {
    PhaseEstimate estimate;
    estimate.quantized = result.best;
    if (result.best) { estimate.phase = std::ldexp(static_cast<double>(*result.best), -phase_bits); }
    estimate.precision_bits = phase_bits;
    estimate.confidence = result.confidence;
    estimate.entropy = result.entropy;
    estimate.measurements_used = result.measurements_used;
    estimate.early_stop = result.early_stop;
    estimate.consensus = result.consensus;
    return estimate;
}

} // namespace

double
PhaseEstimate::error_against(double true_phase) const {
    if (!phase) { return 1.0; }
    return circular_distance(*phase, true_phase);
}

double
PhaseEstimate::achieved_precision(double true_phase) const {
    double error = error_against(true_phase);
    if (error <= 0.0) { return static_cast<double>(precision_bits); }
    return std::min(-std::log2(error), static_cast<double>(precision_bits));
}

double
phase_richness(std::int64_t value, int phase_bits) {
    std::int64_t size = std::int64_t{ 1 } << phase_bits;
    std::int64_t v = ((value % size) + size) % size;
    // first term is the integer part, every further term is one reciprocal step
    std::vector<std::int64_t> terms = number_theory::continued_fraction_terms(v, size, kMaxRichnessDepth + 1);
    std::size_t depth = terms.empty() ? 0 : terms.size() - 1;
    return static_cast<double>(kMaxRichnessDepth - std::min(depth, kMaxRichnessDepth));
}

HypothesisSet<std::int64_t>
build_phase_hypotheses(int phase_bits) {
    check_phase_bits(phase_bits);
    const std::int64_t size = std::int64_t{ 1 } << phase_bits;
    const double uniform = 1.0 / static_cast<double>(size);
    const double sigma = std::max(2.0, 0.03 * static_cast<double>(size));

    HypothesisSet<std::int64_t> hypotheses;
    hypotheses.reserve(static_cast<std::size_t>(size));
    for (std::int64_t k = 0; k < size; ++k) {
        Hypothesis<std::int64_t> h;
        h.candidate = k;
        h.prior = uniform;
        h.likelihood = [k, size, sigma, uniform](const Measurement &m, const NoiseModel &noise) {
            std::int64_t d = std::abs(m.value - k) % size;
            d = std::min(d, size - d);
            return mixture_likelihood(gaussian_kernel(static_cast<double>(d), sigma), noise, uniform);
        };
        h.expected_distribution = [k]() { return std::map<std::int64_t, double>{ { k, 1.0 } }; };
        h.metadata.complexity = static_cast<double>(phase_bits);
        h.metadata.richness = phase_richness(k, phase_bits);
        hypotheses.push_back(std::move(h));
    }
    return hypotheses;
}

InferenceConfig
phase_estimation_defaults() {
    InferenceConfig config;
    config.batch_size = 300;
    config.min_batches = 3;
    config.early_stop_confidence = 0.65;
    config.early_stop_entropy = 3.0;
    return config;
}

PhaseEstimator::PhaseEstimator(InferenceConfig config)
  : engine_(std::move(config)) {}

PhaseEstimate
PhaseEstimator::estimate(int phase_bits, const MeasurementBatch &measurements, const NoiseModel &noise) const {
    HypothesisSet<std::int64_t> hypotheses = build_phase_hypotheses(phase_bits);
    return to_estimate(engine_.infer_with_consensus(measurements, hypotheses, noise), phase_bits);
}

PhaseEstimate
PhaseEstimator::estimate_progressive(int phase_bits,
                                     const std::vector<MeasurementBatch> &batches,
                                     const NoiseModel &noise) const {
    HypothesisSet<std::int64_t> hypotheses = build_phase_hypotheses(phase_bits);
    return to_estimate(engine_.infer_progressive(batches, hypotheses, noise), phase_bits);
}

} // namespace instances
} // namespace bayes_period
