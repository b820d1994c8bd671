#include "bayes_period/period_finding.hpp"
#include "number_theory.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace bayes_period {
namespace instances {

namespace nt = number_theory;

void
PeriodProblem::validate() const {
    if (modulus < 2) { throw std::invalid_argument("PeriodProblem modulus must be >= 2, got " + std::to_string(modulus)); }
    if (base < 1) { throw std::invalid_argument("PeriodProblem base must be >= 1, got " + std::to_string(base)); }
    if (phase_bits < 1 || phase_bits > 62) {
        throw std::invalid_argument("PeriodProblem phase_bits must lie in [1, 62], got " + std::to_string(phase_bits));
    }
}

std::vector<std::int64_t>
candidate_periods(const PeriodProblem &problem) {
    problem.validate();
    std::int64_t phi = nt::euler_totient(problem.modulus);
    std::vector<std::int64_t> periods;
    for (std::int64_t r : nt::divisors(phi)) {
        if (r > 1 && r < problem.modulus) { periods.push_back(r); }
    }
    if (periods.empty()) {
        throw NoValidHypothesesError("No divisor r of phi(" + std::to_string(problem.modulus) + ") = " +
                                     std::to_string(phi) + " satisfies 1 < r < N.");
    }
    return periods;
}

bool
verify_period(const PeriodProblem &problem, std::int64_t r) {
    if (r < 1) { return false; }
    return nt::mod_pow(problem.base, r, problem.modulus) == 1;
}

double
period_signal(std::int64_t value, std::int64_t r, int phase_bits) {
    if (r < 1) { throw std::invalid_argument("period_signal: period must be >= 1."); }
    double phase = std::ldexp(static_cast<double>(value), -phase_bits);
    double sigma = std::clamp(0.005 * std::sqrt(static_cast<double>(r) / 100.0), 0.005, 0.02);

    double max_k = 0.0;
    double sum_k = 0.0;
    for (std::int64_t k = 0; k < r; ++k) {
        double expected = static_cast<double>(k) / static_cast<double>(r);
        double kernel = gaussian_kernel(circular_distance(phase, expected), sigma);
        max_k = std::max(max_k, kernel);
        sum_k += kernel;
    }
    return 0.7 * max_k + 0.3 * (sum_k / static_cast<double>(r));
}

HypothesisSet<std::int64_t>
build_period_hypotheses(const PeriodProblem &problem) {
    std::vector<std::int64_t> periods = candidate_periods(problem);

    std::vector<double> priors = structured_prior(periods, [](std::int64_t r) {
        double occam = 1.0 / std::sqrt(static_cast<double>(r));
        double structure = std::sqrt(static_cast<double>(nt::divisors(r).size()));
        return occam * structure * nt::smoothness_score(r);
    });

    const int bits = problem.phase_bits;
    const std::int64_t register_size = problem.register_size();
    const double uniform = 1.0 / static_cast<double>(register_size);

    HypothesisSet<std::int64_t> hypotheses;
    hypotheses.reserve(periods.size());
    for (std::size_t i = 0; i < periods.size(); ++i) {
        const std::int64_t r = periods[i];

        Hypothesis<std::int64_t> h;
        h.candidate = r;
        h.prior = priors[i];
        h.likelihood = [r, bits, uniform](const Measurement &m, const NoiseModel &noise) {
            return mixture_likelihood(period_signal(m.value, r, bits), noise, uniform);
        };
        h.validate = [problem, r]() { return verify_period(problem, r); };
        h.expected_distribution = [r, bits, register_size]() {
            std::map<std::int64_t, double> dist;
            for (std::int64_t k = 0; k < r; ++k) {
                auto value = static_cast<std::int64_t>(
                  std::llround(std::ldexp(static_cast<double>(k) / static_cast<double>(r), bits)));
                dist[value % register_size] += 1.0 / static_cast<double>(r);
            }
            return dist;
        };
        h.recurrence_consistent = [r](std::int64_t gap) { return gap % r == 0; };
        h.metadata.complexity = std::log2(static_cast<double>(r));
        h.metadata.richness = static_cast<double>(nt::divisors(r).size());
        h.metadata.smoothness = nt::smoothness_score(r);
        hypotheses.push_back(std::move(h));
    }
    return hypotheses;
}

PeriodFinder::PeriodFinder(InferenceConfig config)
  : engine_(std::move(config)) {}

InferenceResult<std::int64_t>
PeriodFinder::find_period(const PeriodProblem &problem,
                          const MeasurementBatch &measurements,
                          const NoiseModel &noise) const {
    HypothesisSet<std::int64_t> hypotheses = build_period_hypotheses(problem);
    if (engine_.config().verbose) {
        std::cout << "[PeriodFinder::find_period] N = " << problem.modulus << ", a = " << problem.base << ", "
                  << hypotheses.size() << " candidate periods" << std::endl;
    }
    return engine_.infer_with_consensus(measurements, hypotheses, noise);
}

InferenceResult<std::int64_t>
PeriodFinder::find_period_progressive(const PeriodProblem &problem,
                                      const std::vector<MeasurementBatch> &batches,
                                      const NoiseModel &noise) const {
    HypothesisSet<std::int64_t> hypotheses = build_period_hypotheses(problem);
    return engine_.infer_progressive(batches, hypotheses, noise);
}

InferenceResult<std::int64_t>
PeriodFinder::find_period_progressive(const PeriodProblem &problem,
                                      const MeasurementBatch &histogram,
                                      const NoiseModel &noise) const {
    return find_period_progressive(problem, partition_into_batches(histogram, engine_.config().batch_size), noise);
}

} // namespace instances
} // namespace bayes_period
