#ifndef HYPOTHESIS_HPP
#define HYPOTHESIS_HPP

#include "measurement.hpp"

#include <cmath>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace bayes_period {

/**
 * @brief Raised when the structured candidate set for a problem is empty.
 *
 * The builder never falls back to an unconstrained search; the caller must change the problem
 * parameters instead.
 */
class NoValidHypothesesError : public std::runtime_error {
  public:
    explicit NoValidHypothesesError(const std::string &what)
      : std::runtime_error(what) {}
};

/**
 * @brief Structural descriptors of a candidate, read by the adaptive stop thresholds.
 */
struct HypothesisMetadata {
    double complexity = 1.0; ///< How hard the candidate is to resolve (e.g. log2 of a period).
    double richness = 1.0;   ///< Amount of internal structure (e.g. number of divisors).
    double smoothness = 1.0; ///< Small-prime bias of the candidate.
};

/**
 * @brief One candidate of the hypothesis space together with its scoring closures.
 *
 * Built once per inference call from the problem parameters and read-only afterwards.
 * Only @c likelihood is mandatory; an empty @c validate accepts the candidate, an empty
 * @c expected_distribution or @c recurrence_consistent scores zero in the consensus combiner.
 */
template<typename T>
struct Hypothesis {
    using LikelihoodFn = std::function<double(const Measurement &, const NoiseModel &)>;
    using ValidateFn = std::function<bool()>;
    using DistributionFn = std::function<std::map<std::int64_t, double>()>;
    using RecurrenceFn = std::function<bool(std::int64_t)>;

    T candidate{};
    double prior = 1.0;
    LikelihoodFn likelihood;
    ValidateFn validate;
    DistributionFn expected_distribution;  // outcome value -> expected weight
    RecurrenceFn recurrence_consistent;    // is a repeat gap compatible with this candidate
    HypothesisMetadata metadata;

    bool is_valid() const { return !validate || validate(); }
};

template<typename T>
using HypothesisSet = std::vector<Hypothesis<T>>;

/**
 * @brief Normalized prior weights from an arbitrary non-negative score per candidate.
 *
 * @param candidates The candidate values, in hypothesis order.
 * @param score Callable T -> double, must be finite and >= 0.
 * @return Weights summing to 1, aligned with @p candidates.
 * @throws std::invalid_argument if a score is negative or non-finite, or if all scores are zero.
 */
template<typename T, typename ScoreFn>
std::vector<double>
structured_prior(const std::vector<T> &candidates, ScoreFn score) {
    std::vector<double> weights;
    weights.reserve(candidates.size());
    double total = 0.0;
    for (const auto &c : candidates) {
        double w = score(c);
        if (!std::isfinite(w) || w < 0.0) {
            throw std::invalid_argument("structured_prior: prior score must be finite and non-negative.");
        }
        weights.push_back(w);
        total += w;
    }
    if (!(total > 0.0) || !std::isfinite(total)) {
        throw std::invalid_argument("structured_prior: prior scores must sum to a positive finite value.");
    }
    for (double &w : weights) { w /= total; }
    return weights;
}

/**
 * @brief Noise mixture (1 - e) * signal + e * uniform with e = noise.error_rate.
 */
double
mixture_likelihood(double signal, const NoiseModel &noise, double uniform);

/**
 * @brief Unnormalized Gaussian exp(-d^2 / (2 sigma^2)).
 */
double
gaussian_kernel(double distance, double sigma);

/**
 * @brief Distance between two phases on the unit circle, result in [0, 0.5].
 */
double
circular_distance(double phase_a, double phase_b);

/**
 * @brief Sanity check run before any posterior is built.
 * @throws std::invalid_argument if the set is empty, a likelihood is missing or the prior total
 *         is not a positive finite value.
 */
template<typename T>
void
check_hypotheses(const HypothesisSet<T> &hypotheses) {
    if (hypotheses.empty()) { throw std::invalid_argument("Hypothesis set is empty."); }
    double total = 0.0;
    for (const auto &h : hypotheses) {
        if (!h.likelihood) { throw std::invalid_argument("Every hypothesis needs a likelihood function."); }
        if (!std::isfinite(h.prior) || h.prior < 0.0) {
            throw std::invalid_argument("Hypothesis priors must be finite and non-negative.");
        }
        total += h.prior;
    }
    if (!(total > 0.0) || !std::isfinite(total)) {
        throw std::invalid_argument("Hypothesis priors must sum to a positive finite value.");
    }
}

} // namespace bayes_period

#endif // HYPOTHESIS_HPP
