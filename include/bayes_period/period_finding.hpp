#ifndef PERIOD_FINDING_HPP
#define PERIOD_FINDING_HPP

#include "../hypothesis.hpp"
#include "../inference_config.hpp"
#include "../inference_engine.hpp"
#include "../inference_result.hpp"
#include "../measurement.hpp"

#include <cstdint>
#include <vector>

namespace bayes_period {
namespace instances {

/**
 * @brief Parameters of an order-finding problem: the period of x -> base^x mod modulus, observed
 *        through a phase register of @c phase_bits bits.
 */
struct PeriodProblem {
    std::int64_t modulus = 0;
    std::int64_t base = 0;
    int phase_bits = 0;

    PeriodProblem() = default;
    PeriodProblem(std::int64_t n, std::int64_t a, int bits)
      : modulus(n)
      , base(a)
      , phase_bits(bits) {}

    /**
     * @throws std::invalid_argument if modulus < 2, base < 1 or phase_bits is outside [1, 62].
     */
    void validate() const;

    std::int64_t register_size() const { return std::int64_t{ 1 } << phase_bits; }
};

/**
 * @brief Candidate periods {r : r | phi(N), 1 < r < N}, ascending.
 * @throws NoValidHypothesesError if the set is empty.
 */
std::vector<std::int64_t>
candidate_periods(const PeriodProblem &problem);

/**
 * @brief The order-finding identity base^r = 1 (mod modulus).
 */
bool
verify_period(const PeriodProblem &problem, std::int64_t r);

/**
 * @brief Noise-free signal strength of phase register value @p value under period @p r.
 *
 * Gaussian kernel on the wrapped distance to each k/r, k = 0..r-1, combined as
 * 0.7 * max + 0.3 * mean. The width sigma = clamp(0.005 * sqrt(r / 100), 0.005, 0.02) grows with r.
 */
double
period_signal(std::int64_t value, std::int64_t r, int phase_bits);

/**
 * @brief Structured hypothesis space for order finding.
 *
 * Prior per r is (1 / sqrt(r)) * sqrt(|divisors(r)|) * smoothness(r), normalized. Likelihoods mix
 * period_signal with uniform noise over the register. Validation is verify_period.
 *
 * @throws NoValidHypothesesError if candidate_periods is empty.
 * @throws std::invalid_argument if the problem is malformed.
 */
HypothesisSet<std::int64_t>
build_period_hypotheses(const PeriodProblem &problem);

/**
 * @brief Order finding through the Bayesian inference engine.
 */
class PeriodFinder {
  public:
    explicit PeriodFinder(InferenceConfig config = period_finding_defaults());

    /**
     * @brief Consensus inference (Bayesian, frequency, recurrence) over a flat histogram.
     */
    InferenceResult<std::int64_t> find_period(const PeriodProblem &problem,
                                              const MeasurementBatch &measurements,
                                              const NoiseModel &noise) const;

    /**
     * @brief Progressive inference over already collected batches.
     */
    InferenceResult<std::int64_t> find_period_progressive(const PeriodProblem &problem,
                                                          const std::vector<MeasurementBatch> &batches,
                                                          const NoiseModel &noise) const;

    /**
     * @brief Progressive inference over a histogram cut into batches of the configured size.
     */
    InferenceResult<std::int64_t> find_period_progressive(const PeriodProblem &problem,
                                                          const MeasurementBatch &histogram,
                                                          const NoiseModel &noise) const;

    const InferenceConfig &config() const { return engine_.config(); }

  private:
    BayesianInference<std::int64_t> engine_;
};

} // namespace instances
} // namespace bayes_period

#endif // PERIOD_FINDING_HPP
