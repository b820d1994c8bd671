#ifndef INFERENCE_ENGINE_HPP
#define INFERENCE_ENGINE_HPP

#include "consensus.hpp"
#include "hypothesis.hpp"
#include "inference_config.hpp"
#include "inference_result.hpp"
#include "measurement.hpp"
#include "measurement_source.hpp"
#include "posterior.hpp"
#include "progressive_controller.hpp"

#include <cstdint>
#include <vector>

namespace bayes_period {

/**
 * @brief Bayesian inference over a structured hypothesis space.
 *
 * Every call builds its own posterior from the hypotheses' priors and discards it on return, so
 * calls are independent and reproducible for the same measurement stream. Calls on distinct
 * hypothesis sets may run concurrently.
 *
 * When no measurement is consumed (empty input or all counts zero) the result carries no best
 * candidate and zero confidence; the posterior still reports the normalized priors.
 *
 * @tparam T Candidate type; must be ordered (used as a map key in results).
 */
template<typename T>
class BayesianInference {
  public:
    explicit BayesianInference(InferenceConfig config = InferenceConfig());

    /**
     * @brief Folds all measurements in one update.
     * @throws std::invalid_argument on malformed input (see Posterior).
     */
    InferenceResult<T> infer(const MeasurementBatch &measurements,
                             const HypothesisSet<T> &hypotheses,
                             const NoiseModel &noise) const;

    /**
     * @brief Feeds the batches in order and stops early once the stop rule holds.
     */
    InferenceResult<T> infer_progressive(const std::vector<MeasurementBatch> &batches,
                                         const HypothesisSet<T> &hypotheses,
                                         const NoiseModel &noise) const;

    /**
     * @brief Streaming variant: pulls batches from @p source until it runs dry or the stop rule
     *        holds. The source is read one informative batch ahead of the posterior; batches after
     *        that are not read.
     */
    InferenceResult<T> infer_progressive(MeasurementSource &source,
                                         const HypothesisSet<T> &hypotheses,
                                         const NoiseModel &noise) const;

    /**
     * @brief Blends the Bayesian posterior with frequency and recurrence analysis and reports
     *        the agreement of the three methods in @c consensus.
     */
    InferenceResult<T> infer_with_consensus(const MeasurementBatch &measurements,
                                            const HypothesisSet<T> &hypotheses,
                                            const NoiseModel &noise) const;

    const InferenceConfig &config() const { return config_; }

  private:
    InferenceConfig config_;
};

} // namespace bayes_period

#endif // INFERENCE_ENGINE_HPP
