#ifndef INFERENCE_RESULT_HPP
#define INFERENCE_RESULT_HPP

#include "posterior.hpp"

#include <cstdint>
#include <map>
#include <optional>

namespace bayes_period {

/**
 * @brief Confidence and entropy bars of the early-stop rule.
 *
 * A run stops once confidence > @c confidence and entropy < @c entropy.
 */
struct StopThresholds {
    double confidence = 0.65;
    double entropy = 3.0;
};

/**
 * @brief Outcome of one inference call.
 *
 * @c best is empty only when no hypothesis both validates and carries positive mass; in that
 * case confidence is zero. @c consensus is set by the consensus combiner only.
 */
template<typename T>
struct InferenceResult {
    std::optional<T> best;
    double confidence = 0.0;            // posterior mass of best, in [0, 1]
    double entropy = 0.0;               // bits, over the full posterior
    std::map<T, double> posterior;
    std::int64_t measurements_used = 0; // sum of counts consumed
    int batches_used = 0;
    bool early_stop = false;
    std::optional<double> consensus;    // 0, 1/3, 2/3 or 1
    StopThresholds thresholds;          // bars in force during the run
    bool degenerate = false;            // the posterior lost all mass
};

/**
 * @brief Snapshot of a posterior as a result, restricting the best pick to valid hypotheses.
 */
template<typename T>
InferenceResult<T>
make_result(const Posterior<T> &posterior, std::int64_t measurements_used, int batches_used, bool early_stop) {
    InferenceResult<T> result;
    auto best = posterior.best_valid_index();
    if (best) {
        result.best = posterior.hypotheses()[*best].candidate;
        result.confidence = posterior.probabilities()(static_cast<Eigen::Index>(*best));
    }
    result.entropy = posterior.entropy();
    result.posterior = posterior.to_map();
    result.measurements_used = measurements_used;
    result.batches_used = batches_used;
    result.early_stop = early_stop;
    result.degenerate = posterior.is_degenerate();
    return result;
}

} // namespace bayes_period

#endif // INFERENCE_RESULT_HPP
