#ifndef PROGRESSIVE_CONTROLLER_HPP
#define PROGRESSIVE_CONTROLLER_HPP

#include "hypothesis.hpp"
#include "inference_config.hpp"
#include "inference_result.hpp"
#include "measurement.hpp"
#include "posterior.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace bayes_period {

enum class ControllerState { Collecting, StoppedEarly, StoppedExhausted };

/**
 * @brief Stop bars derived from average hypothesis metadata.
 *
 * confidence = clamp(0.6 - 0.08 * complexity + 0.04 * richness, 0.45, 0.85)
 * entropy    = clamp(3.5 + 0.4 * complexity, 2.0, 6.0)
 */
StopThresholds
adaptive_stop_thresholds(double avg_complexity, double avg_richness);

/**
 * @brief Thresholds in force for a run: adaptive ones when enabled, the fixed config bars
 *        otherwise.
 */
template<typename T>
StopThresholds
stop_thresholds_for(const HypothesisSet<T> &hypotheses, const InferenceConfig &config) {
    if (!config.adaptive_thresholds || hypotheses.empty()) {
        return StopThresholds{ config.early_stop_confidence, config.early_stop_entropy };
    }
    double complexity = 0.0;
    double richness = 0.0;
    for (const auto &h : hypotheses) {
        complexity += h.metadata.complexity;
        richness += h.metadata.richness;
    }
    double n = static_cast<double>(hypotheses.size());
    return adaptive_stop_thresholds(complexity / n, richness / n);
}

/**
 * @brief Feeds batches one at a time into a posterior and decides when to stop.
 *
 * State machine Collecting -> StoppedEarly | StoppedExhausted. The stop rule is checked only at
 * batch boundaries, only after min_batches batches, and only while more batches are available,
 * so an early stop always leaves measurements unread.
 */
template<typename T>
class ProgressiveBatchController {
  public:
    ProgressiveBatchController(const HypothesisSet<T> &hypotheses,
                               const NoiseModel &noise,
                               const InferenceConfig &config)
      : noise_(noise)
      , config_(config)
      , posterior_(hypotheses)
      , thresholds_(stop_thresholds_for(hypotheses, config)) {
        noise_.validate();
        config_.validate();
        if (config_.verbose) {
            std::cout << "[ProgressiveBatchController] " << hypotheses.size()
                      << " hypotheses, stop when confidence > " << thresholds_.confidence << " and entropy < "
                      << thresholds_.entropy << std::endl;
        }
    }

    /**
     * @brief Consumes one batch.
     *
     * A batch whose counts sum to zero carries no evidence: it neither counts toward min_batches nor
     * triggers the stop check.
     *
     * @param batch The next batch in stream order.
     * @param more_available Whether positive-count measurements remain after this batch. Passing
     *        false moves the controller to StoppedExhausted.
     * @return The state after the batch.
     * @throws std::logic_error if the controller has already stopped.
     */
    ControllerState feed(const MeasurementBatch &batch, bool more_available = true) {
        if (state_ != ControllerState::Collecting) {
            throw std::logic_error("ProgressiveBatchController: cannot feed a batch after stopping.");
        }
        std::int64_t count = total_count(batch);
        if (count == 0) {
            if (!more_available) { state_ = ControllerState::StoppedExhausted; }
            return state_;
        }
        measurements_used_ += count;
        ++batches_used_;
        bool was_degenerate = posterior_.is_degenerate();
        posterior_.update(batch, noise_, config_.update_strength);

        if (posterior_.is_degenerate() && !was_degenerate) {
            std::cerr << "Warning: posterior lost all mass after batch " << batches_used_ << "." << std::endl;
        }

        if (batches_used_ >= config_.min_batches && more_available) {
            auto best = posterior_.best_valid_index();
            double confidence = best ? posterior_.probabilities()(static_cast<Eigen::Index>(*best)) : 0.0;
            double entropy = posterior_.entropy();
            if (config_.verbose) {
                std::cout << "[ProgressiveBatchController::feed] batch " << batches_used_
                          << ": confidence = " << confidence << ", entropy = " << entropy << std::endl;
            }
            if (confidence > thresholds_.confidence && entropy < thresholds_.entropy) {
                state_ = ControllerState::StoppedEarly;
                return state_;
            }
        }
        if (!more_available) { state_ = ControllerState::StoppedExhausted; }
        return state_;
    }

    /**
     * @brief Marks the stream as exhausted. No-op once stopped.
     */
    void finish() {
        if (state_ == ControllerState::Collecting) { state_ = ControllerState::StoppedExhausted; }
    }

    InferenceResult<T> result() const {
        InferenceResult<T> r = make_result(posterior_, measurements_used_, batches_used_,
                                           state_ == ControllerState::StoppedEarly);
        r.thresholds = thresholds_;
        return r;
    }

    ControllerState state() const { return state_; }
    bool is_stopped() const { return state_ != ControllerState::Collecting; }
    const StopThresholds &thresholds() const { return thresholds_; }
    const Posterior<T> &posterior() const { return posterior_; }
    std::int64_t measurements_used() const { return measurements_used_; }
    int batches_used() const { return batches_used_; }

  private:
    NoiseModel noise_;
    InferenceConfig config_;
    Posterior<T> posterior_;
    StopThresholds thresholds_;
    ControllerState state_ = ControllerState::Collecting;
    std::int64_t measurements_used_ = 0;
    int batches_used_ = 0;
};

} // namespace bayes_period

#endif // PROGRESSIVE_CONTROLLER_HPP
