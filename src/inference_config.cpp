#include "inference_config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace bayes_period {

namespace {

void
require_probability(double value, const char *field) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw std::invalid_argument(std::string("InferenceConfig.") + field + " must lie in [0, 1], got " +
                                    std::to_string(value));
    }
}

} // namespace

void
InferenceConfig::validate() const {
    if (batch_size <= 0) {
        throw std::invalid_argument("InferenceConfig.batch_size must be positive, got " + std::to_string(batch_size));
    }
    if (min_batches < 1) {
        throw std::invalid_argument("InferenceConfig.min_batches must be >= 1, got " + std::to_string(min_batches));
    }
    require_probability(early_stop_confidence, "early_stop_confidence");
    if (!std::isfinite(early_stop_entropy) || early_stop_entropy < 0.0) {
        throw std::invalid_argument("InferenceConfig.early_stop_entropy must be a non-negative number.");
    }
    if (!std::isfinite(update_strength) || update_strength <= 0.0) {
        throw std::invalid_argument("InferenceConfig.update_strength must be positive.");
    }

    const ConsensusWeights &w = consensus_weights;
    if (!std::isfinite(w.bayesian) || !std::isfinite(w.frequency) || !std::isfinite(w.recurrence) ||
        w.bayesian < 0.0 || w.frequency < 0.0 || w.recurrence < 0.0) {
        throw std::invalid_argument("InferenceConfig.consensus_weights must be finite and non-negative.");
    }
    if (w.bayesian + w.frequency + w.recurrence <= 0.0) {
        throw std::invalid_argument("InferenceConfig.consensus_weights cannot all be zero.");
    }

    if (recurrence.max_repeats_per_value < 1 || recurrence.window < 1 || recurrence.value_tolerance < 1) {
        throw std::invalid_argument("InferenceConfig.recurrence settings must all be >= 1.");
    }
}

InferenceConfig
period_finding_defaults() {
    InferenceConfig config;
    config.batch_size = 400;
    config.min_batches = 3;
    config.early_stop_confidence = 0.70;
    config.early_stop_entropy = 2.8;
    return config;
}

} // namespace bayes_period
