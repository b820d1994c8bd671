#ifndef INFERENCE_CONFIG_HPP
#define INFERENCE_CONFIG_HPP

#include <cstdint>

namespace bayes_period {

/**
 * @brief Blend weights of the three scoring methods in the consensus combiner.
 */
struct ConsensusWeights {
    double bayesian = 0.6;
    double frequency = 0.25;
    double recurrence = 0.15;
};

/**
 * @brief Settings of the repeat-gap analysis over the raw measurement sequence.
 */
struct RecurrenceConfig {
    std::int64_t max_repeats_per_value = 50; // cap on how often one histogram entry is expanded
    std::int64_t window = 500;               // only gaps j - i < window are tallied
    std::int64_t value_tolerance = 3;        // |v_i - v_j| < value_tolerance counts as a repeat
};

/**
 * @brief Options for a single inference call.
 *
 * Defaults match the generic engine; see period_finding_defaults() for the preset used by the
 * period-finding instantiation.
 */
struct InferenceConfig {
    std::int64_t batch_size = 500;      // shots per batch when a flat histogram is partitioned
    int min_batches = 3;                // batches consumed before the stop rule is checked
    double early_stop_confidence = 0.65;
    double early_stop_entropy = 3.0;    // bits
    bool adaptive_thresholds = true;    // derive thresholds from hypothesis metadata
    double update_strength = 10.0;      // multiplier in the conservative update rule
    ConsensusWeights consensus_weights;
    RecurrenceConfig recurrence;
    bool verbose = false;

    /**
     * @brief Checks every field for a usable range.
     * @throws std::invalid_argument on the first offending field.
     */
    void validate() const;
};

/**
 * @brief Preset for integer period finding: smaller batches and a stricter stop rule.
 */
InferenceConfig
period_finding_defaults();

} // namespace bayes_period

#endif // INFERENCE_CONFIG_HPP
