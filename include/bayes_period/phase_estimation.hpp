#ifndef PHASE_ESTIMATION_HPP
#define PHASE_ESTIMATION_HPP

#include "../hypothesis.hpp"
#include "../inference_config.hpp"
#include "../inference_engine.hpp"
#include "../inference_result.hpp"
#include "../measurement.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace bayes_period {
namespace instances {

/**
 * @brief Largest register width the phase hypothesis space is built for (2^16 candidates).
 */
constexpr int kMaxPhaseBits = 16;

/**
 * @brief Estimate of an eigenphase theta in [0, 1), quantized to 2^bits levels.
 */
struct PhaseEstimate {
    std::optional<std::int64_t> quantized; // register value k, theta ~ k / 2^bits
    std::optional<double> phase;
    int precision_bits = 0;
    double confidence = 0.0;
    double entropy = 0.0;
    std::int64_t measurements_used = 0;
    bool early_stop = false;
    std::optional<double> consensus;

    /**
     * @brief Wrapped distance to a reference phase, or 1 when there is no estimate.
     */
    double error_against(double true_phase) const;

    /**
     * @brief Number of correct bits, -log2(error), capped at precision_bits.
     */
    double achieved_precision(double true_phase) const;
};

/**
 * @brief Structural richness of k / 2^bits: 10 minus the number of continued-fraction steps
 *        (capped at 10), so simple fractions score high.
 */
double
phase_richness(std::int64_t value, int phase_bits);

/**
 * @brief One hypothesis per register value.
 *
 * Uniform prior; phase_richness only feeds the metadata. Likelihood mixes a Gaussian in wrapped register distance
 * (sigma = max(2, 0.03 * 2^bits)) with uniform noise 1 / 2^bits.
 *
 * @throws std::invalid_argument if phase_bits is outside [1, kMaxPhaseBits].
 */
HypothesisSet<std::int64_t>
build_phase_hypotheses(int phase_bits);

/**
 * @brief Preset for phase estimation: batches of 300 shots, stop at 0.65 / 3.0 bits.
 */
InferenceConfig
phase_estimation_defaults();

class PhaseEstimator {
  public:
    explicit PhaseEstimator(InferenceConfig config = phase_estimation_defaults());

    PhaseEstimate estimate(int phase_bits, const MeasurementBatch &measurements, const NoiseModel &noise) const;

    PhaseEstimate estimate_progressive(int phase_bits,
                                       const std::vector<MeasurementBatch> &batches,
                                       const NoiseModel &noise) const;

  private:
    BayesianInference<std::int64_t> engine_;
};

} // namespace instances
} // namespace bayes_period

#endif // PHASE_ESTIMATION_HPP
