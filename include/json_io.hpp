#ifndef JSON_IO_HPP
#define JSON_IO_HPP

#include "bayes_period/period_extraction.hpp"
#include "bayes_period/phase_estimation.hpp"
#include "bayes_period/search_hypotheses.hpp"
#include "inference_config.hpp"
#include "inference_result.hpp"
#include "measurement.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace bayes_period {

// Readers keep the current value of every absent key and raise std::invalid_argument on a value
// of the wrong type or out of range.

void
to_json(nlohmann::json &j, const Measurement &m);
void
from_json(const nlohmann::json &j, Measurement &m);

void
to_json(nlohmann::json &j, const NoiseModel &noise);
void
from_json(const nlohmann::json &j, NoiseModel &noise);

void
to_json(nlohmann::json &j, const InferenceConfig &config);
void
from_json(const nlohmann::json &j, InferenceConfig &config);

void
to_json(nlohmann::json &j, const StopThresholds &thresholds);

/**
 * @brief Result as JSON; the posterior is written as an array of {candidate, probability}
 *        objects in candidate order.
 */
template<typename T>
void
to_json(nlohmann::json &j, const InferenceResult<T> &result) {
    nlohmann::json posterior = nlohmann::json::array();
    for (const auto &[candidate, probability] : result.posterior) {
        posterior.push_back(nlohmann::json{ { "candidate", candidate }, { "probability", probability } });
    }
    j = nlohmann::json{ { "best", result.best ? nlohmann::json(*result.best) : nlohmann::json(nullptr) },
                        { "confidence", result.confidence },
                        { "entropy", result.entropy },
                        { "posterior", posterior },
                        { "measurements_used", result.measurements_used },
                        { "batches_used", result.batches_used },
                        { "early_stop", result.early_stop },
                        { "consensus", result.consensus ? nlohmann::json(*result.consensus) : nlohmann::json(nullptr) },
                        { "thresholds", result.thresholds },
                        { "degenerate", result.degenerate } };
}

/**
 * @brief Parses JSON text into an InferenceConfig starting from @p base.
 * @throws std::invalid_argument on a syntax error or an invalid value.
 */
InferenceConfig
parse_inference_config(const std::string &text, InferenceConfig base = InferenceConfig());

/**
 * @brief Parses a JSON array of {value, count[, batch]} objects.
 * @throws std::invalid_argument on a syntax error or an invalid entry.
 */
MeasurementBatch
parse_measurements(const std::string &text);

namespace instances {

void
to_json(nlohmann::json &j, const ExtractionConfig &config);
void
from_json(const nlohmann::json &j, ExtractionConfig &config);

void
to_json(nlohmann::json &j, const PeriodExtractionResult &result);
void
to_json(nlohmann::json &j, const PhaseEstimate &estimate);
void
to_json(nlohmann::json &j, const SearchResult &result);

} // namespace instances

} // namespace bayes_period

#endif // JSON_IO_HPP
