#include "json_io.hpp"

#include <map>
#include <optional>
#include <stdexcept>

namespace bayes_period {

namespace {

template<typename V>
void
read_key(const nlohmann::json &j, const char *key, V &out) {
    if (!j.contains(key)) { return; }
    try {
        out = j.at(key).get<V>();
    } catch (const nlohmann::json::exception &e) {
        throw std::invalid_argument(std::string("JSON key '") + key + "': " + e.what());
    }
}

template<typename V>
void
read_optional_key(const nlohmann::json &j, const char *key, std::optional<V> &out) {
    if (!j.contains(key)) { return; }
    if (j.at(key).is_null()) {
        out.reset();
        return;
    }
    V value{};
    read_key(j, key, value);
    out = value;
}

void
require_object(const nlohmann::json &j, const char *what) {
    if (!j.is_object()) { throw std::invalid_argument(std::string(what) + " must be a JSON object."); }
}

template<typename V>
nlohmann::json
optional_to_json(const std::optional<V> &value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

void
to_json(nlohmann::json &j, const Measurement &m) {
    j = nlohmann::json{ { "value", m.value }, { "count", m.count } };
    if (m.batch) { j["batch"] = *m.batch; }
}

void
from_json(const nlohmann::json &j, Measurement &m) {
    require_object(j, "Measurement");
    if (!j.contains("value") || !j.contains("count")) {
        throw std::invalid_argument("Measurement needs both 'value' and 'count'.");
    }
    read_key(j, "value", m.value);
    read_key(j, "count", m.count);
    read_optional_key(j, "batch", m.batch);
    if (m.count < 0) { throw std::invalid_argument("Measurement count cannot be negative."); }
}

void
to_json(nlohmann::json &j, const NoiseModel &noise) {
    j = nlohmann::json{ { "error_rate", noise.error_rate },
                        { "coherence_time", noise.coherence_time },
                        { "gate_error_rate", optional_to_json(noise.gate_error_rate) } };
}

void
from_json(const nlohmann::json &j, NoiseModel &noise) {
    require_object(j, "NoiseModel");
    read_key(j, "error_rate", noise.error_rate);
    read_key(j, "coherence_time", noise.coherence_time);
    read_optional_key(j, "gate_error_rate", noise.gate_error_rate);
    noise.validate();
}

void
to_json(nlohmann::json &j, const InferenceConfig &config) {
    j = nlohmann::json{ { "batch_size", config.batch_size },
                        { "min_batches", config.min_batches },
                        { "early_stop_confidence", config.early_stop_confidence },
                        { "early_stop_entropy", config.early_stop_entropy },
                        { "adaptive_thresholds", config.adaptive_thresholds },
                        { "update_strength", config.update_strength },
                        { "consensus_weights",
                          { { "bayesian", config.consensus_weights.bayesian },
                            { "frequency", config.consensus_weights.frequency },
                            { "recurrence", config.consensus_weights.recurrence } } },
                        { "recurrence",
                          { { "max_repeats_per_value", config.recurrence.max_repeats_per_value },
                            { "window", config.recurrence.window },
                            { "value_tolerance", config.recurrence.value_tolerance } } },
                        { "verbose", config.verbose } };
}

void
from_json(const nlohmann::json &j, InferenceConfig &config) {
    require_object(j, "InferenceConfig");
    read_key(j, "batch_size", config.batch_size);
    read_key(j, "min_batches", config.min_batches);
    read_key(j, "early_stop_confidence", config.early_stop_confidence);
    read_key(j, "early_stop_entropy", config.early_stop_entropy);
    read_key(j, "adaptive_thresholds", config.adaptive_thresholds);
    read_key(j, "update_strength", config.update_strength);
    if (j.contains("consensus_weights")) {
        const auto &w = j.at("consensus_weights");
        require_object(w, "consensus_weights");
        read_key(w, "bayesian", config.consensus_weights.bayesian);
        read_key(w, "frequency", config.consensus_weights.frequency);
        read_key(w, "recurrence", config.consensus_weights.recurrence);
    }
    if (j.contains("recurrence")) {
        const auto &r = j.at("recurrence");
        require_object(r, "recurrence");
        read_key(r, "max_repeats_per_value", config.recurrence.max_repeats_per_value);
        read_key(r, "window", config.recurrence.window);
        read_key(r, "value_tolerance", config.recurrence.value_tolerance);
    }
    read_key(j, "verbose", config.verbose);
    config.validate();
}

void
to_json(nlohmann::json &j, const StopThresholds &thresholds) {
    j = nlohmann::json{ { "confidence", thresholds.confidence }, { "entropy", thresholds.entropy } };
}

InferenceConfig
parse_inference_config(const std::string &text, InferenceConfig base) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::invalid_argument(std::string("Invalid InferenceConfig JSON: ") + e.what());
    }
    from_json(parsed, base);
    return base;
}

MeasurementBatch
parse_measurements(const std::string &text) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::invalid_argument(std::string("Invalid measurement JSON: ") + e.what());
    }
    if (!parsed.is_array()) { throw std::invalid_argument("Measurements must be a JSON array."); }

    MeasurementBatch batch;
    batch.reserve(parsed.size());
    for (const auto &entry : parsed) {
        Measurement m;
        from_json(entry, m);
        batch.push_back(m);
    }
    return batch;
}

namespace instances {

void
to_json(nlohmann::json &j, const ExtractionConfig &config) {
    j = nlohmann::json{ { "top_k", config.top_k },
                        { "max_multiple", config.max_multiple },
                        { "phase_tolerance", config.phase_tolerance },
                        { "evidence_threshold", config.evidence_threshold },
                        { "divisor_limit", config.divisor_limit },
                        { "consistency_tolerance", config.consistency_tolerance },
                        { "recurrence_repeats", config.recurrence_repeats } };
}

void
from_json(const nlohmann::json &j, ExtractionConfig &config) {
    require_object(j, "ExtractionConfig");
    read_key(j, "top_k", config.top_k);
    read_key(j, "max_multiple", config.max_multiple);
    read_key(j, "phase_tolerance", config.phase_tolerance);
    read_key(j, "evidence_threshold", config.evidence_threshold);
    read_key(j, "divisor_limit", config.divisor_limit);
    read_key(j, "consistency_tolerance", config.consistency_tolerance);
    read_key(j, "recurrence_repeats", config.recurrence_repeats);
    config.validate();
}

void
to_json(nlohmann::json &j, const PeriodExtractionResult &result) {
    auto votes_to_json = [](const std::map<std::int64_t, double> &votes) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto &[r, v] : votes) { out[std::to_string(r)] = v; }
        return out;
    };
    j = nlohmann::json{ { "period", optional_to_json(result.period) },
                        { "confidence", result.confidence },
                        { "method", to_string(result.method) },
                        { "recurrence_votes", votes_to_json(result.recurrence_votes) },
                        { "continued_fraction_votes", votes_to_json(result.continued_fraction_votes) },
                        { "consistency_votes", votes_to_json(result.consistency_votes) },
                        { "hybrid_scores", votes_to_json(result.hybrid_scores) },
                        { "rejected_candidates", result.rejected_candidates },
                        { "contributing_sources", result.contributing_sources } };
    j["inference"] = result.inference ? nlohmann::json(*result.inference) : nlohmann::json(nullptr);
}

void
to_json(nlohmann::json &j, const PhaseEstimate &estimate) {
    j = nlohmann::json{ { "quantized", optional_to_json(estimate.quantized) },
                        { "phase", optional_to_json(estimate.phase) },
                        { "precision_bits", estimate.precision_bits },
                        { "confidence", estimate.confidence },
                        { "entropy", estimate.entropy },
                        { "measurements_used", estimate.measurements_used },
                        { "early_stop", estimate.early_stop },
                        { "consensus", optional_to_json(estimate.consensus) } };
}

void
to_json(nlohmann::json &j, const SearchResult &result) {
    j = nlohmann::json{ { "found", optional_to_json(result.found) },
                        { "confidence", result.confidence },
                        { "entropy", result.entropy },
                        { "measurements_used", result.measurements_used },
                        { "early_stop", result.early_stop },
                        { "consensus", optional_to_json(result.consensus) },
                        { "iterations", result.iterations },
                        { "success_probability", result.success_probability } };
}

} // namespace instances

} // namespace bayes_period
