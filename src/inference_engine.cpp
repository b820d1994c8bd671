#include "inference_engine.hpp"

#include <iostream>
#include <optional>
#include <utility>
#include <vector>

namespace bayes_period {

namespace {

// No evidence consumed: keep the prior view but do not claim a candidate.
template<typename T>
void
clear_best_without_evidence(InferenceResult<T> &result) {
    if (result.measurements_used == 0) {
        result.best.reset();
        result.confidence = 0.0;
    }
}

// Pulls batches until one carries a positive count; std::nullopt once the source runs dry.
std::optional<MeasurementBatch>
next_informative_batch(MeasurementSource &source) {
    while (source.has_next()) {
        MeasurementBatch batch = source.next_batch();
        if (total_count(batch) > 0) { return batch; }
    }
    return std::nullopt;
}

template<typename T>
void
log_result(const char *tag, const InferenceResult<T> &result) {
    std::cout << "[BayesianInference::" << tag << "] used " << result.measurements_used << " measurements in "
              << result.batches_used << " batch(es), confidence = " << result.confidence
              << ", entropy = " << result.entropy << (result.early_stop ? " (early stop)" : "") << std::endl;
}

} // namespace

template<typename T>
BayesianInference<T>::BayesianInference(InferenceConfig config)
  : config_(std::move(config)) {
    config_.validate();
}

template<typename T>
InferenceResult<T>
BayesianInference<T>::infer(const MeasurementBatch &measurements,
                            const HypothesisSet<T> &hypotheses,
                            const NoiseModel &noise) const {
    noise.validate();
    Posterior<T> posterior(hypotheses);
    std::int64_t total = total_count(measurements);
    posterior.update(measurements, noise, config_.update_strength);

    InferenceResult<T> result = make_result(posterior, total, total > 0 ? 1 : 0, false);
    result.thresholds = stop_thresholds_for(hypotheses, config_);
    clear_best_without_evidence(result);

    if (result.degenerate) {
        std::cerr << "Warning: no hypothesis received support; posterior is degenerate." << std::endl;
    }
    if (config_.verbose) { log_result("infer", result); }
    return result;
}

template<typename T>
InferenceResult<T>
BayesianInference<T>::infer_progressive(const std::vector<MeasurementBatch> &batches,
                                        const HypothesisSet<T> &hypotheses,
                                        const NoiseModel &noise) const {
    // remaining[i] = shots in batches i, i+1, ...
    std::vector<std::int64_t> remaining(batches.size() + 1, 0);
    for (std::size_t i = batches.size(); i-- > 0;) { remaining[i] = remaining[i + 1] + total_count(batches[i]); }

    ProgressiveBatchController<T> controller(hypotheses, noise, config_);
    for (std::size_t i = 0; i < batches.size(); ++i) {
        controller.feed(batches[i], remaining[i + 1] > 0);
        if (controller.is_stopped()) { break; }
    }
    controller.finish();

    InferenceResult<T> result = controller.result();
    clear_best_without_evidence(result);
    if (config_.verbose) { log_result("infer_progressive", result); }
    return result;
}

template<typename T>
InferenceResult<T>
BayesianInference<T>::infer_progressive(MeasurementSource &source,
                                        const HypothesisSet<T> &hypotheses,
                                        const NoiseModel &noise) const {
    ProgressiveBatchController<T> controller(hypotheses, noise, config_);
    if (config_.verbose) {
        std::cout << "[BayesianInference::infer_progressive] pulling from " << source.name() << std::endl;
    }
    // One informative batch is held back so that "more available" never counts empty batches.
    std::optional<MeasurementBatch> pending = next_informative_batch(source);
    while (pending) {
        MeasurementBatch batch = std::move(*pending);
        pending = next_informative_batch(source);
        controller.feed(batch, pending.has_value());
        if (controller.is_stopped()) { break; }
    }
    controller.finish();

    InferenceResult<T> result = controller.result();
    clear_best_without_evidence(result);
    if (config_.verbose) { log_result("infer_progressive", result); }
    return result;
}

template<typename T>
InferenceResult<T>
BayesianInference<T>::infer_with_consensus(const MeasurementBatch &measurements,
                                           const HypothesisSet<T> &hypotheses,
                                           const NoiseModel &noise) const {
    noise.validate();
    Posterior<T> posterior(hypotheses);
    std::int64_t total = total_count(measurements);
    posterior.update(measurements, noise, config_.update_strength);

    ConsensusScores scores = consensus_scores(posterior, measurements, config_);
    InferenceResult<T> result = consensus_result(posterior, scores, total);
    result.thresholds = stop_thresholds_for(hypotheses, config_);
    clear_best_without_evidence(result);
    if (result.measurements_used == 0) { result.consensus = 0.0; }

    if (config_.verbose) {
        log_result("infer_with_consensus", result);
        std::cout << "[BayesianInference::infer_with_consensus] agreement = " << result.consensus.value_or(0.0)
                  << std::endl;
    }
    return result;
}

template class BayesianInference<std::int64_t>;

} // namespace bayes_period
