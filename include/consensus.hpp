#ifndef CONSENSUS_HPP
#define CONSENSUS_HPP

#include "hypothesis.hpp"
#include "inference_config.hpp"
#include "inference_result.hpp"
#include "measurement.hpp"
#include "posterior.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <cstdint>
#include <map>
#include <optional>

namespace bayes_period {

/**
 * @brief Per-hypothesis scores of each method plus their normalized blend.
 *
 * All vectors are indexed by hypothesis position. A method with no support anywhere is all zeros.
 */
struct ConsensusScores {
    Eigen::VectorXd bayesian;
    Eigen::VectorXd frequency;
    Eigen::VectorXd recurrence;
    Eigen::VectorXd combined;
};

/**
 * @brief Tallies repeat gaps in the raw measurement sequence.
 *
 * The sequence repeats each measurement's value min(count, max_repeats_per_value) times in batch
 * order. Every pair i < j with j - i < window and |v_i - v_j| < value_tolerance adds one to the
 * tally of gap j - i.
 *
 * @return gap -> number of repeats at that gap.
 */
std::map<std::int64_t, std::int64_t>
recurrence_gaps(const MeasurementBatch &measurements, const RecurrenceConfig &config);

/**
 * @brief Model-free score sum_v sqrt(expected(v) * observed(v)) per hypothesis, normalized.
 *
 * Hypotheses without an expected distribution score zero.
 */
template<typename T>
Eigen::VectorXd
frequency_scores(const MeasurementBatch &measurements, const HypothesisSet<T> &hypotheses) {
    Eigen::VectorXd scores = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(hypotheses.size()));
    for (std::size_t i = 0; i < hypotheses.size(); ++i) {
        const auto &h = hypotheses[i];
        if (!h.expected_distribution) { continue; }
        std::map<std::int64_t, double> expected = h.expected_distribution();
        double score = 0.0;
        for (const auto &m : measurements) {
            auto it = expected.find(m.value);
            if (it == expected.end() || it->second <= 0.0 || m.count <= 0) { continue; }
            score += std::sqrt(it->second * static_cast<double>(m.count));
        }
        scores(static_cast<Eigen::Index>(i)) = score;
    }
    normalize_in_place(scores);
    return scores;
}

/**
 * @brief Sums, per hypothesis, the repeat tallies of every gap it declares consistent.
 *
 * Hypotheses without a recurrence predicate score zero. The result is normalized.
 */
template<typename T>
Eigen::VectorXd
recurrence_scores(const std::map<std::int64_t, std::int64_t> &gaps, const HypothesisSet<T> &hypotheses) {
    Eigen::VectorXd scores = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(hypotheses.size()));
    for (std::size_t i = 0; i < hypotheses.size(); ++i) {
        const auto &h = hypotheses[i];
        if (!h.recurrence_consistent) { continue; }
        double score = 0.0;
        for (const auto &[gap, tally] : gaps) {
            if (h.recurrence_consistent(gap)) { score += static_cast<double>(tally); }
        }
        scores(static_cast<Eigen::Index>(i)) = score;
    }
    normalize_in_place(scores);
    return scores;
}

/**
 * @brief Runs the frequency and recurrence methods next to an updated Bayesian posterior and
 *        blends the three with the configured weights.
 */
template<typename T>
ConsensusScores
consensus_scores(const Posterior<T> &bayesian, const MeasurementBatch &measurements, const InferenceConfig &config) {
    const auto &hypotheses = bayesian.hypotheses();
    const ConsensusWeights &w = config.consensus_weights;

    ConsensusScores scores;
    scores.bayesian = bayesian.probabilities();
    scores.frequency = frequency_scores(measurements, hypotheses);
    scores.recurrence = recurrence_scores(recurrence_gaps(measurements, config.recurrence), hypotheses);
    scores.combined = w.bayesian * scores.bayesian + w.frequency * scores.frequency + w.recurrence * scores.recurrence;
    normalize_in_place(scores.combined);
    return scores;
}

/**
 * @brief Result over the blended distribution, with the agreement score of the three methods.
 *
 * The best pick is restricted to hypotheses that validate. The consensus score counts how many of
 * the three per-method top picks coincide with it.
 */
template<typename T>
InferenceResult<T>
consensus_result(const Posterior<T> &bayesian, const ConsensusScores &scores, std::int64_t measurements_used) {
    const auto &hypotheses = bayesian.hypotheses();

    InferenceResult<T> result;
    std::optional<std::size_t> best;
    double max_prob = 0.0;
    for (std::size_t i = 0; i < hypotheses.size(); ++i) {
        double p = scores.combined(static_cast<Eigen::Index>(i));
        if (bayesian.is_valid(i) && p > max_prob) {
            max_prob = p;
            best = i;
        }
    }

    int agreement = 0;
    if (best) {
        result.best = hypotheses[*best].candidate;
        result.confidence = max_prob;
        for (const Eigen::VectorXd *method : { &scores.bayesian, &scores.frequency, &scores.recurrence }) {
            auto top = argmax_positive(*method);
            if (top && static_cast<std::size_t>(*top) == *best) { ++agreement; }
        }
    }
    result.consensus = agreement / 3.0;
    result.entropy = shannon_entropy(scores.combined);
    for (std::size_t i = 0; i < hypotheses.size(); ++i) {
        result.posterior[hypotheses[i].candidate] += scores.combined(static_cast<Eigen::Index>(i));
    }
    result.measurements_used = measurements_used;
    result.batches_used = measurements_used > 0 ? 1 : 0;
    result.degenerate = !(scores.combined.sum() > 0.0);
    return result;
}

} // namespace bayes_period

#endif // CONSENSUS_HPP
