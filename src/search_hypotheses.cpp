#include "bayes_period/search_hypotheses.hpp"

#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace bayes_period {
namespace instances {

namespace {

constexpr double kPi = 3.14159265358979323846;

SearchResult
to_search_result(const InferenceResult<std::int64_t> &result, std::size_t n) {
    SearchResult out;
    out.found = result.best;
    out.confidence = result.confidence;
    out.entropy = result.entropy;
    out.measurements_used = result.measurements_used;
    out.early_stop = result.early_stop;
    out.consensus = result.consensus;
    out.iterations = optimal_iterations(n);
    out.success_probability = success_probability(n, out.iterations);
    return out;
}

} // namespace

void
SearchProblem::validate() const {
    if (database.size() < 2) { throw std::invalid_argument("SearchProblem needs at least two database items."); }
    std::unordered_set<std::int64_t> seen;
    for (std::int64_t item : database) {
        if (!seen.insert(item).second) {
            throw std::invalid_argument("SearchProblem database repeats item " + std::to_string(item));
        }
    }
}

std::int64_t
optimal_iterations(std::size_t database_size) {
    return static_cast<std::int64_t>(std::floor(kPi / 4.0 * std::sqrt(static_cast<double>(database_size))));
}

double
success_probability(std::size_t database_size, std::int64_t iterations) {
    if (database_size == 0) { throw std::invalid_argument("success_probability: empty database."); }
    double theta = std::asin(1.0 / std::sqrt(static_cast<double>(database_size)));
    double amplitude = std::sin((2.0 * static_cast<double>(iterations) + 1.0) * theta);
    return amplitude * amplitude;
}

HypothesisSet<std::int64_t>
build_search_hypotheses(const SearchProblem &problem) {
    problem.validate();
    const std::size_t n = problem.database.size();
    const double hit = success_probability(n, optimal_iterations(n));
    const double miss = (1.0 - hit) / static_cast<double>(n - 1);
    const double uniform = 1.0 / static_cast<double>(n);

    HypothesisSet<std::int64_t> hypotheses;
    hypotheses.reserve(n);
    for (std::int64_t item : problem.database) {
        Hypothesis<std::int64_t> h;
        h.candidate = item;
        h.prior = uniform;
        h.likelihood = [item, hit, miss, uniform](const Measurement &m, const NoiseModel &noise) {
            return mixture_likelihood(m.value == item ? hit : miss, noise, uniform);
        };
        if (problem.oracle) {
            auto oracle = problem.oracle;
            h.validate = [oracle, item]() { return oracle(item); };
        }
        h.expected_distribution = [item, hit]() { return std::map<std::int64_t, double>{ { item, hit } }; };
        hypotheses.push_back(std::move(h));
    }
    return hypotheses;
}

InferenceConfig
search_defaults() {
    InferenceConfig config;
    config.batch_size = 200;
    config.min_batches = 3;
    config.early_stop_confidence = 0.60;
    config.early_stop_entropy = 2.5;
    return config;
}

SearchEstimator::SearchEstimator(InferenceConfig config)
  : engine_(std::move(config)) {}

SearchResult
SearchEstimator::search(const SearchProblem &problem, const MeasurementBatch &measurements, const NoiseModel &noise) const {
    HypothesisSet<std::int64_t> hypotheses = build_search_hypotheses(problem);
    return to_search_result(engine_.infer_with_consensus(measurements, hypotheses, noise), problem.database.size());
}

SearchResult
SearchEstimator::search_progressive(const SearchProblem &problem,
                                    const std::vector<MeasurementBatch> &batches,
                                    const NoiseModel &noise) const {
    HypothesisSet<std::int64_t> hypotheses = build_search_hypotheses(problem);
    return to_search_result(engine_.infer_progressive(batches, hypotheses, noise), problem.database.size());
}

} // namespace instances
} // namespace bayes_period
