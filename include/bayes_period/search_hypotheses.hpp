#ifndef SEARCH_HYPOTHESES_HPP
#define SEARCH_HYPOTHESES_HPP

#include "../hypothesis.hpp"
#include "../inference_config.hpp"
#include "../inference_engine.hpp"
#include "../inference_result.hpp"
#include "../measurement.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace bayes_period {
namespace instances {

/**
 * @brief Unstructured search over a database of distinct items, observed after amplitude
 *        amplification.
 */
struct SearchProblem {
    std::vector<std::int64_t> database;
    std::function<bool(std::int64_t)> oracle; // optional check of a found item

    /**
     * @throws std::invalid_argument if the database has fewer than two items or repeats one.
     */
    void validate() const;
};

/**
 * @brief floor(pi / 4 * sqrt(N)) amplification rounds.
 */
std::int64_t
optimal_iterations(std::size_t database_size);

/**
 * @brief sin^2((2k + 1) theta) with theta = asin(1 / sqrt(N)).
 */
double
success_probability(std::size_t database_size, std::int64_t iterations);

/**
 * @brief One hypothesis "item x is marked" per database entry.
 *
 * Under hypothesis x an outcome equals x with the success probability and any other item with the
 * remaining mass spread evenly; that signal is mixed with uniform noise 1 / N. Validation is the
 * oracle when one is given.
 */
HypothesisSet<std::int64_t>
build_search_hypotheses(const SearchProblem &problem);

/**
 * @brief Preset for search: batches of 200 shots, stop at 0.60 / 2.5 bits.
 */
InferenceConfig
search_defaults();

struct SearchResult {
    std::optional<std::int64_t> found;
    double confidence = 0.0;
    double entropy = 0.0;
    std::int64_t measurements_used = 0;
    bool early_stop = false;
    std::optional<double> consensus;
    std::int64_t iterations = 0;
    double success_probability = 0.0;
};

class SearchEstimator {
  public:
    explicit SearchEstimator(InferenceConfig config = search_defaults());

    SearchResult search(const SearchProblem &problem, const MeasurementBatch &measurements, const NoiseModel &noise) const;

    SearchResult search_progressive(const SearchProblem &problem,
                                    const std::vector<MeasurementBatch> &batches,
                                    const NoiseModel &noise) const;

  private:
    BayesianInference<std::int64_t> engine_;
};

} // namespace instances
} // namespace bayes_period

#endif // SEARCH_HYPOTHESES_HPP
